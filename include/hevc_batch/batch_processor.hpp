/**
 * @file batch_processor.hpp
 * @brief Sequential, resumable batch encoding
 *
 * @details The BatchProcessor class orchestrates one encode at a time:
 *
 *          - Offers the saved checkpoint to the operator at startup
 *
 *          - Probes each file and applies the skip rules
 *
 *          - Runs the encoder through JobDriver and JobRunner
 *
 *          - Commits, keeps or discards the output depending on how the job
 *            ended, and halts the batch on pause or quit
 *
 * @note Configuration via environment variables (see Config):
 *
 *       - HEVC_TARGET_CODEC: codec that marks a file as already done
 *
 *       - HEVC_OUTPUT_SUFFIX: naming of the temporary output
 *
 *       - HEVC_STATE_FILE: checkpoint location
 *
 * @attention SKIP RULES (a file being resumed is never skipped):
 *
 *   - Source already in the target codec
 *
 *   - Output from an earlier run exists and is in the target codec
 */

#ifndef HEVC_BATCH_BATCH_PROCESSOR_HPP
#define HEVC_BATCH_BATCH_PROCESSOR_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "checkpoint_store.hpp"
#include "ffmpeg_executor.hpp"
#include "job_runner.hpp"
#include "media_probe.hpp"
#include "types.hpp"

namespace hevc_batch {

/**
 * @struct BatchOptions
 * @brief Everything the orchestrator needs besides the file list.
 */
struct BatchOptions {
  std::string work_dir = ".";                          //< Directory of inputs
  std::string state_file = ".encode_h265_resume.json"; //< Relative to work_dir
  std::string target_codec = "hevc";
  std::string output_suffix = "_h265_mp3.mp4";
  std::string list_output; //< Non-empty enables list mode
  bool dry_run = false;
  EncoderSettings encoder;
  RunnerOptions runner;

  /// Options from the environment (see Config); modes stay off
  static BatchOptions from_config();
};

/**
 * @enum ResumeAnswer
 * @brief Operator's reply to the startup resume question.
 */
enum class ResumeAnswer {
  Resume,   //< Continue from the checkpoint
  Decline,  //< Discard the checkpoint, start the file fresh
  NoAnswer, //< No input available; keep the checkpoint, do not resume now
};

using ResumePrompt = std::function<ResumeAnswer(const Checkpoint &)>;

/**
 * @brief Ask "Resume from frame N? (Y/n)" on stdin/stdout.
 * @note Anything but "n" resumes; end of input is NoAnswer.
 */
ResumeAnswer prompt_on_stdin(const Checkpoint &checkpoint);

/**
 * @struct BatchSummary
 * @brief Counters and outcome of one process() call.
 */
struct BatchSummary {
  int encoded = 0;
  int skipped = 0;
  int failed = 0;
  bool halted = false;                             //< Stopped by pause/quit
  ControlState halt_reason = ControlState::Running; //< Pause or quit state
  std::vector<std::string> eligible;               //< Input paths selected
  std::vector<std::string> failed_files;           //< Names of failed inputs
  long processing_time_us = 0;                     //< Sum of encode times
};

/**
 * @class BatchProcessor
 * @brief Runs the eligible files of a directory one after another.
 */
class BatchProcessor {
public:
  /**
   * @brief Construct a batch processor.
   * @param options Directory, naming, modes and encoder settings
   * @param probe Metadata source
   * @param prompt Startup resume question
   */
  BatchProcessor(BatchOptions options, MediaProbe &probe,
                 ResumePrompt prompt = prompt_on_stdin);

  /**
   * @brief Process the candidate files in order.
   *
   * @param files File names inside options.work_dir, already sorted
   * @return Number of failures (0 = all succeeded or nothing to do)
   */
  int process(const std::vector<std::string> &files);

  /// Observer for absolute frames of the running job
  void set_progress_callback(JobRunner::ProgressCallback cb) {
    on_progress_ = std::move(cb);
  }

  const BatchSummary &summary() const { return summary_; }

  CheckpointStore &checkpoints() { return store_; }

private:
  BatchOptions options_;
  MediaProbe &probe_;
  ResumePrompt prompt_;
  CheckpointStore store_;
  JobRunner::ProgressCallback on_progress_;
  BatchSummary summary_;

  /**
   * @brief Load the checkpoint and ask whether to use it.
   * @param files Candidate names; a checkpoint for another name is ignored
   * @return The checkpoint to resume, if any
   */
  std::optional<Checkpoint> resolve_resume(const std::vector<std::string> &files);

  /**
   * @brief Decide whether a probed file should be encoded.
   * @param name File name (for logs)
   * @param info Probed source metadata
   * @param output_path Temporary output path
   * @param resuming This file is the checkpoint's file
   */
  bool is_eligible(const std::string &name, const VideoInfo &info,
                   const std::string &output_path, bool resuming);

  /**
   * @brief Run one job and act on its terminal state.
   * @return true if the batch should continue with the next file
   */
  bool run_job(const Job &job, const std::string &name, int64_t start_frame);

  /// Clear the checkpoint unless it belongs to a different file
  void release_checkpoint(const std::string &name);

  /// Best-effort removal of a partial output; errors are logged only
  void remove_output(const std::string &path);

  /// Write absolute paths of eligible files (list mode)
  void write_file_list();

  /**
   * @brief Print final batch summary.
   * @param wall_clock_sec Actual elapsed wall-clock time in seconds
   */
  void print_batch_summary(double wall_clock_sec);
};

} // namespace hevc_batch

#endif // HEVC_BATCH_BATCH_PROCESSOR_HPP
