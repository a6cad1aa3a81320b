/**
 * @file job_runner.hpp
 * @brief The per-job control loop: encoder output and keystrokes multiplexed
 *
 * @details JobRunner::run() drives one started encoder to a terminal
 *          ControlState:
 *
 *          1. Check the cancellation token
 *
 *          2. poll() the encoder output and the keystroke fd with a bounded
 *             timeout
 *
 *          3. Dispatch a keystroke (one byte) to the state machine first
 *
 *          4. Feed encoder output to the ProgressParser, update
 *             last_frame_seen and redraw the progress bar
 *
 *          5. Reap the encoder if it exited
 *
 * @attention THREAD MODEL:
 *            - Single thread. The only asynchronous writer is the signal
 *              handler, which touches nothing but the cancellation token.
 *
 *            - Raw terminal mode is held by a scoped guard around the loop.
 *
 *            - On pause/quit the loop returns right after the checkpoint
 *              write and the SIGTERM request; the exit status is collected
 *              later by JobDriver::wait().
 */

#ifndef HEVC_BATCH_JOB_RUNNER_HPP
#define HEVC_BATCH_JOB_RUNNER_HPP

#include <cstdint>
#include <functional>
#include <string>

#include "checkpoint_store.hpp"
#include "control_state.hpp"
#include "ffmpeg_executor.hpp"
#include "progress_parser.hpp"
#include "types.hpp"

namespace hevc_batch {

/**
 * @struct RunnerOptions
 * @brief Inputs of the control loop that are not part of the job.
 */
struct RunnerOptions {
  int key_fd = -1;           //< Keystroke source (-1 = none)
  int poll_timeout_ms = 100; //< Upper bound of one wait, clamped to 1..1000
  bool show_progress = true; //< Draw the progress bar on stdout
};

/**
 * @class JobRunner
 * @brief Runs the multiplexing loop for one job at a time.
 */
class JobRunner {
public:
  /// Called with the absolute frame after every progress event
  using ProgressCallback = std::function<void(int64_t)>;

  JobRunner(CheckpointStore &store, RunnerOptions options);

  /**
   * @brief Set an observer for progress events.
   */
  void set_progress_callback(ProgressCallback cb) {
    on_progress_ = std::move(cb);
  }

  /**
   * @brief Drive a started encoder until a terminal state.
   *
   * @param job The job being encoded
   * @param checkpoint_id File identifier written on pause
   * @param start_frame Absolute frame the encoder was seeked to
   * @param driver Driver whose process is running
   * @return Terminal state, exit status if already collected, final frame
   */
  JobOutcome run(const Job &job, const std::string &checkpoint_id,
                 int64_t start_frame, JobDriver &driver);

  /// Options in effect (wait bound already clamped)
  const RunnerOptions &options() const { return options_; }

  /// State of the last (or current) run
  const RunState &run_state() const { return state_; }

private:
  CheckpointStore &store_;
  RunnerOptions options_;
  ProgressCallback on_progress_;
  RunState state_;

  /// Apply a new absolute frame and redraw
  void on_frame(int64_t relative, const Job &job);

  /// Side effects of a pause/quit transition
  void act_on_stop(ControlState state, const std::string &checkpoint_id,
                   JobDriver &driver);

  /// Read whatever is left in the pipe after the encoder exited
  void drain_output(int fd, ProgressParser &parser, const Job &job);

  bool drew_progress_ = false;
};

} // namespace hevc_batch

#endif // HEVC_BATCH_JOB_RUNNER_HPP
