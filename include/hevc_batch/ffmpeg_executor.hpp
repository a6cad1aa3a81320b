/**
 * @file ffmpeg_executor.hpp
 * @brief Encoder command construction and the per-job encoder process
 *
 * @details Separate module for running one FFmpeg transcode:
 *
 *          - build_encode_command() produces the argument vector
 *
 *          - JobDriver starts it (seeked when resuming) and owns the child
 *
 * @note When resuming, -ss is an input option, so FFmpeg reports frame
 *       numbers relative to the seek point. Callers add the resume frame.
 */

#ifndef HEVC_BATCH_FFMPEG_EXECUTOR_HPP
#define HEVC_BATCH_FFMPEG_EXECUTOR_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "subprocess.hpp"
#include "types.hpp"

namespace hevc_batch {

/**
 * @struct EncoderSettings
 * @brief Encoder binary and fixed codec parameters.
 */
struct EncoderSettings {
  std::string ffmpeg_bin = "ffmpeg";
  std::string x265_params = "ctu=32:max-tu-size=16:pools=16";
  std::string audio_quality = "4";

  /// Settings from the environment (see Config)
  static EncoderSettings from_config();
};

/**
 * @brief Seek offset in seconds for a resume frame.
 * @param resume_frame Absolute frame to start at
 * @param fps Source frame rate (<= 0 falls back to DEFAULT_FPS)
 */
double seek_seconds(int64_t resume_frame, double fps);

/**
 * @brief Build the FFmpeg argument vector for a job.
 *
 * @param job Input/output paths and metadata
 * @param resume_frame Absolute frame to resume at (0 = from the start)
 * @param settings Encoder binary and parameters
 * @return argv, with "-ss <seconds>" before "-i" only when resume_frame > 0
 */
std::vector<std::string> build_encode_command(const Job &job,
                                              int64_t resume_frame,
                                              const EncoderSettings &settings);

/**
 * @brief Join an argument vector for display (dry run, logs).
 */
std::string format_command(const std::vector<std::string> &argv);

/**
 * @class JobDriver
 * @brief Starts and owns the encoder process for one job.
 */
class JobDriver {
public:
  explicit JobDriver(EncoderSettings settings);

  /**
   * @brief Spawn the encoder.
   * @param job The job to encode
   * @param resume_frame Absolute frame to resume at (0 = fresh)
   * @return false if the encoder could not be started
   */
  bool start(const Job &job, int64_t resume_frame);

  /// Graceful stop request (SIGTERM), non-blocking and idempotent
  void terminate() noexcept { process_.terminate(); }

  /// Blocking reap, returns the exit status
  int wait() { return process_.wait(); }

  Subprocess &process() { return process_; }

  const EncoderSettings &settings() const { return settings_; }

private:
  EncoderSettings settings_;
  Subprocess process_;
};

} // namespace hevc_batch

#endif // HEVC_BATCH_FFMPEG_EXECUTOR_HPP
