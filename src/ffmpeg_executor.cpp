/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg command construction and process start
 */

#include "hevc_batch/ffmpeg_executor.hpp"

#include <filesystem>

#include <fmt/core.h>

#include "hevc_batch/config.hpp"
#include "hevc_batch/logging.hpp"

namespace hevc_batch {

EncoderSettings EncoderSettings::from_config() {
  EncoderSettings s;
  s.ffmpeg_bin = Config::ffmpeg_bin();
  s.x265_params = Config::x265_params();
  s.audio_quality = Config::audio_quality();
  return s;
}

double seek_seconds(int64_t resume_frame, double fps) {
  if (fps <= 0)
    fps = DEFAULT_FPS;
  return static_cast<double>(resume_frame) / fps;
}

std::vector<std::string> build_encode_command(const Job &job,
                                              int64_t resume_frame,
                                              const EncoderSettings &settings) {
  std::vector<std::string> cmd = {settings.ffmpeg_bin, "-nostdin"};

  /// Input seek: must precede -i
  if (resume_frame > 0) {
    cmd.push_back("-ss");
    cmd.push_back(fmt::format("{}", seek_seconds(resume_frame, job.info.fps)));
  }

  cmd.insert(cmd.end(), {"-i", job.input_path, "-c:v", "libx265",
                         "-x265-params", settings.x265_params, "-c:a",
                         "libmp3lame", "-q:a", settings.audio_quality, "-y",
                         job.output_path});
  return cmd;
}

std::string format_command(const std::vector<std::string> &argv) {
  std::string out;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      out += ' ';
    if (argv[i].find_first_of(" \t'\"") != std::string::npos) {
      out += fmt::format("\"{}\"", argv[i]);
    } else {
      out += argv[i];
    }
  }
  return out;
}

JobDriver::JobDriver(EncoderSettings settings)
    : settings_(std::move(settings)) {}

bool JobDriver::start(const Job &job, int64_t resume_frame) {
  auto cmd = build_encode_command(job, resume_frame, settings_);

  LOG_INFO("Starting encoder for {}{}",
           std::filesystem::path(job.input_path).filename().string(),
           resume_frame > 0
               ? fmt::format(" (seek {:.2f}s)",
                             seek_seconds(resume_frame, job.info.fps))
               : std::string());

  if (!process_.start(cmd, Subprocess::Output::Capture)) {
    LOG_ERROR("Failed to start encoder: {}", format_command(cmd));
    return false;
  }
  return true;
}

} // namespace hevc_batch
