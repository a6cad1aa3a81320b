/**
 * @file main.cpp
 * @brief Entry point for the HEVC batch encoder
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing (--dry-run, --list, directory)
 *
 *          - Log file, keep-awake helper and signal handlers
 *
 *          - Candidate discovery and the BatchProcessor run
 *
 * @note Controls while encoding: P/Space = pause (resume on next start),
 *       Q = quit and discard the current file. SIGINT/SIGTERM act as Q.
 */

#include <cstdio>
#include <filesystem>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include "hevc_batch/batch_processor.hpp"
#include "hevc_batch/config.hpp"
#include "hevc_batch/logging.hpp"
#include "hevc_batch/media_probe.hpp"
#include "hevc_batch/system.hpp"
#include "hevc_batch/terminal.hpp"

using namespace hevc_batch;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  namespace fs = std::filesystem;

  BatchOptions options = BatchOptions::from_config();
  bool list_mode = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--dry-run") {
      options.dry_run = true;
    } else if (arg == "--list") {
      list_mode = true;
    } else if (arg == "-h" || arg == "--help") {
      fmt::print("Usage: ./hevc_batch [--dry-run] [--list] [directory]\n");
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      LOG_WARN("Usage: ./hevc_batch [--dry-run] [--list] [directory]");
      return 1;
    } else {
      options.work_dir = arg;
    }
  }
  if (list_mode)
    options.list_output = Config::list_output();

  /// Keystrokes only when a person is at the terminal
  options.runner.key_fd = isatty(STDIN_FILENO) ? STDIN_FILENO : -1;

  if (Config::log_to_file()) {
    std::string log_path =
        (fs::path(options.work_dir) / LogFile::default_name()).string();
    if (!LogFile::open(log_path)) {
      LOG_WARN("Could not open log file {}", log_path);
    } else {
      LOG_INFO("Log file: {}", LogFile::path());
    }
  }

  std::unique_ptr<KeepAwake> keep_awake;
  if (Config::keep_awake() && !options.dry_run && !list_mode)
    keep_awake = std::make_unique<KeepAwake>();

  SignalGuard signals;

  LOG_PHASE("==========================================");
  LOG_PHASE("H.265 Encoding{}{}", options.dry_run ? " [DRY RUN]" : "",
            list_mode ? " [LIST MODE]" : "");
  LOG_INFO("Directory: {}", options.work_dir);
  LOG_INFO("Controls: P/Space=Pause & Resume, Q=Quit & Clean");
  LOG_PHASE("==========================================");

  std::vector<std::string> files;
  try {
    files = collect_video_files(options.work_dir, options.output_suffix);
  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("Cannot read directory {}: {}", options.work_dir, e.what());
    LogFile::close();
    return 1;
  }

  LOG_INFO("Found {} video files", files.size());

  LibavProbe probe;
  BatchProcessor processor(options, probe);
  int failures = 0;
  try {
    failures = processor.process(files);
  } catch (const std::exception &e) {
    /// Caught here so the encoder and terminal guards unwind
    LOG_ERROR("Fatal error: {}", e.what());
    LogFile::close();
    return 1;
  }

  if (Cancellation::signal_number() != 0) {
    LOG_WARN("Stopped by signal {}", Cancellation::signal_number());
  }

  LogFile::close();
  return failures == 0 ? 0 : 1;
}
