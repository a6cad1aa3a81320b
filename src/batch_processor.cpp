/**
 * @file batch_processor.cpp
 * @brief Sequential, resumable batch encoding implementation
 *
 * @details Implements the BatchProcessor class:
 *
 *          - Resume question and checkpoint matching
 *
 *          - Skip rules
 *
 *          - Post-job commit / discard / halt
 *
 *          - Dry-run and list modes
 *
 *          - Summary output
 */

#include "hevc_batch/batch_processor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#include <fmt/color.h>
#include <fmt/core.h>

#include "hevc_batch/config.hpp"
#include "hevc_batch/logging.hpp"
#include "hevc_batch/system.hpp"
#include "hevc_batch/terminal.hpp"

namespace hevc_batch {

namespace fs = std::filesystem;

BatchOptions BatchOptions::from_config() {
  BatchOptions o;
  o.state_file = Config::state_file();
  o.target_codec = Config::target_codec();
  o.output_suffix = Config::output_suffix();
  o.encoder = EncoderSettings::from_config();
  o.runner.poll_timeout_ms = Config::poll_timeout_ms();
  return o;
}

ResumeAnswer prompt_on_stdin(const Checkpoint &checkpoint) {
  fmt::print("Resume from frame {}? (Y/n): ", checkpoint.frame);
  std::fflush(stdout);

  std::string line;
  if (!std::getline(std::cin, line))
    return ResumeAnswer::NoAnswer;

  line.erase(std::remove_if(line.begin(), line.end(),
                            [](unsigned char c) { return std::isspace(c); }),
             line.end());
  std::transform(line.begin(), line.end(), line.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  return (line == "n") ? ResumeAnswer::Decline : ResumeAnswer::Resume;
}

BatchProcessor::BatchProcessor(BatchOptions options, MediaProbe &probe,
                               ResumePrompt prompt)
    : options_(std::move(options)), probe_(probe), prompt_(std::move(prompt)),
      store_((fs::path(options_.work_dir) / options_.state_file).string()) {}

std::optional<Checkpoint>
BatchProcessor::resolve_resume(const std::vector<std::string> &files) {
  auto checkpoint = store_.load();
  if (!checkpoint) {
    if (store_.exists()) {
      LOG_WARN("Ignoring unreadable checkpoint {}", store_.path());
    }
    return std::nullopt;
  }

  if (std::find(files.begin(), files.end(), checkpoint->file) == files.end()) {
    LOG_INFO("Checkpoint refers to {}, which is not an input; ignoring",
             checkpoint->file);
    return std::nullopt;
  }

  LOG_PHASE("Found partial work for: {}", checkpoint->file);

  switch (prompt_ ? prompt_(*checkpoint) : ResumeAnswer::NoAnswer) {
  case ResumeAnswer::Resume:
    return checkpoint;
  case ResumeAnswer::Decline:
    LOG_INFO("Discarding saved progress for {}", checkpoint->file);
    store_.clear();
    return std::nullopt;
  case ResumeAnswer::NoAnswer:
    break;
  }
  return std::nullopt;
}

bool BatchProcessor::is_eligible(const std::string &name,
                                 const VideoInfo &info,
                                 const std::string &output_path,
                                 bool resuming) {
  if (resuming)
    return true;

  if (info.codec == options_.target_codec) {
    LOG_INFO("Skipping {}: Already {}", name, options_.target_codec);
    return false;
  }

  std::error_code ec;
  if (fs::exists(output_path, ec)) {
    VideoInfo out_info;
    if (probe_.probe(output_path, out_info) &&
        out_info.codec == options_.target_codec) {
      LOG_INFO("Skipping {}: Output {} already exists and is {}", name,
               fs::path(output_path).filename().string(),
               options_.target_codec);
      return false;
    }
  }

  return true;
}

void BatchProcessor::release_checkpoint(const std::string &name) {
  auto checkpoint = store_.load();
  /// A readable checkpoint for another file is still owed to that file
  if (checkpoint && checkpoint->file != name)
    return;
  store_.clear();
}

void BatchProcessor::remove_output(const std::string &path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    LOG_WARN("Could not remove {}: {}", path, ec.message());
  }
}

bool BatchProcessor::run_job(const Job &job, const std::string &name,
                             int64_t start_frame) {
  auto start_time = std::chrono::high_resolution_clock::now();

  JobDriver driver(options_.encoder);
  if (!driver.start(job, start_frame)) {
    LOG_ERROR("✗ Failed: {} (encoder did not start)", name);
    summary_.failed++;
    summary_.failed_files.push_back(name);
    return true;
  }

  JobRunner runner(store_, options_.runner);
  runner.set_progress_callback(on_progress_);
  JobOutcome outcome = runner.run(job, name, start_frame, driver);

  auto end_time = std::chrono::high_resolution_clock::now();
  summary_.processing_time_us +=
      std::chrono::duration_cast<std::chrono::microseconds>(end_time -
                                                            start_time)
          .count();

  switch (outcome.state) {
  case ControlState::ExitedOk: {
    /// rename(2) replaces the original in one step
    std::error_code ec;
    fs::rename(job.output_path, job.input_path, ec);
    if (ec) {
      LOG_ERROR("✗ Failed to replace {} with {}: {}", name,
                fs::path(job.output_path).filename().string(), ec.message());
      summary_.failed++;
      summary_.failed_files.push_back(name);
      return true;
    }
    release_checkpoint(name);
    summary_.encoded++;
    LOG_SUCCESS("✓ Success: {} ({:.1f}s)", name,
                std::chrono::duration<double>(end_time - start_time).count());
    return true;
  }

  case ControlState::QuitRequested:
    LOG_WARN("[QUIT] Cleaning up and exiting...");
    release_checkpoint(name);
    remove_output(job.output_path);
    driver.wait();
    /// The encoder may still create the file while shutting down
    remove_output(job.output_path);
    summary_.halted = true;
    summary_.halt_reason = outcome.state;
    return false;

  case ControlState::PauseRequested:
    LOG_INFO("[PAUSED] Progress saved for {} at frame {}. Exiting.", name,
             outcome.last_frame_seen);
    driver.wait();
    summary_.halted = true;
    summary_.halt_reason = outcome.state;
    return false;

  case ControlState::ExitedFail:
  case ControlState::Running:
    break;
  }

  LOG_ERROR("✗ Failed: {} (exit status {})", name, outcome.exit_status);
  /// A resumed file's partial output stays with its checkpoint
  auto checkpoint = store_.load();
  if (!checkpoint || checkpoint->file != name) {
    remove_output(job.output_path);
  }
  summary_.failed++;
  summary_.failed_files.push_back(name);
  return true;
}

void BatchProcessor::write_file_list() {
  if (options_.list_output.empty() || summary_.eligible.empty())
    return;

  std::string list_path =
      (fs::path(options_.work_dir) / options_.list_output).string();
  std::ofstream out(list_path);
  if (!out) {
    LOG_ERROR("Error writing file list: cannot open {}", list_path);
    return;
  }

  for (const auto &input : summary_.eligible) {
    std::error_code ec;
    fs::path full = fs::absolute(input, ec);
    out << (ec ? input : full.lexically_normal().string()) << '\n';
  }

  if (!out) {
    LOG_ERROR("Error writing file list: {}", list_path);
    return;
  }
  LOG_INFO("File list saved to: {}", list_path);
}

int BatchProcessor::process(const std::vector<std::string> &files) {
  summary_ = BatchSummary{};

  if (files.empty()) {
    LOG_WARN("No input files to process");
    return 0;
  }

  auto batch_start = std::chrono::high_resolution_clock::now();
  auto resume = resolve_resume(files);

  for (const auto &name : files) {
    if (Cancellation::requested()) {
      LOG_WARN("Interrupted; not starting {}", name);
      summary_.halted = true;
      summary_.halt_reason = ControlState::QuitRequested;
      break;
    }

    std::string input_path = (fs::path(options_.work_dir) / name).string();
    std::string output_path =
        output_path_for(input_path, options_.output_suffix);
    bool resuming = resume && resume->file == name;

    VideoInfo info;
    if (!probe_.probe(input_path, info)) {
      LOG_WARN("Skipping {}: Error getting info", name);
      summary_.skipped++;
      continue;
    }
    LOG_INFO("File: {} | Codec: {} | Duration: {}", name,
             info.codec.empty() ? "none" : info.codec,
             format_time(info.duration));

    if (!is_eligible(name, info, output_path, resuming)) {
      summary_.skipped++;
      continue;
    }

    summary_.eligible.push_back(input_path);

    Job job{input_path, output_path, info};
    int64_t start_frame = resuming ? resume->frame : 0;

    if (resuming) {
      LOG_PHASE("Resuming: {} at frame {}", name, start_frame);
    } else {
      LOG_PHASE("Processing: {}", name);
    }

    if (options_.dry_run) {
      LOG_INFO("[DRY RUN] Would execute: {}",
               format_command(
                   build_encode_command(job, start_frame, options_.encoder)));
      if (resuming)
        resume.reset();
      continue;
    }

    if (!options_.list_output.empty()) {
      if (resuming)
        resume.reset();
      continue;
    }

    bool keep_going = run_job(job, name, start_frame);
    if (resuming)
      resume.reset();
    if (!keep_going)
      break;
  }

  write_file_list();

  auto batch_end = std::chrono::high_resolution_clock::now();
  print_batch_summary(
      std::chrono::duration<double>(batch_end - batch_start).count());

  return summary_.failed;
}

void BatchProcessor::print_batch_summary(double wall_clock_sec) {
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============== BATCH ENCODING SUMMARY ==============\n");
  fmt::print("{:<25} {:>25}\n", "Eligible files:", summary_.eligible.size());
  fmt::print("{:<25} {:>25}\n", "Encoded:", summary_.encoded);
  fmt::print("{:<25} {:>25}\n", "Skipped:", summary_.skipped);
  fmt::print("{:<25} {:>25}\n", "Failed:", summary_.failed);
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  fmt::print("{:<25} {:>22.1f}s\n", "Encoding time:",
             summary_.processing_time_us / 1000000.0);
  if (summary_.halted) {
    fmt::print("{:<25} {:>25}\n", "Stopped by:",
               summary_.halt_reason == ControlState::PauseRequested ? "pause"
                                                                    : "quit");
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);

  /// List failed files if any
  if (!summary_.failed_files.empty()) {
    fmt::print(fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &name : summary_.failed_files) {
      fmt::print(fg(fmt::color::red), "  - {}\n", name);
    }
    std::fflush(stdout);
  }

  LogFile::append("INFO", fmt::format("Summary: {} encoded, {} skipped, {} "
                                      "failed{}",
                                      summary_.encoded, summary_.skipped,
                                      summary_.failed,
                                      summary_.halted ? ", halted" : ""));
}

} // namespace hevc_batch
