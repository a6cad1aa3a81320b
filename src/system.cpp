/**
 * @file system.cpp
 * @brief File discovery, progress display and keep-awake implementation
 */

#include "hevc_batch/system.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>

#include <fmt/core.h>

#include "hevc_batch/logging.hpp"

namespace hevc_batch {

namespace fs = std::filesystem;

// **---- File Discovery ----**

bool has_video_extension(const std::string &filename) {
  static const std::array<const char *, 7> extensions = {
      ".mp4", ".mkv", ".avi", ".mov", ".wmv", ".flv", ".webm"};

  std::string ext = fs::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  return std::find(extensions.begin(), extensions.end(), ext) !=
         extensions.end();
}

std::vector<std::string> collect_video_files(const std::string &dir,
                                             const std::string &output_suffix) {
  std::vector<std::string> files;
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file())
      continue;

    std::string name = entry.path().filename().string();
    if (!has_video_extension(name))
      continue;
    if (!output_suffix.empty() && name.find(output_suffix) != std::string::npos)
      continue;

    files.push_back(name);
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::string output_path_for(const std::string &input_path,
                            const std::string &output_suffix) {
  fs::path p(input_path);
  return (p.parent_path() / (p.stem().string() + output_suffix)).string();
}

// **---- Progress Display ----**

std::string render_progress_bar(int64_t current, int64_t total,
                                bool resuming) {
  constexpr int width = 40;
  if (total <= 0)
    total = 1;

  int64_t percent = std::min<int64_t>(100, std::max<int64_t>(0, current) *
                                               100 / total);
  int filled = static_cast<int>(percent * width / 100);

  std::string bar(filled, '=');
  bar.append(width - filled, '-');

  return fmt::format("\r{}[{}] {}% ({}/{} frames)",
                     resuming ? "[RESUMING] " : "", bar, percent, current,
                     total);
}

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

// **---- Keep Awake ----**

std::vector<std::string> KeepAwake::helper_command() {
#ifdef __APPLE__
  return {"caffeinate", "-i"};
#else
  return {"systemd-inhibit", "--what=idle:sleep", "--who=hevc_batch",
          "--why=Batch encoding in progress", "sleep", "infinity"};
#endif
}

KeepAwake::KeepAwake() {
  auto cmd = helper_command();
  if (!helper_.start(cmd, Subprocess::Output::Discard)) {
    LOG_WARN("Keep-awake helper unavailable ({}); continuing", cmd.front());
  }
}

} // namespace hevc_batch
