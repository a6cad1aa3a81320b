/**
 * @file logging.cpp
 * @brief Log file sink implementation
 *
 * @details Provides static member definitions for:
 *          - LogFile handle and path
 */

#include "hevc_batch/logging.hpp"

#include <algorithm>
#include <ctime>

#include <fmt/chrono.h>
#include <fmt/core.h>

namespace hevc_batch {

// **----- LOG FILE STATIC MEMBERS -----**

std::FILE *LogFile::file = nullptr;
std::string LogFile::file_path;

bool LogFile::open(const std::string &path) {
  close();
  file = std::fopen(path.c_str(), "w");
  if (!file)
    return false;
  file_path = path;
  return true;
}

void LogFile::append(const char *level, const std::string &message) {
  if (!file)
    return;

  std::string clean = message;
  std::replace(clean.begin(), clean.end(), '\r', ' ');
  std::replace(clean.begin(), clean.end(), '\n', ' ');

  fmt::print(file, "[{:%Y-%m-%d %H:%M:%S}] [{}] {}\n",
             fmt::localtime(std::time(nullptr)), level, clean);
  std::fflush(file);
}

void LogFile::close() {
  if (file) {
    std::fclose(file);
    file = nullptr;
  }
  file_path.clear();
}

std::string LogFile::default_name() {
  return fmt::format("encode_h265_{:%Y%m%d_%H%M%S}.log",
                     fmt::localtime(std::time(nullptr)));
}

} // namespace hevc_batch
