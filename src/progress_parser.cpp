/**
 * @file progress_parser.cpp
 * @brief Progress line scanner implementation
 */

#include "hevc_batch/progress_parser.hpp"

#include <limits>
#include <regex>

namespace hevc_batch {

std::optional<int64_t> ProgressParser::scan_line(const std::string &line) {
  static const std::regex frame_pattern(R"(frame=\s*(\d+))");

  std::smatch match;
  if (!std::regex_search(line, match, frame_pattern))
    return std::nullopt;

  /// Saturate instead of overflowing on absurdly long digit runs
  const std::string digits = match[1].str();
  int64_t value = 0;
  for (char d : digits) {
    int v = d - '0';
    if (value > (std::numeric_limits<int64_t>::max() - v) / 10)
      return std::numeric_limits<int64_t>::max();
    value = value * 10 + v;
  }
  return value;
}

std::optional<int64_t> ProgressParser::feed(char c) {
  if (c != '\r' && c != '\n') {
    if (line_.size() < MAX_LINE) {
      line_.push_back(c);
    } else {
      overflow_ = true;
    }
    return std::nullopt;
  }

  std::optional<int64_t> frame;
  if (!overflow_ && !line_.empty())
    frame = scan_line(line_);

  line_.clear();
  overflow_ = false;
  return frame;
}

std::vector<int64_t> ProgressParser::feed(const char *data, size_t size) {
  std::vector<int64_t> frames;
  for (size_t i = 0; i < size; ++i) {
    if (auto frame = feed(data[i]))
      frames.push_back(*frame);
  }
  return frames;
}

} // namespace hevc_batch
