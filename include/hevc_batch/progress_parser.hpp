/**
 * @file progress_parser.hpp
 * @brief Incremental "frame=<N>" extraction from encoder output
 *
 * @details FFmpeg redraws its status line with '\r' and prints banners and
 *          warnings with '\n'. The parser accumulates bytes until either
 *          terminator, scans the finished line and resets. Input can arrive
 *          in chunks of any size, including one byte at a time.
 */

#ifndef HEVC_BATCH_PROGRESS_PARSER_HPP
#define HEVC_BATCH_PROGRESS_PARSER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hevc_batch {

/**
 * @class ProgressParser
 * @brief Line-buffered scanner for relative frame numbers.
 */
class ProgressParser {
public:
  /// Longest line kept; longer lines are dropped up to their terminator
  static constexpr size_t MAX_LINE = 64 * 1024;

  /**
   * @brief Feed raw bytes.
   * @param data Bytes read from the encoder
   * @param size Number of bytes
   * @return Relative frame numbers of the lines completed by this chunk, in
   *         stream order
   */
  std::vector<int64_t> feed(const char *data, size_t size);

  /// Convenience overload for a single byte
  std::optional<int64_t> feed(char c);

  /**
   * @brief Scan one complete line for a frame marker.
   * @return The frame number after "frame=" (spaces allowed), if any
   */
  static std::optional<int64_t> scan_line(const std::string &line);

  /// Bytes buffered for the current, unterminated line
  size_t pending() const { return line_.size(); }

private:
  std::string line_;
  bool overflow_ = false;
};

} // namespace hevc_batch

#endif // HEVC_BATCH_PROGRESS_PARSER_HPP
