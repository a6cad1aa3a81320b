/**
 * @file logging.hpp
 * @brief Logging macros and the log file sink
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - LogFile: optional mirror of every log line into a timestamped
 *            file in the working directory
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so they interleave correctly with the progress bar.
 *
 */

#ifndef HEVC_BATCH_LOGGING_HPP
#define HEVC_BATCH_LOGGING_HPP

#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace hevc_batch {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

// **----- LOG FILE -----**

/**
 * @class LogFile
 * @brief Process-wide file sink for log lines.
 * @note Lines are written as "[YYYY-mm-dd HH:MM:SS] message" with carriage
 *       returns and newlines inside the message replaced by spaces. Write
 *       failures are ignored: the console copy is authoritative.
 */
class LogFile {
  static std::FILE *file;
  static std::string file_path;

public:
  /**
   * @brief Open (truncate) the log file.
   * @param path File to write
   * @return true if the file could be opened
   */
  static bool open(const std::string &path);

  /**
   * @brief Append one message. No-op when no file is open.
   * @param level Level tag (INFO, WARN, ...)
   * @param message Already formatted message
   */
  static void append(const char *level, const std::string &message);

  /// Close the file if open.
  static void close();

  /// Path of the open file (empty when closed)
  static const std::string &path() { return file_path; }

  /// Default name: encode_h265_YYYYmmdd_HHMMSS.log
  static std::string default_name();
};

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    const std::string log_msg_ = fmt::format(format_str, ##__VA_ARGS__);       \
    fmt::print("[INFO] {}\n", log_msg_);                                       \
    std::fflush(stdout);                                                       \
    hevc_batch::LogFile::append("INFO", log_msg_);                             \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    const std::string log_msg_ = fmt::format(format_str, ##__VA_ARGS__);       \
    fmt::print(fg(fmt::color::yellow), "[WARN] {}\n", log_msg_);               \
    std::fflush(stdout);                                                       \
    hevc_batch::LogFile::append("WARN", log_msg_);                             \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    const std::string log_msg_ = fmt::format(format_str, ##__VA_ARGS__);       \
    fmt::print(fg(fmt::color::red), "[ERROR] {}\n", log_msg_);                 \
    std::fflush(stdout);                                                       \
    hevc_batch::LogFile::append("ERROR", log_msg_);                            \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    const std::string log_msg_ = fmt::format(format_str, ##__VA_ARGS__);       \
    fmt::print(fg(fmt::color::cyan), "{}\n", log_msg_);                        \
    std::fflush(stdout);                                                       \
    hevc_batch::LogFile::append("PHASE", log_msg_);                            \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    const std::string log_msg_ = fmt::format(format_str, ##__VA_ARGS__);       \
    fmt::print(fg(fmt::color::green), "{}\n", log_msg_);                       \
    std::fflush(stdout);                                                       \
    hevc_batch::LogFile::append("OK", log_msg_);                               \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

} // namespace hevc_batch

#endif // HEVC_BATCH_LOGGING_HPP
