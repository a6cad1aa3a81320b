/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/hevc_batch.env for detailed documentation of each
 *          parameter.
 *
 */

#ifndef HEVC_BATCH_CONFIG_HPP
#define HEVC_BATCH_CONFIG_HPP

#include <algorithm>
#include <cstdlib>
#include <string>

namespace hevc_batch {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable value or default
 */
inline std::string get_env_string(const char *name,
                                  const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- FILES ----**

/// Checkpoint file, relative to the working directory
inline const std::string &state_file() {
  static std::string val =
      get_env_string("HEVC_STATE_FILE", ".encode_h265_resume.json");
  return val;
}

/// Output of --list mode, relative to the working directory
inline const std::string &list_output() {
  static std::string val =
      get_env_string("LIST_OUTPUT", "files_to_convert.txt");
  return val;
}

/// Mirror log lines into a timestamped log file
inline bool log_to_file() {
  static bool val = (get_env_int("LOG_TO_FILE", 1) != 0);
  return val;
}

// **---- ENCODING ----**

/// Codec short name (libavcodec naming) that marks a file as done
inline const std::string &target_codec() {
  static std::string val = get_env_string("HEVC_TARGET_CODEC", "hevc");
  return val;
}

/**
 * @brief Suffix replacing the extension of the temporary output
 * @note Inputs whose name already contains this suffix are never selected.
 */
inline const std::string &output_suffix() {
  static std::string val =
      get_env_string("HEVC_OUTPUT_SUFFIX", "_h265_mp3.mp4");
  return val;
}

/// Encoder executable, looked up in PATH when not absolute
inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

/// Value passed to -x265-params
inline const std::string &x265_params() {
  static std::string val =
      get_env_string("X265_PARAMS", "ctu=32:max-tu-size=16:pools=16");
  return val;
}

/// libmp3lame VBR quality passed to -q:a
inline const std::string &audio_quality() {
  static std::string val = get_env_string("AUDIO_QUALITY", "4");
  return val;
}

// **---- CONTROL LOOP ----**

constexpr int MIN_POLL_TIMEOUT_MS = 1;
constexpr int MAX_POLL_TIMEOUT_MS = 1000;

/// Clamp a wait to [MIN_POLL_TIMEOUT_MS, MAX_POLL_TIMEOUT_MS]
inline int clamp_poll_timeout(int ms) {
  return std::min(std::max(ms, MIN_POLL_TIMEOUT_MS), MAX_POLL_TIMEOUT_MS);
}

/**
 * @brief Upper bound on a single wait inside the control loop
 * @note Keystrokes and signals are noticed within this many milliseconds
 *       even when the encoder prints nothing. Never infinite, never zero.
 */
inline int poll_timeout_ms() {
  static int val = clamp_poll_timeout(get_env_int("POLL_TIMEOUT_MS", 100));
  return val;
}

/// Keep the machine awake while the batch runs
inline bool keep_awake() {
  static bool val = (get_env_int("KEEP_AWAKE", 1) != 0);
  return val;
}

} // namespace Config
} // namespace hevc_batch

#endif // HEVC_BATCH_CONFIG_HPP
