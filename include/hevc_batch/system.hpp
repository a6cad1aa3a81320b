/**
 * @file system.hpp
 * @brief File discovery, naming, progress display and the keep-awake helper
 *
 * @details Provides:
 *
 *          - Candidate file discovery in the working directory
 *
 *          - Output path naming
 *
 *          - Progress bar and time formatting
 *
 *          - KeepAwake: helper process preventing idle sleep during a batch
 */

#ifndef HEVC_BATCH_SYSTEM_HPP
#define HEVC_BATCH_SYSTEM_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "subprocess.hpp"

namespace hevc_batch {

// **---- File Discovery ----**

/**
 * @brief Check whether a file name has one of the handled video extensions.
 * @note Case-insensitive: .mp4 .mkv .avi .mov .wmv .flv .webm
 */
bool has_video_extension(const std::string &filename);

/**
 * @brief List candidate inputs of a directory.
 *
 * @param dir Directory to scan (not recursive)
 * @param output_suffix Names containing this suffix are previous outputs
 *        and are excluded
 * @return File names (not paths), sorted lexicographically
 * @throws std::filesystem::filesystem_error if the directory cannot be read
 */
std::vector<std::string> collect_video_files(const std::string &dir,
                                             const std::string &output_suffix);

/**
 * @brief Temporary output path for an input: extension replaced by suffix.
 * @note "dir/movie.mkv" + "_h265_mp3.mp4" -> "dir/movie_h265_mp3.mp4"
 */
std::string output_path_for(const std::string &input_path,
                            const std::string &output_suffix);

// **---- Progress Display ----**

/**
 * @brief Render the single-line progress bar (no trailing newline).
 * @param current Absolute frame
 * @param total Total frames of the source
 * @param resuming Prefix the bar with [RESUMING]
 */
std::string render_progress_bar(int64_t current, int64_t total,
                                bool resuming);

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

// **---- Keep Awake ----**

/**
 * @class KeepAwake
 * @brief Runs an OS-specific "do not sleep" helper for its lifetime.
 * @note Best-effort: a missing helper is logged and otherwise ignored. The
 *       helper is terminated and reaped by the destructor.
 */
class KeepAwake {
public:
  KeepAwake();

  bool active() const { return helper_.running(); }

  /// Command used on this platform
  static std::vector<std::string> helper_command();

private:
  Subprocess helper_;
};

} // namespace hevc_batch

#endif // HEVC_BATCH_SYSTEM_HPP
