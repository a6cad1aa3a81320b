/**
 * @file media_probe.hpp
 * @brief Video metadata probing
 *
 * @details MediaProbe is the seam between the orchestrator and whatever
 *          reads container metadata. LibavProbe opens the file with
 *          libavformat and reports the best video stream.
 */

#ifndef HEVC_BATCH_MEDIA_PROBE_HPP
#define HEVC_BATCH_MEDIA_PROBE_HPP

#include <string>

#include "types.hpp"

namespace hevc_batch {

/**
 * @class MediaProbe
 * @brief Reads {codec, fps, total_frames, duration} for a path.
 */
class MediaProbe {
public:
  virtual ~MediaProbe() = default;

  /**
   * @brief Probe a file.
   * @param path File to open
   * @param info Output: metadata of the best video stream
   * @return false if the file could not be opened or parsed
   * @note A file without a video stream succeeds with an empty codec.
   */
  virtual bool probe(const std::string &path, VideoInfo &info) = 0;
};

/**
 * @class LibavProbe
 * @brief MediaProbe backed by libavformat.
 *
 * @attention
 *   - Frame rate comes from r_frame_rate; an unusable rate falls back to
 *     DEFAULT_FPS
 *
 *   - Duration comes from the container; unknown duration reads as 0
 */
class LibavProbe : public MediaProbe {
public:
  LibavProbe();

  bool probe(const std::string &path, VideoInfo &info) override;
};

} // namespace hevc_batch

#endif // HEVC_BATCH_MEDIA_PROBE_HPP
