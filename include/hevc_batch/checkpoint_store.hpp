/**
 * @file checkpoint_store.hpp
 * @brief Durable single-slot store for the resume checkpoint
 *
 * @details The store holds at most one Checkpoint, serialized as a JSON
 *          object {"file", "frame", "timestamp"} at a fixed path. A file
 *          name that is not valid UTF-8 is kept byte-exact in an extra
 *          "file_hex" member.
 *
 * @attention ATOMICITY:
 *
 *   - save() writes "<path>.tmp", fsyncs it and renames it over <path>
 *
 *   - A crash at any point leaves either the previous record or the new one
 *
 *   - A leftover temp file is never read
 */

#ifndef HEVC_BATCH_CHECKPOINT_STORE_HPP
#define HEVC_BATCH_CHECKPOINT_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "types.hpp"

namespace hevc_batch {

/**
 * @class CheckpointStore
 * @brief Load, save and clear the single checkpoint slot.
 */
class CheckpointStore {
public:
  /**
   * @brief Construct a store bound to a file.
   * @param path Checkpoint file path
   */
  explicit CheckpointStore(std::string path);

  /**
   * @brief Atomically replace the slot with {file, frame, now}.
   * @param file File name the checkpoint refers to
   * @param frame Absolute resume frame (must be >= 0)
   * @return true if the record reached its final path
   * @note Never throws; serialization and I/O failures are logged.
   */
  bool save(const std::string &file, int64_t frame);

  /**
   * @brief Read the slot.
   * @return The checkpoint, or std::nullopt when missing or malformed
   * @note Never throws.
   */
  std::optional<Checkpoint> load() const;

  /**
   * @brief Remove the slot. No-op when absent.
   * @note Removal errors are logged and swallowed.
   */
  void clear();

  /// True if a checkpoint file exists (valid or not)
  bool exists() const;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

} // namespace hevc_batch

#endif // HEVC_BATCH_CHECKPOINT_STORE_HPP
