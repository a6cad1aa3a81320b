/**
 * @file types.hpp
 * @brief Core data types shared by the batch encoder
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - VideoInfo for probed stream metadata
 *
 *          - Job for a single encode unit
 *
 *          - Checkpoint for the persisted resume record
 *
 *          - RunState and JobOutcome for one run of the control loop
 */

#ifndef HEVC_BATCH_TYPES_HPP
#define HEVC_BATCH_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace hevc_batch {

// **----- CONSTANTS -----**

/// Frame rate assumed when the stream's rate cannot be parsed
constexpr double DEFAULT_FPS = 25.0;

/// Size of a single read from the encoder's output pipe
constexpr size_t PIPE_READ_CHUNK = 4096;

// **----- DATA STRUCTURES -----**

/**
 * @struct VideoInfo
 * @brief Metadata of the best video stream of a file.
 * @note codec is empty when the file has no video stream.
 */
struct VideoInfo {
  std::string codec;        //< Codec short name ("hevc", "h264", ...)
  double fps = DEFAULT_FPS; //< Frames per second
  int64_t total_frames = 1; //< duration * fps, at least 1
  double duration = 0.0;    //< Duration in seconds
};

/**
 * @struct Job
 * @brief One encode unit owned by the orchestrator for one iteration.
 */
struct Job {
  std::string input_path;  //< Source file, replaced on success
  std::string output_path; //< Temporary encoder output
  VideoInfo info;          //< Probed source metadata
};

/**
 * @struct Checkpoint
 * @brief The single persisted resume record.
 */
struct Checkpoint {
  std::string file;       //< File name relative to the working directory
  int64_t frame = 0;      //< Absolute frame to resume from
  double timestamp = 0.0; //< Unix time of the save
};

/**
 * @enum ControlState
 * @brief States of the per-job control state machine.
 * @note Every state except Running is terminal.
 */
enum class ControlState {
  Running,
  PauseRequested,
  QuitRequested,
  ExitedOk,
  ExitedFail,
};

/// Human readable state name for logging
const char *to_string(ControlState state);

/**
 * @struct RunState
 * @brief Transient state of one job run.
 */
struct RunState {
  int64_t start_frame = 0;     //< Absolute frame the encoder was seeked to
  int64_t last_frame_seen = 0; //< Highest absolute frame reported so far
  bool quit_requested = false;
  bool pause_requested = false;
};

/**
 * @struct JobOutcome
 * @brief Result of one job run handed back to the orchestrator.
 */
struct JobOutcome {
  ControlState state = ControlState::Running;
  int exit_status = -1;        //< Encoder exit status (-1 = not collected)
  int64_t last_frame_seen = 0; //< Final absolute frame
};

} // namespace hevc_batch

#endif // HEVC_BATCH_TYPES_HPP
