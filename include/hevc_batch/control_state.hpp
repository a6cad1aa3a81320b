/**
 * @file control_state.hpp
 * @brief Per-job control state machine
 *
 * @details Maps operator keystrokes, cancellation and encoder exit onto
 *          ControlState:
 *
 *          RUNNING -> PAUSE_REQUESTED | QUIT_REQUESTED | EXITED_OK | EXITED_FAIL
 *
 * @note The machine only decides. Side effects (saving the checkpoint,
 *       terminating the encoder) belong to the JobRunner, which acts on the
 *       transition returned here.
 */

#ifndef HEVC_BATCH_CONTROL_STATE_HPP
#define HEVC_BATCH_CONTROL_STATE_HPP

#include "types.hpp"

namespace hevc_batch {

/**
 * @class ControlStateMachine
 * @brief Terminal states are sticky: once left, RUNNING is never re-entered.
 */
class ControlStateMachine {
public:
  /**
   * @brief Interpret one keystroke.
   * @param key Raw byte read from the terminal
   * @return true if this key caused a transition
   * @note q/Q quits; p/P/space pauses; anything else is ignored.
   */
  bool on_key(char key);

  /**
   * @brief Interpret a cancellation (SIGINT/SIGTERM). Same as 'q'.
   * @return true if this caused a transition
   */
  bool on_cancel();

  /**
   * @brief Interpret encoder exit.
   * @param exit_status Encoder exit status
   * @return true if this caused a transition
   * @note Ignored when a pause or quit is already pending.
   */
  bool on_exit(int exit_status);

  ControlState state() const { return state_; }

  bool is_terminal() const { return state_ != ControlState::Running; }

  /// True for PAUSE_REQUESTED and QUIT_REQUESTED
  bool stop_requested() const {
    return state_ == ControlState::PauseRequested ||
           state_ == ControlState::QuitRequested;
  }

private:
  ControlState state_ = ControlState::Running;
};

} // namespace hevc_batch

#endif // HEVC_BATCH_CONTROL_STATE_HPP
