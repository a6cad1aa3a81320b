/**
 * @file control_state.cpp
 * @brief Control state machine implementation
 */

#include "hevc_batch/control_state.hpp"

namespace hevc_batch {

const char *to_string(ControlState state) {
  switch (state) {
  case ControlState::Running:
    return "running";
  case ControlState::PauseRequested:
    return "pause-requested";
  case ControlState::QuitRequested:
    return "quit-requested";
  case ControlState::ExitedOk:
    return "exited-ok";
  case ControlState::ExitedFail:
    return "exited-fail";
  }
  return "unknown";
}

bool ControlStateMachine::on_key(char key) {
  if (is_terminal())
    return false;

  switch (key) {
  case 'q':
  case 'Q':
    state_ = ControlState::QuitRequested;
    return true;
  case 'p':
  case 'P':
  case ' ':
    state_ = ControlState::PauseRequested;
    return true;
  default:
    return false;
  }
}

bool ControlStateMachine::on_cancel() {
  if (is_terminal())
    return false;
  state_ = ControlState::QuitRequested;
  return true;
}

bool ControlStateMachine::on_exit(int exit_status) {
  if (is_terminal())
    return false;
  state_ = (exit_status == 0) ? ControlState::ExitedOk
                              : ControlState::ExitedFail;
  return true;
}

} // namespace hevc_batch
