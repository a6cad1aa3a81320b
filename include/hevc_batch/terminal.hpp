/**
 * @file terminal.hpp
 * @brief Scoped raw terminal mode and cancellation signals
 *
 * @details Provides:
 *
 *          - RawTerminal: character-at-a-time, no-echo input for the
 *            lifetime of the object, restored on every exit path
 *
 *          - SignalGuard: SIGINT/SIGTERM handlers for the lifetime of the
 *            object, previous dispositions restored afterwards
 *
 *          - Cancellation: the token the handlers set, plus the encoder pid
 *            they forward SIGTERM to
 *
 * @note ISIG stays enabled in raw mode so Ctrl-C still raises SIGINT and is
 *       handled as a quit.
 */

#ifndef HEVC_BATCH_TERMINAL_HPP
#define HEVC_BATCH_TERMINAL_HPP

#include <csignal>

#include <sys/types.h>
#include <termios.h>

namespace hevc_batch {

/**
 * @class RawTerminal
 * @brief RAII raw mode on a terminal file descriptor.
 * @note On a non-terminal fd nothing is changed and active() is false.
 */
class RawTerminal {
public:
  explicit RawTerminal(int fd);
  ~RawTerminal();

  RawTerminal(const RawTerminal &) = delete;
  RawTerminal &operator=(const RawTerminal &) = delete;

  /// True if raw mode was entered and will be restored
  bool active() const { return active_; }

private:
  int fd_;
  bool active_ = false;
  struct termios saved_;
};

/**
 * @brief Cancellation token shared with the signal handlers.
 *
 * @attention The handler only stores the flag and sends SIGTERM to the
 *            registered encoder pid. No I/O happens in signal context.
 */
namespace Cancellation {

/// True once SIGINT/SIGTERM arrived or request() was called
bool requested();

/// Set the token from normal code
void request();

/// Clear the token (start of a run, tests)
void reset();

/// Signal number that set the token (0 if none or set by request())
int signal_number();

/// Encoder pid the handler forwards SIGTERM to (-1 = none)
void register_child(pid_t pid);
void unregister_child();

} // namespace Cancellation

/**
 * @class SignalGuard
 * @brief Installs the SIGINT/SIGTERM handlers, restores the old ones.
 */
class SignalGuard {
public:
  SignalGuard();
  ~SignalGuard();

  SignalGuard(const SignalGuard &) = delete;
  SignalGuard &operator=(const SignalGuard &) = delete;

private:
  struct sigaction old_int_;
  struct sigaction old_term_;
};

/**
 * @class ChildRegistration
 * @brief Registers an encoder pid with Cancellation for a scope.
 */
class ChildRegistration {
public:
  explicit ChildRegistration(pid_t pid) { Cancellation::register_child(pid); }
  ~ChildRegistration() { Cancellation::unregister_child(); }

  ChildRegistration(const ChildRegistration &) = delete;
  ChildRegistration &operator=(const ChildRegistration &) = delete;
};

} // namespace hevc_batch

#endif // HEVC_BATCH_TERMINAL_HPP
