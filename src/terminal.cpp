/**
 * @file terminal.cpp
 * @brief Raw terminal mode and signal handling implementation
 */

#include "hevc_batch/terminal.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>

#include <unistd.h>

#include "hevc_batch/logging.hpp"

namespace hevc_batch {

// **---- RAW TERMINAL ----**

RawTerminal::RawTerminal(int fd) : fd_(fd) {
  std::memset(&saved_, 0, sizeof(saved_));
  if (fd_ < 0 || !isatty(fd_))
    return;

  if (tcgetattr(fd_, &saved_) != 0) {
    LOG_WARN("tcgetattr failed: {}", std::strerror(errno));
    return;
  }

  struct termios raw = saved_;
  raw.c_lflag &= ~(ICANON | ECHO);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;

  if (tcsetattr(fd_, TCSANOW, &raw) != 0) {
    LOG_WARN("tcsetattr failed: {}", std::strerror(errno));
    return;
  }
  active_ = true;
}

RawTerminal::~RawTerminal() {
  if (active_)
    tcsetattr(fd_, TCSADRAIN, &saved_);
}

// **---- CANCELLATION ----**

namespace {

volatile std::sig_atomic_t g_cancel_signal = 0;
volatile std::sig_atomic_t g_cancelled = 0;
std::atomic<pid_t> g_child_pid{-1};

static_assert(std::atomic<pid_t>::is_always_lock_free,
              "pid handoff to the signal handler must be lock-free");

void on_cancel_signal(int sig) {
  int saved_errno = errno;
  g_cancelled = 1;
  g_cancel_signal = sig;
  pid_t pid = g_child_pid.load();
  if (pid > 0 && ::kill(-pid, SIGTERM) == -1)
    ::kill(pid, SIGTERM);
  errno = saved_errno;
}

} // anonymous namespace

namespace Cancellation {

bool requested() { return g_cancelled != 0; }

void request() { g_cancelled = 1; }

void reset() {
  g_cancelled = 0;
  g_cancel_signal = 0;
}

int signal_number() { return g_cancel_signal; }

void register_child(pid_t pid) { g_child_pid.store(pid); }

void unregister_child() { g_child_pid.store(-1); }

} // namespace Cancellation

// **---- SIGNAL GUARD ----**

SignalGuard::SignalGuard() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_cancel_signal;
  sigemptyset(&sa.sa_mask);
  /// No SA_RESTART: blocking reads must return EINTR so the token is seen
  sa.sa_flags = 0;

  sigaction(SIGINT, &sa, &old_int_);
  sigaction(SIGTERM, &sa, &old_term_);
}

SignalGuard::~SignalGuard() {
  sigaction(SIGINT, &old_int_, nullptr);
  sigaction(SIGTERM, &old_term_, nullptr);
}

} // namespace hevc_batch
