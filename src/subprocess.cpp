/**
 * @file subprocess.cpp
 * @brief Child process implementation
 *
 * @details fork/execvp with a close-on-exec status pipe: the child writes its
 *          errno there if exec fails, so start() can report a missing binary
 *          instead of a child that silently exits 127.
 */

#include "hevc_batch/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "hevc_batch/logging.hpp"

namespace hevc_batch {

Subprocess::~Subprocess() {
  if (running()) {
    terminate();
    wait();
  }
  close_output();
}

bool Subprocess::start(const std::vector<std::string> &argv, Output mode) {
  if (argv.empty() || running())
    return false;

  /// Build the exec vector before fork (no allocation in the child)
  std::vector<char *> exec_argv;
  exec_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    exec_argv.push_back(const_cast<char *>(arg.c_str()));
  exec_argv.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  if (mode == Output::Capture && pipe2(out_pipe, O_CLOEXEC) == -1) {
    LOG_ERROR("pipe2 failed: {}", std::strerror(errno));
    return false;
  }

  int status_pipe[2];
  if (pipe2(status_pipe, O_CLOEXEC) == -1) {
    LOG_ERROR("pipe2 failed: {}", std::strerror(errno));
    if (out_pipe[0] != -1) {
      ::close(out_pipe[0]);
      ::close(out_pipe[1]);
    }
    return false;
  }

  pid_t pid = fork();
  if (pid == -1) {
    LOG_ERROR("fork failed: {}", std::strerror(errno));
    ::close(status_pipe[0]);
    ::close(status_pipe[1]);
    if (out_pipe[0] != -1) {
      ::close(out_pipe[0]);
      ::close(out_pipe[1]);
    }
    return false;
  }

  if (pid == 0) {
    /// Child: async-signal-safe calls only
    setpgid(0, 0);

    struct sigaction dfl;
    std::memset(&dfl, 0, sizeof(dfl));
    dfl.sa_handler = SIG_DFL;
    sigaction(SIGINT, &dfl, nullptr);
    sigaction(SIGTERM, &dfl, nullptr);

    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull != -1)
      dup2(devnull, STDIN_FILENO);

    if (mode == Output::Capture) {
      dup2(out_pipe[1], STDOUT_FILENO);
      dup2(out_pipe[1], STDERR_FILENO);
    } else if (devnull != -1) {
      dup2(devnull, STDOUT_FILENO);
      dup2(devnull, STDERR_FILENO);
    }

    execvp(exec_argv[0], exec_argv.data());

    int err = errno;
    ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  /// Parent: also set the group here so terminate() never races the child
  setpgid(pid, pid);
  ::close(status_pipe[1]);
  if (out_pipe[1] != -1)
    ::close(out_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n == -1 && errno == EINTR);
  ::close(status_pipe[0]);

  pid_ = pid;
  reaped_ = false;
  exit_status_ = -1;

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    LOG_ERROR("Failed to execute {}: {}", argv[0], std::strerror(child_errno));
    wait();
    if (out_pipe[0] != -1)
      ::close(out_pipe[0]);
    return false;
  }

  if (out_pipe[0] != -1) {
    int flags = fcntl(out_pipe[0], F_GETFL, 0);
    fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK);
    out_fd_ = out_pipe[0];
  }

  return true;
}

void Subprocess::close_output() {
  if (out_fd_ != -1) {
    ::close(out_fd_);
    out_fd_ = -1;
  }
}

void Subprocess::terminate() noexcept {
  if (!running())
    return;
  /// Whole process group first, so helpers the child spawned stop too
  if (::kill(-pid_, SIGTERM) == -1)
    ::kill(pid_, SIGTERM);
}

bool Subprocess::exited() const {
  if (pid_ <= 0)
    return false;
  if (reaped_)
    return true;

  siginfo_t info;
  std::memset(&info, 0, sizeof(info));
  int r;
  do {
    r = waitid(P_PID, static_cast<id_t>(pid_), &info,
               WEXITED | WNOHANG | WNOWAIT);
  } while (r == -1 && errno == EINTR);

  /// ECHILD: already reaped elsewhere, poll_exit() will record it
  if (r == -1)
    return errno == ECHILD;
  return info.si_pid == pid_;
}

bool Subprocess::poll_exit() {
  if (pid_ <= 0)
    return false;
  if (reaped_)
    return true;

  int status = 0;
  pid_t r = waitpid(pid_, &status, WNOHANG);
  if (r == pid_) {
    record_status(status);
    return true;
  }
  if (r == -1 && errno == ECHILD) {
    /// Someone else reaped it; treat as a failed exit
    reaped_ = true;
    exit_status_ = -1;
    return true;
  }
  return false;
}

int Subprocess::wait() {
  if (pid_ <= 0 || reaped_)
    return exit_status_;

  int status = 0;
  pid_t r;
  do {
    r = waitpid(pid_, &status, 0);
  } while (r == -1 && errno == EINTR);

  if (r == pid_) {
    record_status(status);
  } else {
    reaped_ = true;
    exit_status_ = -1;
  }
  return exit_status_;
}

void Subprocess::record_status(int status) {
  reaped_ = true;
  if (WIFEXITED(status)) {
    exit_status_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_status_ = 128 + WTERMSIG(status);
  } else {
    exit_status_ = -1;
  }
}

} // namespace hevc_batch
