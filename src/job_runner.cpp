/**
 * @file job_runner.cpp
 * @brief Control loop implementation
 */

#include "hevc_batch/job_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>

#include <fmt/core.h>

#include "hevc_batch/config.hpp"
#include "hevc_batch/logging.hpp"
#include "hevc_batch/system.hpp"
#include "hevc_batch/terminal.hpp"

namespace hevc_batch {

JobRunner::JobRunner(CheckpointStore &store, RunnerOptions options)
    : store_(store), options_(options) {
  options_.poll_timeout_ms =
      Config::clamp_poll_timeout(options_.poll_timeout_ms);
}

void JobRunner::on_frame(int64_t relative, const Job &job) {
  /// Frames never go backwards within one run
  state_.last_frame_seen =
      std::max(state_.last_frame_seen, state_.start_frame + relative);

  if (options_.show_progress) {
    fmt::print("{}", render_progress_bar(state_.last_frame_seen,
                                         job.info.total_frames,
                                         state_.start_frame > 0));
    std::fflush(stdout);
    drew_progress_ = true;
  }

  if (on_progress_)
    on_progress_(state_.last_frame_seen);
}

void JobRunner::act_on_stop(ControlState state,
                            const std::string &checkpoint_id,
                            JobDriver &driver) {
  if (state == ControlState::PauseRequested) {
    state_.pause_requested = true;
    /// Persist before stopping the encoder
    if (!store_.save(checkpoint_id, state_.last_frame_seen)) {
      LOG_ERROR("Could not save progress for {}", checkpoint_id);
    }
  } else {
    state_.quit_requested = true;
  }
  driver.terminate();
}

void JobRunner::drain_output(int fd, ProgressParser &parser, const Job &job) {
  char buf[PIPE_READ_CHUNK];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      for (int64_t frame : parser.feed(buf, static_cast<size_t>(n)))
        on_frame(frame, job);
      continue;
    }
    if (n == -1 && errno == EINTR)
      continue;
    break;
  }
}

JobOutcome JobRunner::run(const Job &job, const std::string &checkpoint_id,
                          int64_t start_frame, JobDriver &driver) {
  state_ = RunState{};
  state_.start_frame = start_frame;
  state_.last_frame_seen = start_frame;
  drew_progress_ = false;

  ControlStateMachine control;
  ProgressParser parser;
  Subprocess &proc = driver.process();

  int out_fd = proc.output_fd();
  int key_fd = options_.key_fd;

  {
    ChildRegistration registration(proc.pid());
    RawTerminal raw(key_fd);

    while (true) {
      // **---- CANCELLATION ----**

      if (Cancellation::requested() && control.on_cancel()) {
        act_on_stop(control.state(), checkpoint_id, driver);
        break;
      }

      // **---- WAIT ----**

      struct pollfd fds[2];
      nfds_t nfds = 0;
      int key_idx = -1;
      int out_idx = -1;

      if (key_fd >= 0) {
        key_idx = static_cast<int>(nfds);
        fds[nfds++] = {key_fd, POLLIN, 0};
      }
      if (out_fd >= 0) {
        out_idx = static_cast<int>(nfds);
        fds[nfds++] = {out_fd, POLLIN, 0};
      }

      int ready = ::poll(fds, nfds, options_.poll_timeout_ms);
      if (ready == -1) {
        if (errno == EINTR)
          continue;
        LOG_ERROR("poll failed: {}", std::strerror(errno));
        control.on_cancel();
        act_on_stop(control.state(), checkpoint_id, driver);
        break;
      }

      // **---- KEYSTROKES (before progress) ----**

      if (key_idx >= 0 && fds[key_idx].revents != 0) {
        char key = 0;
        ssize_t n = ::read(key_fd, &key, 1);
        if (n == 1) {
          if (control.on_key(key)) {
            act_on_stop(control.state(), checkpoint_id, driver);
            break;
          }
        } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
          /// Keystroke source closed; keep encoding without it
          key_fd = -1;
        }
      }

      // **---- ENCODER OUTPUT ----**

      if (out_idx >= 0 && fds[out_idx].revents != 0) {
        char buf[PIPE_READ_CHUNK];
        ssize_t n = ::read(out_fd, buf, sizeof(buf));
        if (n > 0) {
          for (int64_t frame : parser.feed(buf, static_cast<size_t>(n)))
            on_frame(frame, job);
        } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
          out_fd = -1;
        }
      }

      // **---- EXIT ----**

      if (proc.exited()) {
        /// Unregister while the pid is still reserved, then reap
        Cancellation::unregister_child();
        proc.wait();
        if (out_fd >= 0)
          drain_output(out_fd, parser, job);
        control.on_exit(proc.exit_status());
        break;
      }
    }
  }

  if (drew_progress_) {
    fmt::print("\n");
    std::fflush(stdout);
  }

  JobOutcome outcome;
  outcome.state = control.state();
  outcome.exit_status = proc.exit_status();
  outcome.last_frame_seen = state_.last_frame_seen;
  return outcome;
}

} // namespace hevc_batch
