/**
 * @file subprocess.hpp
 * @brief Child process ownership (fork/exec, output pipe, terminate, reap)
 *
 * @details Used for the encoder, whose combined stdout/stderr is captured on
 *          a non-blocking pipe, and for the keep-awake helper, whose output
 *          is discarded.
 *
 * @attention LIFECYCLE:
 *
 *   - terminate() sends SIGTERM and never blocks
 *
 *   - terminate() is a no-op once the child was reaped (no stray signal to a
 *     recycled pid)
 *
 *   - The destructor terminates and reaps a child that is still running
 */

#ifndef HEVC_BATCH_SUBPROCESS_HPP
#define HEVC_BATCH_SUBPROCESS_HPP

#include <string>
#include <vector>

#include <sys/types.h>

namespace hevc_batch {

/**
 * @class Subprocess
 * @brief Owns one child process.
 */
class Subprocess {
public:
  enum class Output {
    Capture, //< stdout+stderr on one pipe readable via output_fd()
    Discard, //< stdout+stderr to /dev/null
  };

  Subprocess() = default;
  ~Subprocess();

  Subprocess(const Subprocess &) = delete;
  Subprocess &operator=(const Subprocess &) = delete;

  /**
   * @brief Spawn argv[0] (PATH lookup) with stdin on /dev/null.
   * @param argv Program and arguments
   * @param mode What to do with the child's output
   * @return false if the pipe, fork or exec failed
   * @note The child runs in its own process group so terminal generated
   *       signals reach only this program, which decides what to forward.
   */
  bool start(const std::vector<std::string> &argv,
             Output mode = Output::Capture);

  /// Read end of the output pipe (-1 when not capturing or closed)
  int output_fd() const { return out_fd_; }

  /// Close the read end of the output pipe.
  void close_output();

  /**
   * @brief Request a graceful stop (SIGTERM). Never blocks.
   */
  void terminate() noexcept;

  /**
   * @brief Check for exit without reaping.
   * @return true if the child has exited; its pid stays reserved until
   *         poll_exit() or wait()
   */
  bool exited() const;

  /**
   * @brief Reap the child if it has exited.
   * @return true if the child has exited (now or earlier)
   */
  bool poll_exit();

  /**
   * @brief Block until the child exits.
   * @return Exit status (see exit_status())
   */
  int wait();

  /// True between a successful start() and the child being reaped
  bool running() const { return pid_ > 0 && !reaped_; }

  pid_t pid() const { return pid_; }

  /**
   * @brief Exit status of a reaped child.
   * @return exit code, 128 + signal number if killed by a signal, -1 if
   *         not reaped yet
   */
  int exit_status() const { return exit_status_; }

private:
  pid_t pid_ = -1;
  int out_fd_ = -1;
  bool reaped_ = false;
  int exit_status_ = -1;

  void record_status(int status);
};

} // namespace hevc_batch

#endif // HEVC_BATCH_SUBPROCESS_HPP
