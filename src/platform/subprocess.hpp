#pragma once

#include <sys/types.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace platform {

// A child process started with its stdin, stdout and stderr connected to
// pipes owned by this object. The child leads its own process group so Kill()
// also reaches anything it forked.
class Subprocess {
 public:
  // Throws std::system_error when pipes or fork fail and std::runtime_error
  // when the executable cannot be executed (missing, not executable, ...).
  explicit Subprocess(const std::vector<std::string>& argv);
  ~Subprocess();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  pid_t Pid() const { return pid_; }
  int StdoutFd() const { return stdout_fd_; }
  int StderrFd() const { return stderr_fd_; }

  enum class WriteStatus { kWritten = 0, kClosed, kTimedOut };

  // Writes all of `data` to the child's stdin, waiting for pipe space no later
  // than `deadline`. kClosed means the child closed its end or the pipe was
  // already closed.
  WriteStatus Write(const std::string& data, std::chrono::steady_clock::time_point deadline);
  void CloseStdin();

  // Non-blocking; reaps the child if it has exited.
  bool IsRunning();

  // SIGKILL to the process group followed by a blocking reap. Safe to call any
  // number of times, from any thread.
  void Kill();

  // Exit status as reported by waitpid, once the child has been reaped.
  std::optional<int> ExitStatus() const;

  // Closes the read ends of stdout/stderr. Call only after the readers using
  // them have stopped.
  void CloseOutputs();

 private:
  mutable std::mutex mutex_;
  std::mutex write_mutex_;
  pid_t pid_ = -1;
  bool reaped_ = false;
  int exit_status_ = 0;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
};

}  // namespace platform
