#include "platform/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <system_error>

namespace platform {
namespace {

void IgnoreSigpipeOnce() {
  static std::once_flag flag;
  std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

struct Pipe {
  int read = -1;
  int write = -1;

  Pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    read = fds[0];
    write = fds[1];
  }
  ~Pipe() {
    CloseFd(read);
    CloseFd(write);
  }
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  int ReleaseRead() {
    const int fd = read;
    read = -1;
    return fd;
  }
  int ReleaseWrite() {
    const int fd = write;
    write = -1;
    return fd;
  }
};

[[noreturn]] void ExecChild(char* const* argv, const Pipe& in, const Pipe& out, const Pipe& err,
                            int status_fd) {
  // Only async-signal-safe calls from here on.
  ::setpgid(0, 0);
  ::signal(SIGPIPE, SIG_DFL);
  sigset_t unblocked;
  sigemptyset(&unblocked);
  ::sigprocmask(SIG_SETMASK, &unblocked, nullptr);
  if (::dup2(in.read, STDIN_FILENO) < 0 || ::dup2(out.write, STDOUT_FILENO) < 0 ||
      ::dup2(err.write, STDERR_FILENO) < 0) {
    const int error = errno;
    (void)!::write(status_fd, &error, sizeof(error));
    ::_exit(127);
  }
  ::execvp(argv[0], argv);
  const int error = errno;
  (void)!::write(status_fd, &error, sizeof(error));
  ::_exit(127);
}

}  // namespace

Subprocess::Subprocess(const std::vector<std::string>& argv) {
  if (argv.empty() || argv.front().empty()) {
    throw std::invalid_argument("Subprocess command must not be empty");
  }
  IgnoreSigpipeOnce();

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  Pipe in;
  Pipe out;
  Pipe err;
  Pipe status;

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }
  if (pid == 0) {
    ExecChild(c_argv.data(), in, out, err, status.write);
  }

  ::setpgid(pid, pid);
  CloseFd(status.write);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status.read, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int wait_status = 0;
    while (::waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
    }
    throw std::runtime_error("Cannot execute '" + argv.front() +
                             "': " + std::strerror(child_errno));
  }

  pid_ = pid;
  stdin_fd_ = in.ReleaseWrite();
  // Writes wait on poll() against a deadline instead of blocking in write().
  if (::fcntl(stdin_fd_, F_SETFL, ::fcntl(stdin_fd_, F_GETFL) | O_NONBLOCK) != 0) {
    const int error = errno;
    Kill();
    throw std::system_error(error, std::generic_category(), "fcntl(O_NONBLOCK)");
  }
  stdout_fd_ = out.ReleaseRead();
  stderr_fd_ = err.ReleaseRead();
}

Subprocess::~Subprocess() {
  Kill();
  CloseOutputs();
}

Subprocess::WriteStatus Subprocess::Write(const std::string& data,
                                          std::chrono::steady_clock::time_point deadline) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (stdin_fd_ < 0) {
    return WriteStatus::kClosed;
  }
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
    if (n >= 0) {
      written += static_cast<std::size_t>(n);
      continue;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      return WriteStatus::kClosed;
    }

    // Pipe is full: wait for the child to drain it.
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return WriteStatus::kTimedOut;
    }
    pollfd fd{stdin_fd_, POLLOUT, 0};
    const int ready = ::poll(&fd, 1, static_cast<int>(remaining.count()));
    if (ready < 0 && errno != EINTR) {
      return WriteStatus::kClosed;
    }
    if (ready == 0) {
      return WriteStatus::kTimedOut;
    }
    if (ready > 0 && (fd.revents & (POLLERR | POLLHUP)) != 0) {
      return WriteStatus::kClosed;
    }
  }
  return WriteStatus::kWritten;
}

void Subprocess::CloseStdin() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  CloseFd(stdin_fd_);
}

bool Subprocess::IsRunning() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ <= 0 || reaped_) {
    return false;
  }
  int wait_status = 0;
  const pid_t result = ::waitpid(pid_, &wait_status, WNOHANG);
  if (result == pid_) {
    reaped_ = true;
    exit_status_ = wait_status;
    return false;
  }
  if (result < 0 && errno == ECHILD) {
    reaped_ = true;
    return false;
  }
  return result == 0;
}

void Subprocess::Kill() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0 && !reaped_) {
      // ESRCH just means the group already exited; nothing to report.
      ::kill(-pid_, SIGKILL);
      ::kill(pid_, SIGKILL);
      int wait_status = 0;
      pid_t result;
      do {
        result = ::waitpid(pid_, &wait_status, 0);
      } while (result < 0 && errno == EINTR);
      reaped_ = true;
      exit_status_ = wait_status;
    }
  }
  // The child is gone, so a writer blocked on a full pipe has been released.
  CloseStdin();
}

std::optional<int> Subprocess::ExitStatus() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!reaped_) {
    return std::nullopt;
  }
  return exit_status_;
}

void Subprocess::CloseOutputs() {
  std::lock_guard<std::mutex> lock(mutex_);
  CloseFd(stdout_fd_);
  CloseFd(stderr_fd_);
}

}  // namespace platform
