#include "core/line_reader.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

#include "core/logging.hpp"

namespace core {

LineReader::LineReader(int fd, std::string name) : LineReader(fd, std::move(name), nullptr) {}

LineReader::LineReader(int fd, std::string name, LineSink sink)
    : fd_(fd), name_(std::move(name)), sink_(std::move(sink)) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe2");
  }
  wake_read_fd_ = fds[0];
  wake_write_fd_ = fds[1];
  thread_ = std::thread([this] { Run(); });
}

LineReader::~LineReader() {
  Stop();
  ::close(wake_read_fd_);
  ::close(wake_write_fd_);
}

ReadResult LineReader::Next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return !lines_.empty() || closed_; });
  ReadResult result;
  if (!lines_.empty()) {
    result.status = ReadStatus::kLine;
    result.line = std::move(lines_.front());
    lines_.pop_front();
  } else if (closed_) {
    result.status = ReadStatus::kClosed;
  } else {
    result.status = ReadStatus::kTimeout;
  }
  return result;
}

std::size_t LineReader::Discard() {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t dropped = lines_.size();
  lines_.clear();
  return dropped;
}

bool LineReader::Closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

bool LineReader::Overflowed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return overflowed_;
}

void LineReader::Stop() {
  std::lock_guard<std::mutex> lock(stop_mutex_);
  if (!thread_.joinable()) {
    return;
  }
  const char wake = 1;
  // A full wake pipe still leaves it readable, which is all the reader needs.
  (void)!::write(wake_write_fd_, &wake, 1);
  thread_.join();
}

void LineReader::Run() {
  std::string pending;
  char buffer[4096];
  bool overflow = false;

  while (true) {
    pollfd fds[2] = {{fd_, POLLIN, 0}, {wake_read_fd_, POLLIN, 0}};
    const int ready = ::poll(fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      logging::LogWarn("[" + name_ + "] poll failed: " + std::system_category().message(errno));
      break;
    }
    if (fds[1].revents != 0) {
      break;
    }
    if (fds[0].revents == 0) {
      continue;
    }

    const ssize_t n = ::read(fd_, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }

    const std::size_t scan_from = pending.size();
    pending.append(buffer, static_cast<std::size_t>(n));
    std::size_t start = 0;
    for (std::size_t pos = pending.find('\n', scan_from); pos != std::string::npos;
         pos = pending.find('\n', start)) {
      std::string line = pending.substr(start, pos - start);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      Deliver(std::move(line));
      start = pos + 1;
    }
    pending.erase(0, start);

    if (pending.size() > kMaxLineBytes) {
      logging::LogWarn("[" + name_ + "] line exceeds " + std::to_string(kMaxLineBytes) +
                       " bytes, abandoning stream");
      overflow = true;
      pending.clear();
      break;
    }
  }

  if (!pending.empty()) {
    if (pending.back() == '\r') {
      pending.pop_back();
    }
    Deliver(std::move(pending));
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    overflowed_ = overflow;
  }
  MarkClosed();
}

void LineReader::Deliver(std::string line) {
  if (sink_) {
    sink_(line);
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
  }
  cv_.notify_all();
}

void LineReader::MarkClosed() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

}  // namespace core
