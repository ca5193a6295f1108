#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace core {

enum class ReadStatus { kLine = 0, kTimeout, kClosed };

struct ReadResult {
  ReadStatus status = ReadStatus::kTimeout;
  std::string line;
};

// Drains one file descriptor on a dedicated thread, splitting the stream into
// newline-terminated lines. Lines are either queued in arrival order for
// Next() or handed to a sink callback as they arrive.
class LineReader {
 public:
  using LineSink = std::function<void(const std::string&)>;

  static constexpr std::size_t kMaxLineBytes = 16 * 1024 * 1024;

  LineReader(int fd, std::string name);
  LineReader(int fd, std::string name, LineSink sink);
  ~LineReader();

  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  // Blocks until a line is available, the stream has ended and the queue is
  // drained (kClosed), or `timeout` expires (kTimeout).
  ReadResult Next(std::chrono::milliseconds timeout);

  // Drops every queued line; returns how many were dropped.
  std::size_t Discard();

  bool Closed() const;
  // True when the stream was abandoned because a line exceeded kMaxLineBytes.
  bool Overflowed() const;

  // Wakes the reader thread and joins it. Idempotent.
  void Stop();

 private:
  void Run();
  void Deliver(std::string line);
  void MarkClosed();

  int fd_;
  std::string name_;
  LineSink sink_;
  int wake_read_fd_ = -1;
  int wake_write_fd_ = -1;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> lines_;
  bool closed_ = false;
  bool overflowed_ = false;

  std::mutex stop_mutex_;
  std::thread thread_;
};

}  // namespace core
