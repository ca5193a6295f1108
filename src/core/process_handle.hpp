#pragma once

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/line_reader.hpp"
#include "core/protocol.hpp"

namespace platform {
class Subprocess;
}  // namespace platform

namespace core::process {

enum class ProcessState { kSpawned = 0, kReady, kAwaitingResult, kTerminated };

const char* ToString(ProcessState state);

struct ProcessOptions {
  // argv of the tool; the first element is resolved through PATH.
  std::vector<std::string> command;
  std::chrono::milliseconds describe_timeout{5000};
  std::chrono::milliseconds call_timeout{30000};
  // Skip lines that are not JSON objects while waiting for the description.
  bool skip_startup_noise = false;
};

// One live tool subprocess and everything attached to it. The stdout reader
// is attached before Spawn() returns so the first line is never lost.
class ProcessHandle {
 public:
  // Throws SpawnError if the command cannot be started.
  static std::unique_ptr<ProcessHandle> Spawn(const ProcessOptions& options);

  ~ProcessHandle();

  ProcessHandle(const ProcessHandle&) = delete;
  ProcessHandle& operator=(const ProcessHandle&) = delete;

  // Reads the first protocol line. Throws ProtocolError or TimeoutError and
  // terminates the process on any failure.
  protocol::ToolDescriptionMessage Describe();

  // Writes one tool-call and waits for its answer. Throws ToolError,
  // ProtocolError or TimeoutError; only a tool-result keeps the process alive.
  protocol::ToolResultMessage Call(const protocol::ToolCallMessage& call);

  // Kills the process group and releases pipes and reader threads. Never
  // throws and may be called any number of times.
  void Terminate() noexcept;

  std::size_t DiscardBuffered();
  bool IsAlive();

  ProcessState State() const;
  pid_t Pid() const { return pid_; }

 private:
  ProcessHandle(ProcessOptions options, std::unique_ptr<platform::Subprocess> process);

  void SetState(ProcessState state);
  void ExpectState(ProcessState expected, const char* operation) const;
  template <typename Error>
  [[noreturn]] void Fail(const std::string& message);
  std::string Label() const;
  std::string ExitDetail();

  ProcessOptions options_;
  std::unique_ptr<platform::Subprocess> process_;
  pid_t pid_;
  std::unique_ptr<LineReader> stdout_reader_;
  std::unique_ptr<LineReader> stderr_reader_;

  mutable std::mutex state_mutex_;
  ProcessState state_ = ProcessState::kSpawned;
  std::mutex terminate_mutex_;
  bool terminated_ = false;
};

}  // namespace core::process
