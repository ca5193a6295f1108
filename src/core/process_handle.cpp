#include "core/process_handle.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"
#include "core/logging.hpp"
#include "platform/subprocess.hpp"

namespace core::process {
namespace {

using Clock = std::chrono::steady_clock;

bool IsJsonObjectLine(const std::string& line) {
  const auto parsed = nlohmann::json::parse(line, nullptr, false);
  return !parsed.is_discarded() && parsed.is_object();
}

std::string Millis(std::chrono::milliseconds value) {
  return std::to_string(value.count()) + "ms";
}

std::string JoinCommand(const std::vector<std::string>& command) {
  std::string joined;
  for (const auto& part : command) {
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += part;
  }
  return joined;
}

}  // namespace

const char* ToString(ProcessState state) {
  switch (state) {
    case ProcessState::kSpawned:
      return "spawned";
    case ProcessState::kReady:
      return "ready";
    case ProcessState::kAwaitingResult:
      return "awaiting-result";
    case ProcessState::kTerminated:
      return "terminated";
  }
  return "unknown";
}

template <typename Error>
void ProcessHandle::Fail(const std::string& message) {
  Terminate();
  throw Error(message);
}

std::unique_ptr<ProcessHandle> ProcessHandle::Spawn(const ProcessOptions& options) {
  if (options.command.empty()) {
    throw SpawnError("No tool command configured");
  }
  std::unique_ptr<ProcessHandle> handle;
  try {
    auto process = std::make_unique<platform::Subprocess>(options.command);
    handle.reset(new ProcessHandle(options, std::move(process)));
  } catch (const std::exception& ex) {
    throw SpawnError("Failed to start tool '" + JoinCommand(options.command) + "': " + ex.what());
  }
  logging::LogDebug(handle->Label() + " spawned: " + JoinCommand(options.command));
  return handle;
}

ProcessHandle::ProcessHandle(ProcessOptions options, std::unique_ptr<platform::Subprocess> process)
    : options_(std::move(options)), process_(std::move(process)), pid_(process_->Pid()) {
  stdout_reader_ = std::make_unique<LineReader>(process_->StdoutFd(), Label() + " stdout");
  const std::string stderr_label = Label() + " stderr: ";
  stderr_reader_ = std::make_unique<LineReader>(
      process_->StderrFd(), Label() + " stderr",
      [stderr_label](const std::string& line) { logging::LogDebug(stderr_label + line); });
}

ProcessHandle::~ProcessHandle() { Terminate(); }

protocol::ToolDescriptionMessage ProcessHandle::Describe() {
  ExpectState(ProcessState::kSpawned, "describe");
  const auto deadline = Clock::now() + options_.describe_timeout;

  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() <= 0) {
      Fail<TimeoutError>("No tool description received within " +
                         Millis(options_.describe_timeout));
    }

    ReadResult next = stdout_reader_->Next(remaining);
    if (next.status == ReadStatus::kTimeout) {
      Fail<TimeoutError>("No tool description received within " +
                         Millis(options_.describe_timeout));
    }
    if (next.status == ReadStatus::kClosed) {
      Fail<ProtocolError>("Tool process closed its output before describing itself" +
                          ExitDetail());
    }
    if (options_.skip_startup_noise && !IsJsonObjectLine(next.line)) {
      logging::LogDebug(Label() + " skipping startup noise: " + next.line);
      continue;
    }

    protocol::Message message;
    try {
      message = protocol::Decode(next.line);
    } catch (const ProtocolError& ex) {
      Fail<ProtocolError>(std::string{"Invalid tool description: "} + ex.what());
    }
    auto* description = std::get_if<protocol::ToolDescriptionMessage>(&message);
    if (description == nullptr) {
      Fail<ProtocolError>(std::string{"Expected a tool-description as the first message, got '"} +
                          protocol::TypeName(message) + "'");
    }
    SetState(ProcessState::kReady);
    logging::LogDebug(Label() + " described " + std::to_string(description->tools.size()) +
                      " tool(s)");
    return std::move(*description);
  }
}

protocol::ToolResultMessage ProcessHandle::Call(const protocol::ToolCallMessage& call) {
  ExpectState(ProcessState::kReady, "call");

  // One deadline covers writing the call and reading the result.
  const auto deadline = Clock::now() + options_.call_timeout;
  SetState(ProcessState::kAwaitingResult);

  switch (process_->Write(protocol::Encode(call), deadline)) {
    case platform::Subprocess::WriteStatus::kWritten:
      break;
    case platform::Subprocess::WriteStatus::kClosed:
      Fail<ProtocolError>("Tool process closed its input" + ExitDetail());
    case platform::Subprocess::WriteStatus::kTimedOut:
      Fail<TimeoutError>("Tool '" + call.tool + "' did not accept its input within " +
                         Millis(options_.call_timeout));
  }

  const auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  ReadResult next = stdout_reader_->Next(std::max(remaining, std::chrono::milliseconds(0)));
  if (next.status == ReadStatus::kTimeout) {
    Fail<TimeoutError>("Tool '" + call.tool + "' did not answer within " +
                       Millis(options_.call_timeout));
  }
  if (next.status == ReadStatus::kClosed) {
    Fail<ProtocolError>(stdout_reader_->Overflowed()
                            ? std::string{"Tool response exceeded the maximum line length"}
                            : "Tool process exited before answering" + ExitDetail());
  }

  protocol::Message message;
  try {
    message = protocol::Decode(next.line);
  } catch (const ProtocolError& ex) {
    Fail<ProtocolError>(std::string{"Invalid response from tool: "} + ex.what());
  }

  if (auto* result = std::get_if<protocol::ToolResultMessage>(&message)) {
    SetState(ProcessState::kReady);
    return std::move(*result);
  }
  if (auto* error = std::get_if<protocol::ErrorMessage>(&message)) {
    Fail<ToolError>(error->error);
  }
  Fail<ProtocolError>(std::string{"Unexpected '"} + protocol::TypeName(message) +
                      "' message while awaiting a tool-result");
}

void ProcessHandle::Terminate() noexcept {
  std::lock_guard<std::mutex> lock(terminate_mutex_);
  if (terminated_) {
    return;
  }
  terminated_ = true;
  try {
    process_->Kill();
    stdout_reader_->Stop();
    stderr_reader_->Stop();
    process_->CloseOutputs();
  } catch (const std::exception& ex) {
    logging::LogWarn(Label() + " teardown error: " + ex.what());
  }
  SetState(ProcessState::kTerminated);
  logging::LogDebug(Label() + " terminated");
}

std::size_t ProcessHandle::DiscardBuffered() { return stdout_reader_->Discard(); }

bool ProcessHandle::IsAlive() {
  return State() != ProcessState::kTerminated && process_->IsRunning() &&
         !stdout_reader_->Closed();
}

ProcessState ProcessHandle::State() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

void ProcessHandle::SetState(ProcessState state) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  state_ = state;
}

void ProcessHandle::ExpectState(ProcessState expected, const char* operation) const {
  const ProcessState actual = State();
  if (actual != expected) {
    throw ProtocolError(std::string{"Cannot "} + operation + " a tool process in state '" +
                        ToString(actual) + "'");
  }
}

std::string ProcessHandle::Label() const { return "[tool pid " + std::to_string(pid_) + "]"; }

std::string ProcessHandle::ExitDetail() {
  process_->IsRunning();
  const auto status = process_->ExitStatus();
  if (!status) {
    return {};
  }
  if (WIFEXITED(*status)) {
    return " (exit code " + std::to_string(WEXITSTATUS(*status)) + ")";
  }
  if (WIFSIGNALED(*status)) {
    return " (killed by signal " + std::to_string(WTERMSIG(*status)) + ")";
  }
  return {};
}

}  // namespace core::process
