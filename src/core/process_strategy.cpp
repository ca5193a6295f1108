#include "core/process_strategy.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"
#include "core/logging.hpp"

namespace core::process {

const char* ToString(StrategyKind kind) {
  switch (kind) {
    case StrategyKind::kSpawnPerCall:
      return "spawn";
    case StrategyKind::kPooled:
      return "pool";
  }
  return "unknown";
}

SpawnPerCallStrategy::SpawnPerCallStrategy(ProcessOptions options) : options_(std::move(options)) {}

protocol::ToolResultMessage SpawnPerCallStrategy::Call(const protocol::ToolCallMessage& call) {
  auto handle = ProcessHandle::Spawn(options_);
  handle->Describe();
  auto result = handle->Call(call);
  handle->Terminate();
  return result;
}

PooledStrategy::PooledStrategy(ProcessOptions options, std::size_t max_size)
    : options_(std::move(options)), max_size_(max_size) {
  if (max_size_ == 0) {
    throw std::invalid_argument("Process pool size must be at least 1");
  }
}

PooledStrategy::~PooledStrategy() { Shutdown(); }

protocol::ToolResultMessage PooledStrategy::Call(const protocol::ToolCallMessage& call) {
  auto handle = Checkout();
  protocol::ToolResultMessage result;
  try {
    result = handle->Call(call);
  } catch (...) {
    Discard(std::move(handle));
    throw;
  }
  Checkin(std::move(handle));
  return result;
}

void PooledStrategy::Shutdown() {
  std::vector<std::unique_ptr<ProcessHandle>> idle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shut_down_ = true;
    idle.swap(idle_);
    live_ -= idle.size();
  }
  available_.notify_all();
  for (auto& handle : idle) {
    handle->Terminate();
  }
}

std::size_t PooledStrategy::IdleCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

std::size_t PooledStrategy::LiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_;
}

std::vector<pid_t> PooledStrategy::IdlePids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<pid_t> pids;
  for (const auto& handle : idle_) {
    pids.push_back(handle->Pid());
  }
  return pids;
}

std::unique_ptr<ProcessHandle> PooledStrategy::Checkout() {
  const auto deadline = std::chrono::steady_clock::now() + options_.call_timeout;
  std::unique_lock<std::mutex> lock(mutex_);

  while (true) {
    if (shut_down_) {
      throw SpawnError("Process pool has been shut down");
    }

    while (!idle_.empty()) {
      auto handle = std::move(idle_.front());
      idle_.erase(idle_.begin());
      if (handle->IsAlive()) {
        if (const auto dropped = handle->DiscardBuffered(); dropped > 0) {
          logging::LogWarn("Discarded " + std::to_string(dropped) +
                           " stale line(s) from pooled tool pid " + std::to_string(handle->Pid()));
        }
        return handle;
      }
      logging::LogInfo("Replacing exited pooled tool pid " + std::to_string(handle->Pid()));
      --live_;
      handle->Terminate();
    }

    if (live_ < max_size_) {
      ++live_;
      break;
    }

    const bool ready = available_.wait_until(
        lock, deadline, [this] { return shut_down_ || !idle_.empty() || live_ < max_size_; });
    if (!ready) {
      throw TimeoutError("No pooled tool process became available within " +
                         std::to_string(options_.call_timeout.count()) + "ms");
    }
  }
  lock.unlock();

  try {
    auto handle = ProcessHandle::Spawn(options_);
    handle->Describe();
    logging::LogDebug("Pool started tool pid " + std::to_string(handle->Pid()));
    return handle;
  } catch (...) {
    {
      std::lock_guard<std::mutex> relock(mutex_);
      --live_;
    }
    available_.notify_one();
    throw;
  }
}

void PooledStrategy::Checkin(std::unique_ptr<ProcessHandle> handle) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!shut_down_ && handle->State() == ProcessState::kReady) {
      idle_.push_back(std::move(handle));
      available_.notify_one();
      return;
    }
  }
  Discard(std::move(handle));
}

void PooledStrategy::Discard(std::unique_ptr<ProcessHandle> handle) {
  handle->Terminate();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --live_;
  }
  available_.notify_one();
}

std::unique_ptr<ProcessStrategy> MakeStrategy(StrategyKind kind, ProcessOptions options,
                                              std::size_t pool_size) {
  if (kind == StrategyKind::kPooled) {
    return std::make_unique<PooledStrategy>(std::move(options), pool_size);
  }
  return std::make_unique<SpawnPerCallStrategy>(std::move(options));
}

}  // namespace core::process
