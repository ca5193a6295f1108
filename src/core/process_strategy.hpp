#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/process_handle.hpp"
#include "core/protocol.hpp"

namespace core::process {

enum class StrategyKind { kSpawnPerCall = 0, kPooled };

const char* ToString(StrategyKind kind);

// Runs one call/result cycle against some tool process. Implementations must
// be safe to call from many request threads at once.
class ProcessStrategy {
 public:
  virtual ~ProcessStrategy() = default;

  virtual protocol::ToolResultMessage Call(const protocol::ToolCallMessage& call) = 0;
  virtual void Shutdown() {}
  virtual StrategyKind Kind() const = 0;
};

// Fresh process per call: spawn, describe, call, terminate.
class SpawnPerCallStrategy final : public ProcessStrategy {
 public:
  explicit SpawnPerCallStrategy(ProcessOptions options);

  protocol::ToolResultMessage Call(const protocol::ToolCallMessage& call) override;
  StrategyKind Kind() const override { return StrategyKind::kSpawnPerCall; }

 private:
  ProcessOptions options_;
};

// Keeps up to `max_size` described processes alive and hands each one to a
// single call at a time.
class PooledStrategy final : public ProcessStrategy {
 public:
  PooledStrategy(ProcessOptions options, std::size_t max_size);
  ~PooledStrategy() override;

  protocol::ToolResultMessage Call(const protocol::ToolCallMessage& call) override;
  void Shutdown() override;
  StrategyKind Kind() const override { return StrategyKind::kPooled; }

  std::size_t IdleCount() const;
  std::size_t LiveCount() const;
  // Pids of the idle processes, oldest first.
  std::vector<pid_t> IdlePids() const;

 private:
  std::unique_ptr<ProcessHandle> Checkout();
  void Checkin(std::unique_ptr<ProcessHandle> handle);
  void Discard(std::unique_ptr<ProcessHandle> handle);

  ProcessOptions options_;
  std::size_t max_size_;

  mutable std::mutex mutex_;
  std::condition_variable available_;
  std::vector<std::unique_ptr<ProcessHandle>> idle_;
  std::size_t live_ = 0;
  bool shut_down_ = false;
};

std::unique_ptr<ProcessStrategy> MakeStrategy(StrategyKind kind, ProcessOptions options,
                                              std::size_t pool_size);

}  // namespace core::process
