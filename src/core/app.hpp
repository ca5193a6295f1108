#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/logging.hpp"
#include "core/process_strategy.hpp"
#include "core/schema_registry.hpp"
#include "platform/http_server.hpp"

namespace core {

struct BridgeConfig {
  std::string host = "127.0.0.1";
  int port = 5001;
  std::string server_path;
  std::string interpreter;
  std::vector<std::string> tool_args;
  process::StrategyKind strategy = process::StrategyKind::kSpawnPerCall;
  std::size_t pool_size = 4;
  std::chrono::milliseconds describe_timeout{5000};
  std::chrono::milliseconds call_timeout{30000};
  bool skip_startup_noise = false;
  bool strict_schemas = false;
  std::size_t worker_threads = 8;
  std::optional<logging::LogLevel> log_level;
  bool show_help = false;

  // interpreter (if any), server_path, then tool_args.
  std::vector<std::string> ToolCommand() const;
  process::ProcessOptions ToProcessOptions() const;
};

// Defaults, then TOOL_BRIDGE_* environment variables, then command-line
// flags. Throws std::invalid_argument for unknown flags, bad flag values or a
// missing tool path.
BridgeConfig LoadBridgeConfig(int argc, const char* const* argv);
std::string BridgeUsage(const std::string& program);

// One bridge in front of one tool command. Discovery runs in the constructor;
// nothing here is global, so several bridges can live in one process.
class BridgeServer {
 public:
  explicit BridgeServer(BridgeConfig config);
  ~BridgeServer();

  BridgeServer(const BridgeServer&) = delete;
  BridgeServer& operator=(const BridgeServer&) = delete;

  // Blocks serving requests until Stop().
  void Start();
  void Stop();
  bool IsRunning() const;

  const BridgeConfig& Config() const { return config_; }
  const schema::SchemaRegistry& Registry() const { return registry_; }
  process::ProcessStrategy& Strategy() { return *strategy_; }

 private:
  BridgeConfig config_;
  schema::SchemaRegistry registry_;
  std::unique_ptr<process::ProcessStrategy> strategy_;
  platform::HttpServer server_;
};

}  // namespace core
