#include "core/app.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/router.hpp"

namespace core {
namespace {

using core::logging::LogInfo;
using core::logging::LogWarn;

enum class ApplyResult { kApplied = 0, kInvalidValue, kUnknownKey };

struct EnvBinding {
  const char* env;
  const char* key;
};

const EnvBinding kEnvBindings[] = {
    {"TOOL_BRIDGE_HOST", "host"},
    {"TOOL_BRIDGE_PORT", "port"},
    {"TOOL_BRIDGE_SERVER_PATH", "server-path"},
    {"TOOL_BRIDGE_INTERPRETER", "interpreter"},
    {"TOOL_BRIDGE_TOOL_ARGS", "tool-args"},
    {"TOOL_BRIDGE_STRATEGY", "strategy"},
    {"TOOL_BRIDGE_POOL_SIZE", "pool-size"},
    {"TOOL_BRIDGE_DESCRIBE_TIMEOUT_MS", "describe-timeout-ms"},
    {"TOOL_BRIDGE_CALL_TIMEOUT_MS", "call-timeout-ms"},
    {"TOOL_BRIDGE_SKIP_STARTUP_NOISE", "skip-startup-noise"},
    {"TOOL_BRIDGE_STRICT_SCHEMAS", "strict-schemas"},
    {"TOOL_BRIDGE_WORKERS", "workers"},
};

std::string Lowercase(std::string value) {
  for (auto& ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

std::optional<long long> ParseInteger(const std::string& value, long long min, long long max) {
  try {
    std::size_t consumed = 0;
    const long long parsed = std::stoll(value, &consumed);
    if (consumed != value.size() || parsed < min || parsed > max) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<bool> ParseBool(const std::string& value) {
  const std::string lowered = Lowercase(value);
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    return false;
  }
  return std::nullopt;
}

std::optional<process::StrategyKind> ParseStrategy(const std::string& value) {
  const std::string lowered = Lowercase(value);
  if (lowered == "spawn" || lowered == "spawn-per-call") {
    return process::StrategyKind::kSpawnPerCall;
  }
  if (lowered == "pool" || lowered == "pooled") {
    return process::StrategyKind::kPooled;
  }
  return std::nullopt;
}

std::vector<std::string> SplitWhitespace(const std::string& value) {
  std::istringstream stream(value);
  std::vector<std::string> parts;
  std::string part;
  while (stream >> part) {
    parts.push_back(part);
  }
  return parts;
}

bool IsBooleanKey(const std::string& key) {
  return key == "skip-startup-noise" || key == "strict-schemas";
}

ApplyResult ApplySetting(BridgeConfig& config, const std::string& key, const std::string& value) {
  if (key == "host") {
    if (value.empty()) {
      return ApplyResult::kInvalidValue;
    }
    config.host = value;
  } else if (key == "port") {
    const auto port = ParseInteger(value, 1, 65535);
    if (!port) {
      return ApplyResult::kInvalidValue;
    }
    config.port = static_cast<int>(*port);
  } else if (key == "server-path") {
    config.server_path = value;
  } else if (key == "interpreter") {
    config.interpreter = value;
  } else if (key == "tool-args") {
    for (auto& arg : SplitWhitespace(value)) {
      config.tool_args.push_back(std::move(arg));
    }
  } else if (key == "tool-arg") {
    config.tool_args.push_back(value);
  } else if (key == "strategy") {
    const auto strategy = ParseStrategy(value);
    if (!strategy) {
      return ApplyResult::kInvalidValue;
    }
    config.strategy = *strategy;
  } else if (key == "pool-size") {
    const auto size = ParseInteger(value, 1, 1024);
    if (!size) {
      return ApplyResult::kInvalidValue;
    }
    config.pool_size = static_cast<std::size_t>(*size);
  } else if (key == "describe-timeout-ms" || key == "call-timeout-ms") {
    const auto millis = ParseInteger(value, 1, 24LL * 60 * 60 * 1000);
    if (!millis) {
      return ApplyResult::kInvalidValue;
    }
    (key == "describe-timeout-ms" ? config.describe_timeout : config.call_timeout) =
        std::chrono::milliseconds(*millis);
  } else if (key == "skip-startup-noise" || key == "strict-schemas") {
    const auto flag = ParseBool(value);
    if (!flag) {
      return ApplyResult::kInvalidValue;
    }
    (key == "skip-startup-noise" ? config.skip_startup_noise : config.strict_schemas) = *flag;
  } else if (key == "workers") {
    const auto workers = ParseInteger(value, 1, 1024);
    if (!workers) {
      return ApplyResult::kInvalidValue;
    }
    config.worker_threads = static_cast<std::size_t>(*workers);
  } else if (key == "log-level") {
    const auto level = logging::ParseLogLevel(value);
    if (!level) {
      return ApplyResult::kInvalidValue;
    }
    config.log_level = *level;
  } else {
    return ApplyResult::kUnknownKey;
  }
  return ApplyResult::kApplied;
}

void ApplyEnvironment(BridgeConfig& config) {
  for (const auto& binding : kEnvBindings) {
    const char* value = std::getenv(binding.env);
    if (value == nullptr) {
      continue;
    }
    if (ApplySetting(config, binding.key, value) != ApplyResult::kApplied) {
      LogWarn(std::string{"Ignoring invalid value for "} + binding.env + ": '" + value + "'");
    }
  }
}

void ApplyFlags(BridgeConfig& config, int argc, const char* const* argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--") {
      for (++i; i < argc; ++i) {
        config.tool_args.emplace_back(argv[i]);
      }
      break;
    }
    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
      continue;
    }
    if (arg.rfind("--", 0) != 0) {
      if (!config.server_path.empty() && config.server_path != arg) {
        throw std::invalid_argument("Unexpected argument: " + arg);
      }
      config.server_path = arg;
      continue;
    }

    std::string key = arg.substr(2);
    std::string value;
    if (const auto eq = key.find('='); eq != std::string::npos) {
      value = key.substr(eq + 1);
      key.resize(eq);
    } else if (IsBooleanKey(key)) {
      value = "true";
    } else if (i + 1 < argc) {
      value = argv[++i];
    } else {
      throw std::invalid_argument("Flag --" + key + " requires a value");
    }

    switch (ApplySetting(config, key, value)) {
      case ApplyResult::kApplied:
        break;
      case ApplyResult::kInvalidValue:
        throw std::invalid_argument("Invalid value for --" + key + ": '" + value + "'");
      case ApplyResult::kUnknownKey:
        throw std::invalid_argument("Unknown flag: --" + key);
    }
  }
}

}  // namespace

std::vector<std::string> BridgeConfig::ToolCommand() const {
  std::vector<std::string> command;
  if (!interpreter.empty()) {
    command.push_back(interpreter);
  }
  command.push_back(server_path);
  command.insert(command.end(), tool_args.begin(), tool_args.end());
  return command;
}

process::ProcessOptions BridgeConfig::ToProcessOptions() const {
  process::ProcessOptions options;
  options.command = ToolCommand();
  options.describe_timeout = describe_timeout;
  options.call_timeout = call_timeout;
  options.skip_startup_noise = skip_startup_noise;
  return options;
}

BridgeConfig LoadBridgeConfig(int argc, const char* const* argv) {
  BridgeConfig config;
  ApplyEnvironment(config);
  ApplyFlags(config, argc, argv);
  if (!config.show_help && config.server_path.empty()) {
    throw std::invalid_argument(
        "A tool path is required (--server-path or TOOL_BRIDGE_SERVER_PATH)");
  }
  return config;
}

std::string BridgeUsage(const std::string& program) {
  return "Usage: " + program +
         " --server-path=PATH [options] [-- TOOL_ARGS...]\n"
         "\n"
         "Options:\n"
         "  --host=HOST                 address to bind (default 127.0.0.1)\n"
         "  --port=PORT                 port to bind (default 5001)\n"
         "  --interpreter=PROGRAM       run the tool through PROGRAM, e.g. python3\n"
         "  --tool-arg=ARG              extra argument for the tool (repeatable)\n"
         "  --strategy=spawn|pool       process per call or pooled processes\n"
         "  --pool-size=N               maximum pooled processes (default 4)\n"
         "  --describe-timeout-ms=MS    wait for the tool description (default 5000)\n"
         "  --call-timeout-ms=MS        wait for a tool result (default 30000)\n"
         "  --skip-startup-noise        ignore non-JSON lines before the description\n"
         "  --strict-schemas            fail startup on any unsupported tool schema\n"
         "  --workers=N                 HTTP worker threads (default 8)\n"
         "  --log-level=LEVEL           error, warn, info or debug\n"
         "\n"
         "Every option can also be set through TOOL_BRIDGE_<OPTION> environment variables.\n";
}

BridgeServer::BridgeServer(BridgeConfig config)
    : config_(std::move(config)),
      registry_(schema::SchemaRegistry::Discover(config_.ToProcessOptions(),
                                                 config_.strict_schemas)),
      strategy_(process::MakeStrategy(config_.strategy, config_.ToProcessOptions(),
                                      config_.pool_size)) {
  server_.SetWorkerCount(config_.worker_threads);
  ConfigureBridgeRoutes(server_, registry_, *strategy_);
}

BridgeServer::~BridgeServer() {
  server_.Stop();
  strategy_->Shutdown();
}

void BridgeServer::Start() {
  LogInfo("Bridge for '" + config_.server_path + "' listening on " + config_.host + ":" +
          std::to_string(config_.port) + " with " +
          std::to_string(registry_.Tools().size()) + " tool(s), strategy=" +
          process::ToString(strategy_->Kind()));
  server_.Start(config_.host, config_.port);
}

void BridgeServer::Stop() {
  server_.Stop();
  strategy_->Shutdown();
}

bool BridgeServer::IsRunning() const { return server_.IsRunning(); }

}  // namespace core
