#include <chrono>
#include <exception>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/app.hpp"
#include "core/errors.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"
#include "test_support.hpp"

namespace {

using core::BridgeConfig;
using core::BridgeServer;
using nlohmann::json;
using test::Assert;

BridgeConfig MakeConfig(const std::vector<std::string>& command, int port) {
  BridgeConfig config;
  config.port = port;
  config.server_path = command.front();
  config.tool_args.assign(command.begin() + 1, command.end());
  config.describe_timeout = std::chrono::milliseconds(3000);
  config.call_timeout = std::chrono::milliseconds(3000);
  config.worker_threads = 4;
  return config;
}

// Runs a BridgeServer on a background thread for the lifetime of the object.
class RunningBridge {
 public:
  explicit RunningBridge(BridgeConfig config) : bridge_(std::move(config)) {
    worker_ = std::thread([this] {
      try {
        bridge_.Start();
      } catch (const std::exception& ex) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = ex.what();
      }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  ~RunningBridge() {
    bridge_.Stop();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  RunningBridge(const RunningBridge&) = delete;
  RunningBridge& operator=(const RunningBridge&) = delete;

  platform::HttpClient Client() const {
    return platform::HttpClient("127.0.0.1", bridge_.Config().port);
  }

  BridgeServer& Bridge() { return bridge_; }

  void CheckStarted() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!error_.empty()) {
      throw std::runtime_error("Bridge failed to start: " + error_);
    }
  }

 private:
  BridgeServer bridge_;
  std::thread worker_;
  std::mutex mutex_;
  std::string error_;
};

void TestDemoToolEndToEnd() {
  RunningBridge running(MakeConfig(test::DemoToolCommand(), 18481));
  running.CheckStarted();
  Assert(running.Bridge().IsRunning(), "Bridge must report running");
  const auto client = running.Client();

  const auto echo = client.Post("/echo", R"({"msg":"hi"})");
  Assert(echo.status == 200, "POST /echo must return 200");
  Assert(json::parse(echo.body) == json({{"msg", "hi"}}), "Echo must return its input");

  const auto invalid = client.Post("/echo", R"({"msg":42})");
  Assert(invalid.status == 422, "Non-string field must return 422");
  const auto missing = client.Post("/get-forecast", "{}");
  Assert(missing.status == 422, "Missing field must return 422");
  Assert(json::parse(missing.body).at("fields").at(0).at("field") == "location",
         "422 must name the missing field");

  auto forecast = std::async(std::launch::async, [&client] {
    return client.Post("/get-forecast", R"({"location":"Paris"})");
  });
  auto time = std::async(std::launch::async, [&client] {
    return client.Post("/get-time", R"({"location":"Tokyo"})");
  });
  const auto forecast_response = forecast.get();
  const auto time_response = time.get();
  Assert(forecast_response.status == 200 && time_response.status == 200,
         "Concurrent calls must both succeed");
  Assert(json::parse(forecast_response.body).at("location") == "Paris",
         "Forecast must answer for Paris");
  Assert(json::parse(time_response.body).at("location") == "Tokyo", "Time must answer for Tokyo");

  const auto tools = json::parse(client.Get("/_bridge/tools").body);
  Assert(tools.at("tools").size() == 3, "Demo bridge lists three tools");
  const auto health = json::parse(client.Get("/_bridge/health").body);
  Assert(health.at("strategy") == "spawn", "Default strategy is spawn-per-call");

  const auto preflight = client.Options("/echo");
  Assert(preflight.status == 204, "OPTIONS must return 204");
}

void TestToolErrorMapsTo500() {
  RunningBridge running(MakeConfig(test::MisbehavingToolCommand("error"), 18482));
  running.CheckStarted();
  const auto response = running.Client().Post("/echo", R"({"msg":"x"})");
  Assert(response.status == 500, "Tool error must return 500");
  const json body = json::parse(response.body);
  Assert(body.at("error") == "boom" && body.at("kind") == "tool_error",
         "500 body must carry the tool's message");
}

void TestUndecodableReplyStillDescribesTheFailure() {
  RunningBridge running(MakeConfig(test::MisbehavingToolCommand("latin1"), 18488));
  running.CheckStarted();
  const auto response = running.Client().Post("/echo", R"({"msg":"x"})");
  Assert(response.status == 500, "Undecodable reply must return 500");
  const json body = json::parse(response.body);
  Assert(body.at("kind") == "protocol_error", "Body must carry the protocol error kind");
  Assert(body.at("error").get<std::string>().find("Invalid response from tool") != std::string::npos,
         "Body must describe the failure");
  Assert(response.headers.count("Access-Control-Allow-Origin") == 1,
         "Failure response must keep the CORS headers");
}

void TestUnsupportedToolsAreSkipped() {
  RunningBridge running(MakeConfig(test::MisbehavingToolCommand("integer-schema"), 18483));
  running.CheckStarted();
  const auto client = running.Client();
  Assert(client.Post("/add", R"({"a":"1","b":"2"})").status == 404,
         "Tool with an integer field must not be served");
  Assert(client.Post("/echo", R"({"msg":"still here"})").status == 200,
         "Supported tools keep working");
  const auto tools = json::parse(client.Get("/_bridge/tools").body);
  Assert(tools.at("rejected").at(0).at("name") == "add", "Rejected tool must be listed");
}

void TestPooledBridge() {
  auto config = MakeConfig(test::MisbehavingToolCommand("pid"), 18484);
  config.strategy = core::process::StrategyKind::kPooled;
  config.pool_size = 1;
  RunningBridge running(std::move(config));
  running.CheckStarted();
  const auto client = running.Client();

  const auto first = json::parse(client.Post("/echo", R"({"msg":"a"})").body);
  const auto second = json::parse(client.Post("/echo", R"({"msg":"b"})").body);
  Assert(first.at("pid") == second.at("pid"), "Pooled bridge must reuse its process");
  const auto health = json::parse(client.Get("/_bridge/health").body);
  Assert(health.at("strategy") == "pool", "Health must report the pool strategy");
}

void TestStartupFailures() {
  test::ExpectThrows<core::SpawnError>(
      [] { BridgeServer bridge(MakeConfig({"/nonexistent/tool-bridge-tool"}, 18485)); },
      "/nonexistent/tool-bridge-tool", "missing tool");

  auto strict = MakeConfig(test::MisbehavingToolCommand("integer-schema"), 18486);
  strict.strict_schemas = true;
  test::ExpectThrows<core::SchemaError>([&strict] { BridgeServer bridge(strict); }, "integer",
                                        "strict schemas");

  auto silent = MakeConfig(test::MisbehavingToolCommand("silent"), 18487);
  silent.describe_timeout = std::chrono::milliseconds(300);
  test::ExpectThrows<core::TimeoutError>([&silent] { BridgeServer bridge(silent); }, "300ms",
                                         "silent tool");
}

}  // namespace

int main() {
  try {
    TestDemoToolEndToEnd();
    TestToolErrorMapsTo500();
    TestUndecodableReplyStillDescribesTheFailure();
    TestUnsupportedToolsAreSkipped();
    TestPooledBridge();
    TestStartupFailures();
  } catch (const std::exception& ex) {
    std::cerr << "bridge_server_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
