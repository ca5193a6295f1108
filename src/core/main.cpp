#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "core/app.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

namespace {

// Turns SIGINT/SIGTERM into BridgeServer::Stop(). The signals must be blocked
// before any other thread exists so that only this thread receives them.
class ShutdownOnSignal {
 public:
  explicit ShutdownOnSignal(core::BridgeServer& server) {
    thread_ = std::thread([this, &server] {
      int signal_number = 0;
      if (sigwait(&Signals(), &signal_number) == 0 && !released_) {
        core::logging::LogInfo("Received signal " + std::to_string(signal_number) +
                               ", shutting down");
        server.Stop();
      }
    });
  }

  ~ShutdownOnSignal() {
    released_ = true;
    pthread_kill(thread_.native_handle(), SIGTERM);
    thread_.join();
  }

  ShutdownOnSignal(const ShutdownOnSignal&) = delete;
  ShutdownOnSignal& operator=(const ShutdownOnSignal&) = delete;

  static const sigset_t& Signals() {
    static const sigset_t signals = [] {
      sigset_t set;
      sigemptyset(&set);
      sigaddset(&set, SIGINT);
      sigaddset(&set, SIGTERM);
      return set;
    }();
    return signals;
  }

  static void BlockInCallingThread() { pthread_sigmask(SIG_BLOCK, &Signals(), nullptr); }

 private:
  std::atomic<bool> released_{false};
  std::thread thread_;
};

}  // namespace

int main(int argc, char** argv) {
  core::logging::InitializeFromEnvironment();
  const std::string program = argc > 0 ? argv[0] : "tool_bridge";

  core::BridgeConfig config;
  try {
    config = core::LoadBridgeConfig(argc, argv);
  } catch (const std::invalid_argument& ex) {
    std::cerr << ex.what() << "\n\n" << core::BridgeUsage(program);
    return 2;
  }
  if (config.show_help) {
    std::cout << core::BridgeUsage(program);
    return 0;
  }
  if (config.log_level) {
    core::logging::SetLogLevel(*config.log_level);
  }

  ShutdownOnSignal::BlockInCallingThread();

  try {
    core::logging::LogInfo("Discovering tools from " + config.server_path);
    core::BridgeServer server(config);
    ShutdownOnSignal shutdown(server);
    server.Start();
  } catch (const core::BridgeError& ex) {
    core::logging::LogError(std::string{"Bridge startup failed ("} + ex.Kind() + "): " +
                            ex.what());
    return 1;
  } catch (const std::exception& ex) {
    core::logging::LogError(std::string{"Server terminated with error: "} + ex.what());
    return 1;
  }

  core::logging::LogInfo("Server shut down gracefully.");
  return 0;
}
