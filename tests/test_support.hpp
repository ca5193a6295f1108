#pragma once

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace test {

inline void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

// Runs `body` and checks that it throws `Error` whose message contains
// `fragment`. Returns the message.
template <typename Error>
std::string ExpectThrows(const std::function<void()>& body, const std::string& fragment,
                         const std::string& context) {
  try {
    body();
  } catch (const Error& ex) {
    const std::string message = ex.what();
    if (message.find(fragment) == std::string::npos) {
      throw std::runtime_error(context + ": message '" + message + "' does not contain '" +
                               fragment + "'");
    }
    return message;
  }
  throw std::runtime_error(context + ": expected exception was not thrown");
}

inline long long MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start)
      .count();
}

inline std::vector<std::string> DemoToolCommand() { return {DEMO_TOOL_PATH}; }

inline std::vector<std::string> MisbehavingToolCommand(const std::string& mode) {
  return {MISBEHAVING_TOOL_PATH, mode};
}

}  // namespace test
