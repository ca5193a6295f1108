// A tool process speaking the line protocol on stdin/stdout. It answers with
// deterministic mock data so the bridge can be run without network access.

#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>

#include "core/errors.hpp"
#include "core/protocol.hpp"
#include "nlohmann/json.hpp"

namespace {

using core::protocol::ToolDescription;
using nlohmann::json;

json LocationSchema() {
  return {{"type", "object"},
          {"properties", {{"location", {{"type", "string"}}}}},
          {"required", {"location"}}};
}

core::protocol::ToolDescriptionMessage Describe() {
  core::protocol::ToolDescriptionMessage message;
  message.tools.push_back(ToolDescription{
      "echo",
      "Returns its input unchanged",
      {{"type", "object"}, {"properties", {{"msg", {{"type", "string"}}}}}, {"required", {"msg"}}},
      {{"type", "object"}, {"properties", {{"msg", {{"type", "string"}}}}}}});
  message.tools.push_back(ToolDescription{
      "get-time",
      "Returns the current time for a location (UTC in this demo)",
      LocationSchema(),
      {{"type", "object"},
       {"properties",
        {{"location", {{"type", "string"}}},
         {"timezone", {{"type", "string"}}},
         {"time", {{"type", "string"}}},
         {"date", {{"type", "string"}}}}}}});
  message.tools.push_back(ToolDescription{
      "get-forecast",
      "Returns a mock weather forecast for a location",
      LocationSchema(),
      {{"type", "object"},
       {"properties",
        {{"location", {{"type", "string"}}},
         {"temperature", {{"type", "number"}}},
         {"conditions", {{"type", "string"}}}}}}});
  return message;
}

json GetTime(const std::string& location) {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc;
  gmtime_r(&now, &utc);
  std::ostringstream time;
  std::ostringstream date;
  time << std::put_time(&utc, "%H:%M:%S");
  date << std::put_time(&utc, "%Y-%m-%d");
  return {{"location", location}, {"timezone", "UTC"}, {"time", time.str()}, {"date", date.str()}};
}

json GetForecast(const std::string& location) {
  static const char* const kConditions[] = {"Sunny", "Cloudy", "Rain", "Windy", "Snow"};
  const std::size_t seed = std::hash<std::string>{}(location);
  const double temperature = static_cast<double>(seed % 350) / 10.0 - 5.0;
  return {{"location", location},
          {"temperature", temperature},
          {"conditions", kConditions[seed % 5]},
          {"mock", true}};
}

core::protocol::Message HandleCall(const core::protocol::ToolCallMessage& call) {
  const auto argument = [&call](const char* key) {
    const auto it = call.input.find(key);
    return (it != call.input.end() && it->is_string()) ? it->get<std::string>() : std::string{};
  };

  if (call.tool == "echo") {
    return core::protocol::ToolResultMessage{call.input};
  }
  if (call.tool == "get-time") {
    return core::protocol::ToolResultMessage{GetTime(argument("location"))};
  }
  if (call.tool == "get-forecast") {
    return core::protocol::ToolResultMessage{GetForecast(argument("location"))};
  }
  return core::protocol::ToolResultMessage{json{{"error", "Unknown tool"}}};
}

void WriteMessage(const core::protocol::Message& message) {
  std::cout << core::protocol::Encode(message) << std::flush;
}

}  // namespace

int main() {
  WriteMessage(Describe());

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) {
      continue;
    }
    try {
      const auto message = core::protocol::Decode(line);
      if (const auto* call = std::get_if<core::protocol::ToolCallMessage>(&message)) {
        WriteMessage(HandleCall(*call));
      } else {
        WriteMessage(core::protocol::ErrorMessage{std::string{"Expected a tool-call, got '"} +
                                                  core::protocol::TypeName(message) + "'"});
      }
    } catch (const core::ProtocolError& ex) {
      WriteMessage(core::protocol::ErrorMessage{ex.what()});
    }
  }
  return 0;
}
