#pragma once

#include <string>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace core::protocol {

inline constexpr const char* kTypeToolDescription = "tool-description";
inline constexpr const char* kTypeToolCall = "tool-call";
inline constexpr const char* kTypeToolResult = "tool-result";
inline constexpr const char* kTypeError = "error";

struct ToolDescription {
  std::string name;
  std::string description;
  nlohmann::json input_schema = nlohmann::json::object();
  nlohmann::json output_schema = nlohmann::json::object();
};

struct ToolDescriptionMessage {
  std::vector<ToolDescription> tools;
};

struct ToolCallMessage {
  std::string tool;
  nlohmann::json input = nlohmann::json::object();
};

struct ToolResultMessage {
  nlohmann::json output = nlohmann::json::object();
};

struct ErrorMessage {
  std::string error;
};

using Message =
    std::variant<ToolDescriptionMessage, ToolCallMessage, ToolResultMessage, ErrorMessage>;

bool operator==(const ToolDescription& lhs, const ToolDescription& rhs);
bool operator==(const ToolDescriptionMessage& lhs, const ToolDescriptionMessage& rhs);
bool operator==(const ToolCallMessage& lhs, const ToolCallMessage& rhs);
bool operator==(const ToolResultMessage& lhs, const ToolResultMessage& rhs);
bool operator==(const ErrorMessage& lhs, const ErrorMessage& rhs);

// Serializes a message as one compact JSON document terminated by '\n'.
std::string Encode(const Message& message);

// Parses exactly one line. Throws ProtocolError on empty input, invalid JSON,
// a non-object document, an unknown "type" or missing fields.
Message Decode(const std::string& line);

// Name of the message kind as it appears in the "type" field.
const char* TypeName(const Message& message);

}  // namespace core::protocol
