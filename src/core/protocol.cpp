#include "core/protocol.hpp"

#include <type_traits>

#include "core/errors.hpp"

namespace core::protocol {
namespace {

using nlohmann::json;

std::string StripLineEnding(const std::string& line) {
  std::size_t end = line.size();
  while (end > 0 && (line[end - 1] == '\n' || line[end - 1] == '\r')) {
    --end;
  }
  return line.substr(0, end);
}

// At most 200 bytes of `text` for diagnostics, cut where a UTF-8 sequence starts.
std::string Snippet(const std::string& text) {
  constexpr std::size_t kMaxSnippetBytes = 200;
  if (text.size() <= kMaxSnippetBytes) {
    return text;
  }
  std::size_t cut = kMaxSnippetBytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return text.substr(0, cut) + "...";
}

const json& RequireField(const json& document, const char* key, const char* type) {
  const auto it = document.find(key);
  if (it == document.end()) {
    throw ProtocolError(std::string{"Message of type '"} + type + "' is missing field '" + key +
                        "'");
  }
  return *it;
}

std::string RequireString(const json& document, const char* key, const char* type) {
  const json& value = RequireField(document, key, type);
  if (!value.is_string()) {
    throw ProtocolError(std::string{"Field '"} + key + "' of '" + type + "' must be a string");
  }
  return value.get<std::string>();
}

json RequireObject(const json& document, const char* key, const char* type) {
  const json& value = RequireField(document, key, type);
  if (!value.is_object()) {
    throw ProtocolError(std::string{"Field '"} + key + "' of '" + type + "' must be an object");
  }
  return value;
}

json OptionalObject(const json& document, const char* key, const std::string& owner) {
  const auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    return json::object();
  }
  if (!it->is_object()) {
    throw ProtocolError("Field '" + std::string{key} + "' of tool '" + owner +
                        "' must be an object");
  }
  return *it;
}

ToolDescription ParseTool(const json& entry) {
  if (!entry.is_object()) {
    throw ProtocolError("Every entry of 'tools' must be an object");
  }
  ToolDescription tool;
  tool.name = RequireString(entry, "name", kTypeToolDescription);
  if (const auto it = entry.find("description"); it != entry.end() && !it->is_null()) {
    if (!it->is_string()) {
      throw ProtocolError("Description of tool '" + tool.name + "' must be a string");
    }
    tool.description = it->get<std::string>();
  }
  tool.input_schema = OptionalObject(entry, "input_schema", tool.name);
  tool.output_schema = OptionalObject(entry, "output_schema", tool.name);
  return tool;
}

ToolDescriptionMessage ParseDescription(const json& document) {
  const json& tools = RequireField(document, "tools", kTypeToolDescription);
  if (!tools.is_array()) {
    throw ProtocolError("Field 'tools' of 'tool-description' must be an array");
  }
  ToolDescriptionMessage message;
  message.tools.reserve(tools.size());
  for (const auto& entry : tools) {
    message.tools.push_back(ParseTool(entry));
  }
  return message;
}

json ToolToJson(const ToolDescription& tool) {
  return {{"name", tool.name},
          {"description", tool.description},
          {"input_schema", tool.input_schema},
          {"output_schema", tool.output_schema}};
}

}  // namespace

bool operator==(const ToolDescription& lhs, const ToolDescription& rhs) {
  return lhs.name == rhs.name && lhs.description == rhs.description &&
         lhs.input_schema == rhs.input_schema && lhs.output_schema == rhs.output_schema;
}

bool operator==(const ToolDescriptionMessage& lhs, const ToolDescriptionMessage& rhs) {
  return lhs.tools == rhs.tools;
}

bool operator==(const ToolCallMessage& lhs, const ToolCallMessage& rhs) {
  return lhs.tool == rhs.tool && lhs.input == rhs.input;
}

bool operator==(const ToolResultMessage& lhs, const ToolResultMessage& rhs) {
  return lhs.output == rhs.output;
}

bool operator==(const ErrorMessage& lhs, const ErrorMessage& rhs) { return lhs.error == rhs.error; }

std::string Encode(const Message& message) {
  json document = std::visit(
      [](const auto& m) -> json {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ToolDescriptionMessage>) {
          json tools = json::array();
          for (const auto& tool : m.tools) {
            tools.push_back(ToolToJson(tool));
          }
          return {{"type", kTypeToolDescription}, {"tools", tools}};
        } else if constexpr (std::is_same_v<T, ToolCallMessage>) {
          return {{"type", kTypeToolCall}, {"tool", m.tool}, {"input", m.input}};
        } else if constexpr (std::is_same_v<T, ToolResultMessage>) {
          return {{"type", kTypeToolResult}, {"output", m.output}};
        } else {
          return {{"type", kTypeError}, {"error", m.error}};
        }
      },
      message);
  // dump() escapes control characters, so the payload never contains a raw newline.
  // Bytes that are not UTF-8 become U+FFFD instead of failing the whole message.
  return document.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

Message Decode(const std::string& line) {
  const std::string text = StripLineEnding(line);
  if (text.empty()) {
    throw ProtocolError("Received an empty line");
  }

  const json document = json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    throw ProtocolError("Received a line that is not valid JSON: " + Snippet(text));
  }
  if (!document.is_object()) {
    throw ProtocolError("Protocol messages must be JSON objects");
  }

  const auto type_it = document.find("type");
  if (type_it == document.end() || !type_it->is_string()) {
    throw ProtocolError("Message has no 'type' field");
  }
  const std::string type = type_it->get<std::string>();

  if (type == kTypeToolDescription) {
    return ParseDescription(document);
  }
  if (type == kTypeToolCall) {
    ToolCallMessage call;
    call.tool = RequireString(document, "tool", kTypeToolCall);
    call.input = RequireObject(document, "input", kTypeToolCall);
    return call;
  }
  if (type == kTypeToolResult) {
    ToolResultMessage result;
    result.output = RequireObject(document, "output", kTypeToolResult);
    return result;
  }
  if (type == kTypeError) {
    ErrorMessage error;
    error.error = RequireString(document, "error", kTypeError);
    return error;
  }
  throw ProtocolError("Unknown message type: " + type);
}

const char* TypeName(const Message& message) {
  switch (message.index()) {
    case 0:
      return kTypeToolDescription;
    case 1:
      return kTypeToolCall;
    case 2:
      return kTypeToolResult;
    default:
      return kTypeError;
  }
}

}  // namespace core::protocol
