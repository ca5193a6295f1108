#include <exception>
#include <iostream>
#include <string>

#include "core/errors.hpp"
#include "core/protocol.hpp"
#include "nlohmann/json.hpp"
#include "test_support.hpp"

namespace {

using core::ProtocolError;
using nlohmann::json;
using test::Assert;
using test::ExpectThrows;
namespace protocol = core::protocol;

void TestRoundTrip() {
  protocol::ToolDescriptionMessage description;
  description.tools.push_back(protocol::ToolDescription{
      "get-forecast",
      "Weather forecast",
      {{"type", "object"}, {"properties", {{"location", {{"type", "string"}}}}}},
      {{"type", "object"}, {"properties", {{"forecast", {{"type", "string"}}}}}}});
  description.tools.push_back(protocol::ToolDescription{"noop", "", json::object(), json::object()});

  const protocol::Message messages[] = {
      description,
      protocol::ToolCallMessage{"get-forecast", {{"location", "Paris"}}},
      protocol::ToolResultMessage{{{"forecast", "Rain"}, {"nested", {{"list", {1, 2, 3}}}}}},
      protocol::ErrorMessage{"boom"},
  };

  for (const auto& message : messages) {
    const std::string line = protocol::Encode(message);
    Assert(!line.empty() && line.back() == '\n', "Encoded message must end with a newline");
    Assert(line.find('\n') == line.size() - 1, "Encoded message must be a single line");
    Assert(protocol::Decode(line) == message,
           std::string{"Round trip changed a "} + protocol::TypeName(message) + " message");
  }
}

void TestEncodeKeepsEmbeddedNewlinesOnOneLine() {
  const std::string line = protocol::Encode(protocol::ErrorMessage{"first\nsecond"});
  Assert(line.find('\n') == line.size() - 1, "Newlines inside strings must be escaped");
  const auto decoded = std::get<protocol::ErrorMessage>(protocol::Decode(line));
  Assert(decoded.error == "first\nsecond", "Escaped newline must survive decoding");
}

void TestDecodeWireFormat() {
  const auto description = std::get<protocol::ToolDescriptionMessage>(protocol::Decode(
      R"({"type":"tool-description","tools":[{"name":"get-time","description":"Time",)"
      R"("input_schema":{"type":"object","properties":{"location":{"type":"string"}}}}]})"));
  Assert(description.tools.size() == 1, "Expected one tool");
  Assert(description.tools[0].name == "get-time", "Tool name mismatch");
  Assert(description.tools[0].output_schema == json::object(),
         "Missing output_schema must default to an empty object");

  const auto call = std::get<protocol::ToolCallMessage>(
      protocol::Decode("{\"type\":\"tool-call\",\"tool\":\"echo\",\"input\":{\"msg\":\"hi\"}}\r\n"));
  Assert(call.tool == "echo" && call.input.at("msg") == "hi", "tool-call fields mismatch");

  const auto result =
      std::get<protocol::ToolResultMessage>(protocol::Decode(R"({"type":"tool-result","output":{}})"));
  Assert(result.output.is_object() && result.output.empty(), "tool-result output mismatch");
}

void TestDecodeErrors() {
  ExpectThrows<ProtocolError>([] { protocol::Decode(""); }, "empty", "empty line");
  ExpectThrows<ProtocolError>([] { protocol::Decode("\n"); }, "empty", "newline only");
  ExpectThrows<ProtocolError>([] { protocol::Decode("{not json"); }, "not valid JSON",
                              "invalid JSON");
  ExpectThrows<ProtocolError>([] { protocol::Decode("[1,2]"); }, "JSON objects", "array document");
  ExpectThrows<ProtocolError>([] { protocol::Decode(R"({"tool":"echo"})"); }, "'type'",
                              "missing type");
  ExpectThrows<ProtocolError>([] { protocol::Decode(R"({"type":"progress"})"); }, "progress",
                              "unknown type is named");
  ExpectThrows<ProtocolError>([] { protocol::Decode(R"({"type":"tool-result"})"); }, "output",
                              "tool-result without output");
  ExpectThrows<ProtocolError>([] { protocol::Decode(R"({"type":"tool-result","output":"x"})"); },
                              "object", "tool-result with scalar output");
  ExpectThrows<ProtocolError>([] { protocol::Decode(R"({"type":"error","error":42})"); }, "string",
                              "error with non-string message");
  ExpectThrows<ProtocolError>([] { protocol::Decode(R"({"type":"tool-call","tool":"x"})"); },
                              "input", "tool-call without input");
  ExpectThrows<ProtocolError>(
      [] { protocol::Decode(R"({"type":"tool-description","tools":{}})"); }, "array",
      "tools not an array");
  ExpectThrows<ProtocolError>(
      [] { protocol::Decode(R"({"type":"tool-description","tools":[{"description":"x"}]})"); },
      "name", "tool without name");
}

void TestDiagnosticsStayValidUtf8() {
  // The 200-byte cut falls inside the two-byte "\xC3\xA9".
  const std::string line = std::string(199, 'a') + "\xC3\xA9" + " trailing text";
  const std::string message = ExpectThrows<ProtocolError>([&] { protocol::Decode(line); },
                                                          "not valid JSON", "long garbage line");
  Assert(json(message).dump().find("aaaa") != std::string::npos,
         "Truncated diagnostic must remain valid UTF-8");

  const std::string encoded = protocol::Encode(protocol::ErrorMessage{"Gr\xFC\xDF" "e"});
  const auto decoded = std::get<protocol::ErrorMessage>(protocol::Decode(encoded));
  Assert(decoded.error.rfind("Gr", 0) == 0 && decoded.error.back() == 'e' &&
             decoded.error.find("\xEF\xBF\xBD") != std::string::npos,
         "Bytes that are not UTF-8 must be encoded as U+FFFD");
}

}  // namespace

int main() {
  try {
    TestRoundTrip();
    TestEncodeKeepsEmbeddedNewlinesOnOneLine();
    TestDecodeWireFormat();
    TestDecodeErrors();
    TestDiagnosticsStayValidUtf8();
  } catch (const std::exception& ex) {
    std::cerr << "protocol_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
