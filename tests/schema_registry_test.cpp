#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/errors.hpp"
#include "core/schema_registry.hpp"
#include "nlohmann/json.hpp"
#include "test_support.hpp"

namespace {

using core::SchemaError;
using core::ValidationError;
using core::schema::CompileRequestSchema;
using core::schema::SchemaRegistry;
using core::schema::Validate;
using nlohmann::json;
using test::Assert;
using test::ExpectThrows;
namespace protocol = core::protocol;

protocol::ToolDescription Tool(const std::string& name, const json& properties) {
  return protocol::ToolDescription{
      name, name + " tool", {{"type", "object"}, {"properties", properties}}, json::object()};
}

void TestCompileStringFields() {
  const auto schema =
      CompileRequestSchema(Tool("get-forecast", {{"location", {{"type", "string"}}}}));
  Assert(schema.fields.size() == 1, "Expected one field");
  Assert(schema.fields[0].name == "location" && schema.fields[0].required,
         "String property must become a required field");

  const auto empty = CompileRequestSchema(
      protocol::ToolDescription{"noop", "", {{"type", "object"}}, json::object()});
  Assert(empty.fields.empty(), "A schema without properties has no fields");
}

void TestCompileRejectsUnsupportedSchemas() {
  ExpectThrows<SchemaError>(
      [] { CompileRequestSchema(Tool("add", {{"a", {{"type", "integer"}}}})); }, "integer",
      "integer field");
  ExpectThrows<SchemaError>([] { CompileRequestSchema(Tool("obj", {{"o", {{"type", "object"}}}})); },
                            "'o'", "object field names the field");
  ExpectThrows<SchemaError>([] { CompileRequestSchema(Tool("loose", {{"x", json::object()}})); },
                            "untyped", "property without type");
  ExpectThrows<SchemaError>(
      [] { CompileRequestSchema(Tool("bad/name", {{"x", {{"type", "string"}}}})); },
      "endpoint path", "slash in tool name");
  ExpectThrows<SchemaError>(
      [] { CompileRequestSchema(protocol::ToolDescription{"x", "", json::array(), json::object()}); },
      "not an object", "array input_schema");
}

void TestBuildIsLenientPerTool() {
  protocol::ToolDescriptionMessage description;
  description.tools.push_back(Tool("add", {{"a", {{"type", "integer"}}}, {"b", {{"type", "integer"}}}}));
  description.tools.push_back(Tool("echo", {{"msg", {{"type", "string"}}}}));
  description.tools.push_back(Tool("echo", {{"msg", {{"type", "string"}}}}));

  const auto registry = SchemaRegistry::Build(description, false);
  Assert(registry.Tools().size() == 1, "Only echo must be registered");
  Assert(registry.Find("echo") != nullptr && registry.Find("echo")->path == "/echo",
         "echo must be served at /echo");
  Assert(registry.Find("add") == nullptr, "add must be excluded");
  Assert(registry.Rejected().size() == 2, "Integer tool and duplicate must both be rejected");
  Assert(registry.Rejected()[0].name == "add", "First rejection is add");
  Assert(registry.Rejected()[1].reason.find("more than once") != std::string::npos,
         "Duplicate rejection must say so");

  ExpectThrows<SchemaError>([&] { SchemaRegistry::Build(description, true); }, "integer",
                            "strict build");
}

void TestValidate() {
  const auto schema = CompileRequestSchema(
      Tool("pair", {{"first", {{"type", "string"}}}, {"second", {{"type", "string"}}}}));

  const json input = Validate(schema, {{"first", "a"}, {"second", "b"}, {"extra", 1}});
  Assert(input == json({{"first", "a"}, {"second", "b"}}),
         "Only declared fields are forwarded to the tool");

  const std::string message =
      ExpectThrows<ValidationError>([&] { Validate(schema, {{"second", 5}}); }, "first", "bad body");
  Assert(message.find("second") != std::string::npos, "Every violation must be reported");

  try {
    Validate(schema, {{"second", 5}});
    throw std::runtime_error("Validation unexpectedly succeeded");
  } catch (const ValidationError& ex) {
    Assert(ex.Violations().size() == 2, "Expected two violations");
    Assert(ex.Violations()[0].reason == "field required", "Missing field reason mismatch");
    Assert(ex.Violations()[1].reason == "expected string, got number", "Type reason mismatch");
  }

  ExpectThrows<ValidationError>([&] { Validate(schema, json::array()); }, "JSON object",
                                "array body");
  ExpectThrows<ValidationError>([&] { Validate(schema, {{"first", nullptr}, {"second", "b"}}); },
                                "first", "null counts as missing");
}

core::process::ProcessOptions Options(std::vector<std::string> command) {
  core::process::ProcessOptions options;
  options.command = std::move(command);
  options.describe_timeout = std::chrono::milliseconds(3000);
  return options;
}

void TestDiscoverDemoTool() {
  const auto registry = SchemaRegistry::Discover(Options(test::DemoToolCommand()), false);
  Assert(registry.Tools().size() == 3, "Demo tool advertises three tools");
  for (const char* name : {"echo", "get-time", "get-forecast"}) {
    Assert(registry.Find(name) != nullptr, std::string{"Missing tool "} + name);
  }
  Assert(registry.Rejected().empty(), "Demo tools are all string-only");
}

void TestDiscoverSkipsUnsupportedTools() {
  const auto registry =
      SchemaRegistry::Discover(Options(test::MisbehavingToolCommand("integer-schema")), false);
  Assert(registry.Tools().size() == 1 && registry.Find("echo") != nullptr,
         "Only the string tool survives discovery");
  Assert(registry.Rejected().size() == 1 && registry.Rejected()[0].name == "add",
         "The integer tool must be listed as rejected");

  ExpectThrows<SchemaError>(
      [] { SchemaRegistry::Discover(Options(test::MisbehavingToolCommand("integer-schema")), true); },
      "add", "strict discovery");
}

}  // namespace

int main() {
  try {
    TestCompileStringFields();
    TestCompileRejectsUnsupportedSchemas();
    TestBuildIsLenientPerTool();
    TestValidate();
    TestDiscoverDemoTool();
    TestDiscoverSkipsUnsupportedTools();
  } catch (const std::exception& ex) {
    std::cerr << "schema_registry_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
