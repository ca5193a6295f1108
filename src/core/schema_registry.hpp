#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/process_handle.hpp"
#include "core/protocol.hpp"
#include "nlohmann/json.hpp"

namespace core::schema {

enum class FieldKind { kString = 0 };

const char* ToString(FieldKind kind);

struct FieldSpec {
  std::string name;
  FieldKind kind = FieldKind::kString;
  bool required = true;
};

struct RequestSchema {
  std::vector<FieldSpec> fields;
};

struct RegisteredTool {
  protocol::ToolDescription description;
  RequestSchema schema;
  std::string path;
};

struct RejectedTool {
  std::string name;
  std::string reason;
};

// Maps every declared string property to a required string field. Throws
// SchemaError for any other property type or a malformed input_schema.
RequestSchema CompileRequestSchema(const protocol::ToolDescription& tool);

// Checks `body` against `schema` and returns the tool input made of the
// declared fields only. Throws ValidationError listing every bad field.
nlohmann::json Validate(const RequestSchema& schema, const nlohmann::json& body);

// HTTP path for a tool, e.g. "/get-forecast".
std::string EndpointPath(const std::string& tool_name);

// Immutable after construction: tools cannot be added or removed without
// building a new registry.
class SchemaRegistry {
 public:
  // Compiles every advertised tool. A tool that fails is left out and listed
  // in Rejected(); with `strict` the first SchemaError is rethrown instead.
  static SchemaRegistry Build(const protocol::ToolDescriptionMessage& description, bool strict);

  // One spawn -> describe -> terminate cycle followed by Build().
  static SchemaRegistry Discover(const process::ProcessOptions& options, bool strict);

  const RegisteredTool* Find(const std::string& name) const;
  const std::map<std::string, RegisteredTool>& Tools() const { return tools_; }
  const std::vector<RejectedTool>& Rejected() const { return rejected_; }

 private:
  SchemaRegistry() = default;

  std::map<std::string, RegisteredTool> tools_;
  std::vector<RejectedTool> rejected_;
};

}  // namespace core::schema
