#include "core/schema_registry.hpp"

#include <utility>

#include "core/errors.hpp"
#include "core/logging.hpp"

namespace core::schema {
namespace {

using nlohmann::json;

bool IsValidToolName(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  for (unsigned char ch : name) {
    const bool allowed = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                         (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' || ch == '.';
    if (!allowed) {
      return false;
    }
  }
  return true;
}

std::string DescribeType(const json& property) {
  if (!property.is_object()) {
    return "non-object property schema";
  }
  const auto it = property.find("type");
  if (it == property.end()) {
    return "untyped";
  }
  return it->is_string() ? it->get<std::string>() : it->dump();
}

}  // namespace

const char* ToString(FieldKind kind) {
  switch (kind) {
    case FieldKind::kString:
      return "string";
  }
  return "unknown";
}

RequestSchema CompileRequestSchema(const protocol::ToolDescription& tool) {
  if (!IsValidToolName(tool.name)) {
    throw SchemaError("Tool name '" + tool.name +
                      "' cannot be used as an endpoint path (allowed: A-Z a-z 0-9 . _ -)");
  }
  if (!tool.input_schema.is_object()) {
    throw SchemaError("Tool '" + tool.name + "' has an input_schema that is not an object");
  }

  RequestSchema schema;
  const auto properties = tool.input_schema.find("properties");
  if (properties == tool.input_schema.end() || properties->is_null()) {
    return schema;
  }
  if (!properties->is_object()) {
    throw SchemaError("Tool '" + tool.name + "' has 'properties' that is not an object");
  }

  for (const auto& [field, property] : properties->items()) {
    const std::string type = DescribeType(property);
    if (type != "string") {
      throw SchemaError("Tool '" + tool.name + "' declares field '" + field +
                        "' with unsupported type '" + type + "'; only string fields are supported");
    }
    schema.fields.push_back(FieldSpec{field, FieldKind::kString, true});
  }
  return schema;
}

json Validate(const RequestSchema& schema, const json& body) {
  if (!body.is_object()) {
    throw ValidationError("Request body must be a JSON object",
                          {FieldViolation{"", "body is not a JSON object"}});
  }

  json input = json::object();
  std::vector<FieldViolation> violations;
  for (const auto& field : schema.fields) {
    const auto it = body.find(field.name);
    if (it == body.end() || it->is_null()) {
      if (field.required) {
        violations.push_back({field.name, "field required"});
      }
      continue;
    }
    if (!it->is_string()) {
      violations.push_back({field.name, std::string{"expected "} + ToString(field.kind) +
                                            ", got " + it->type_name()});
      continue;
    }
    input[field.name] = *it;
  }

  if (!violations.empty()) {
    std::string message = "Request body failed validation:";
    for (const auto& violation : violations) {
      message += " " + violation.field + " (" + violation.reason + ")";
    }
    throw ValidationError(message, std::move(violations));
  }
  return input;
}

std::string EndpointPath(const std::string& tool_name) { return "/" + tool_name; }

SchemaRegistry SchemaRegistry::Build(const protocol::ToolDescriptionMessage& description,
                                     bool strict) {
  SchemaRegistry registry;
  for (const auto& tool : description.tools) {
    try {
      if (registry.tools_.count(tool.name) != 0) {
        throw SchemaError("Tool '" + tool.name + "' is advertised more than once");
      }
      RegisteredTool entry{tool, CompileRequestSchema(tool), EndpointPath(tool.name)};
      logging::LogInfo("Registered tool '" + tool.name + "' at POST " + entry.path + " (" +
                       std::to_string(entry.schema.fields.size()) + " field(s))");
      registry.tools_.emplace(tool.name, std::move(entry));
    } catch (const SchemaError& ex) {
      if (strict) {
        throw;
      }
      logging::LogError(std::string{"Rejected tool: "} + ex.what());
      registry.rejected_.push_back({tool.name, ex.what()});
    }
  }
  if (registry.tools_.empty()) {
    logging::LogWarn("No usable tools were discovered; the bridge exposes no tool endpoints");
  }
  return registry;
}

SchemaRegistry SchemaRegistry::Discover(const process::ProcessOptions& options, bool strict) {
  auto handle = process::ProcessHandle::Spawn(options);
  const auto description = handle->Describe();
  handle->Terminate();
  logging::LogInfo("Tool advertised " + std::to_string(description.tools.size()) + " tool(s)");
  return Build(description, strict);
}

const RegisteredTool* SchemaRegistry::Find(const std::string& name) const {
  const auto it = tools_.find(name);
  return it == tools_.end() ? nullptr : &it->second;
}

}  // namespace core::schema
