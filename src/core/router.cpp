#include "core/router.hpp"

#include <chrono>
#include <string>

#include "core/errors.hpp"
#include "core/logging.hpp"
#include "nlohmann/json.hpp"

namespace core {
namespace {

using core::logging::LogInfo;
using core::logging::LogWarn;
using nlohmann::json;

constexpr const char* kToolsPath = "/_bridge/tools";
constexpr const char* kHealthPath = "/_bridge/health";

void ApplyCors(platform::HttpResponse& response) {
  response.headers["Access-Control-Allow-Origin"] = "*";
  response.headers["Access-Control-Allow-Methods"] = "GET,POST,OPTIONS";
  response.headers["Access-Control-Allow-Headers"] = "*";
}

platform::HttpResponse JsonResponse(const json& body, int status = 200) {
  platform::HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  // Tool diagnostics may carry bytes that are not UTF-8.
  response.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
  ApplyCors(response);
  return response;
}

platform::HttpResponse ErrorResponse(const BridgeError& error, int status) {
  json body{{"error", error.what()}, {"kind", error.Kind()}};
  if (const auto* validation = dynamic_cast<const ValidationError*>(&error)) {
    json fields = json::array();
    for (const auto& violation : validation->Violations()) {
      fields.push_back({{"field", violation.field}, {"reason", violation.reason}});
    }
    body["fields"] = fields;
  }
  return JsonResponse(body, status);
}

platform::HttpResponse HandleCorsPreflight(const platform::HttpRequest&) {
  platform::HttpResponse response;
  response.status = 204;
  response.content_type = "text/plain";
  ApplyCors(response);
  return response;
}

json ParseBody(const std::string& body) {
  if (body.empty()) {
    return json::object();
  }
  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    throw ValidationError("Request body is not valid JSON",
                          {FieldViolation{"", "invalid JSON"}});
  }
  return parsed;
}

json SchemaToJson(const schema::RequestSchema& schema) {
  json fields = json::array();
  for (const auto& field : schema.fields) {
    fields.push_back(
        {{"name", field.name}, {"type", schema::ToString(field.kind)}, {"required", field.required}});
  }
  return fields;
}

long long ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               since)
      .count();
}

}  // namespace

platform::HttpResponse HandleToolRequest(const schema::RegisteredTool& tool,
                                         process::ProcessStrategy& strategy,
                                         const platform::HttpRequest& request) {
  const auto started = std::chrono::steady_clock::now();
  const std::string& name = tool.description.name;

  protocol::ToolCallMessage call;
  call.tool = name;
  try {
    call.input = schema::Validate(tool.schema, ParseBody(request.body));
  } catch (const ValidationError& ex) {
    LogInfo("POST " + tool.path + " -> 422 " + ex.what());
    return ErrorResponse(ex, 422);
  }

  try {
    auto result = strategy.Call(call);
    LogInfo("POST " + tool.path + " -> 200 (" + std::to_string(ElapsedMs(started)) + "ms)");
    return JsonResponse(result.output, 200);
  } catch (const BridgeError& ex) {
    LogWarn("POST " + tool.path + " -> 500 " + ex.Kind() + ": " + ex.what() + " (" +
            std::to_string(ElapsedMs(started)) + "ms)");
    return ErrorResponse(ex, 500);
  }
}

void ConfigureBridgeRoutes(platform::HttpServer& server, const schema::SchemaRegistry& registry,
                           process::ProcessStrategy& strategy) {
  for (const auto& entry : registry.Tools()) {
    const schema::RegisteredTool* tool = &entry.second;
    const std::string pattern = platform::LiteralPathPattern(tool->path);
    server.AddHandler(platform::HttpMethod::kPost, pattern,
                      [tool, &strategy](const platform::HttpRequest& request) {
                        return HandleToolRequest(*tool, strategy, request);
                      });
    server.AddHandler(platform::HttpMethod::kOptions, pattern, HandleCorsPreflight);
  }

  auto handle_tools = [&registry](const platform::HttpRequest&) {
    json tools = json::array();
    for (const auto& [name, tool] : registry.Tools()) {
      tools.push_back({{"name", name},
                       {"description", tool.description.description},
                       {"method", "POST"},
                       {"path", tool.path},
                       {"fields", SchemaToJson(tool.schema)},
                       {"input_schema", tool.description.input_schema},
                       {"output_schema", tool.description.output_schema}});
    }
    json rejected = json::array();
    for (const auto& tool : registry.Rejected()) {
      rejected.push_back({{"name", tool.name}, {"reason", tool.reason}});
    }
    LogInfo(std::string{"GET "} + kToolsPath);
    return JsonResponse(json{{"tools", tools}, {"rejected", rejected}});
  };

  const auto started = std::chrono::steady_clock::now();
  auto handle_health = [&registry, &strategy, started](const platform::HttpRequest&) {
    json payload{{"status", "ok"},
                 {"uptime_ms", ElapsedMs(started)},
                 {"strategy", process::ToString(strategy.Kind())},
                 {"tools", registry.Tools().size()}};
    return JsonResponse(payload);
  };

  server.AddHandler(platform::HttpMethod::kGet, platform::LiteralPathPattern(kToolsPath),
                    handle_tools);
  server.AddHandler(platform::HttpMethod::kGet, platform::LiteralPathPattern(kHealthPath),
                    handle_health);
  server.AddHandler(platform::HttpMethod::kOptions, platform::LiteralPathPattern(kToolsPath),
                    HandleCorsPreflight);
  server.AddHandler(platform::HttpMethod::kOptions, platform::LiteralPathPattern(kHealthPath),
                    HandleCorsPreflight);
}

}  // namespace core
