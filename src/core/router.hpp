#pragma once

#include "core/process_strategy.hpp"
#include "core/schema_registry.hpp"
#include "platform/http_server.hpp"

namespace core {

// Validates the body, runs one call through `strategy` and maps the outcome
// to a JSON response: 200 with the tool output, 422 for an invalid body, 500
// for any process or tool failure.
platform::HttpResponse HandleToolRequest(const schema::RegisteredTool& tool,
                                         process::ProcessStrategy& strategy,
                                         const platform::HttpRequest& request);

// One POST route per registered tool plus the /_bridge/tools and
// /_bridge/health endpoints. `registry` and `strategy` must outlive `server`.
void ConfigureBridgeRoutes(platform::HttpServer& server, const schema::SchemaRegistry& registry,
                           process::ProcessStrategy& strategy);

}  // namespace core
