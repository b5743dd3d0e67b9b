#pragma once
#include "mcplib/mcp/jsonrpc.hpp"
#include "mcplib/server/logging.hpp"
#include "mcplib/settings.hpp"
#include "mcplib/tools/manager.hpp"
#include "mcplib/types.hpp"

#include <functional>
#include <optional>

namespace mcplib::mcp
{

/// Decoded message in, response out; std::nullopt for notifications.
using McpHandler = std::function<std::optional<mcplib::Json>(const mcplib::Json&)>;

// Route an already validated request or notification. Supported methods:
// - "initialize"
// - "notifications/initialized", "notifications/cancelled" (no response)
// - "tools/list"
// - "tools/call"
// Anything else is Method Not Found; unknown notifications are dropped.
// Tool failures are reported in the result (isError=true) for ToolError and as
// Internal Error for any other exception. May throw on faults outside tool
// invocation; handle_message converts those.
std::optional<mcplib::Json> dispatch(const Envelope& request, const tools::ToolManager& tools,
                                     const Settings& settings, const server::Logger& log);

// Validate, then dispatch. Never throws past this point: any
// failure becomes an Internal Error response (or is logged, for notifications).
std::optional<mcplib::Json> handle_message(const mcplib::Json& message,
                                           const tools::ToolManager& tools,
                                           const Settings& settings, const server::Logger& log);

// Bind handle_message to a registry. `tools` must outlive the returned handler.
McpHandler make_mcp_handler(const tools::ToolManager& tools, Settings settings = {},
                            server::Logger log = server::Logger());

} // namespace mcplib::mcp
