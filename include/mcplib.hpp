#pragma once

/// @file mcplib.hpp
/// @brief Main header for mcplib - includes the public API
///
/// Usage:
/// @code
/// #include <mcplib.hpp>
///
/// int main() {
///     mcplib::server::Server srv;
///     srv.register_tool(mcplib::tools::ToolHandler::nullary([] { return "1.0"; }),
///                       "version", "Report the host version", "Version", true);
///     srv.start();
///     auto response = srv.process(mcplib::mcp::create_tools_list_request());
/// }
/// @endcode

// Core types and exceptions
#include "mcplib/types.hpp"
#include "mcplib/exceptions.hpp"
#include "mcplib/settings.hpp"

// Tools
#include "mcplib/tools/manager.hpp"
#include "mcplib/tools/tool.hpp"
#include "mcplib/util/schema_build.hpp"

// Protocol
#include "mcplib/mcp/handler.hpp"
#include "mcplib/mcp/jsonrpc.hpp"

// Server
#include "mcplib/server/logging.hpp"
#include "mcplib/server/server.hpp"
