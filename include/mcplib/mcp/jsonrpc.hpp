#pragma once
#include "mcplib/types.hpp"

#include <string>

namespace mcplib::mcp
{

constexpr const char* JSONRPC_VERSION = "2.0";
constexpr const char* NOTIFICATION_PREFIX = "notifications/";

enum class ErrorCode : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603
};

mcplib::Json make_result(const mcplib::Json& id, mcplib::Json result);
mcplib::Json make_error(const mcplib::Json& id, ErrorCode code, const std::string& message);

bool is_notification_method(const std::string& method);

enum class MessageKind
{
    Request,
    Notification,
    Invalid
};

/// Outcome of envelope validation. For Invalid, `error` holds the complete
/// error response (id echoed when present, else null).
struct Envelope
{
    MessageKind kind{MessageKind::Invalid};
    mcplib::Json id;
    std::string method;
    mcplib::Json params = mcplib::Json::object();
    mcplib::Json error;
};

// Checks, first failure wins:
//   1. "jsonrpc" == "2.0"
//   2. notifications/* must not carry an id
//   3. any other method must carry an id
//   4. "method" must be present (and a string)
//   5. "params", when present, must be an object or an array
Envelope validate_envelope(const mcplib::Json& message);

// Client-side builders, mostly for tests and host integrations.
std::string create_tools_list_request(const mcplib::Json& id = 1);
std::string create_tools_call_request(const std::string& name, const mcplib::Json& id = 1,
                                      const Arguments& arguments = {});

} // namespace mcplib::mcp
