#include "mcplib/server/server.hpp"

#include "mcplib/exceptions.hpp"
#include "mcplib/mcp/handler.hpp"
#include "mcplib/mcp/jsonrpc.hpp"
#include "mcplib/util/json.hpp"

namespace mcplib::server
{

Server::Server(Settings settings, LogCallback log_callback)
    : settings_(std::move(settings)),
      log_(std::move(log_callback), log_level_from_string(settings_.log_level))
{
}

tools::ToolPtr Server::register_tool(tools::ToolHandler handler, const std::string& name,
                                     const std::string& description,
                                     std::optional<std::string> title,
                                     std::optional<bool> read_only)
{
    auto tool =
        tools_.register_tool(std::move(handler), name, description, std::move(title), read_only);
    log_.log(LogLevel::Debug, "registered tool " + name);
    return tool;
}

bool Server::unregister_tool(const std::string& name)
{
    bool removed = tools_.unregister_tool(name);
    if (removed)
        log_.log(LogLevel::Debug, "unregistered tool " + name);
    return removed;
}

void Server::start()
{
    if (running_)
        throw StateError("MCP server is already running");
    running_ = true;
    log_.log(LogLevel::Info, "server '" + settings_.server_name + "' started");
}

void Server::stop()
{
    if (!running_)
        throw StateError("MCP server is not running");
    running_ = false;
    log_.log(LogLevel::Info, "server '" + settings_.server_name + "' stopped");
}

void Server::ensure_running(const char* operation) const
{
    if (!running_)
        throw StateError(std::string(operation) + " called while the MCP server is not running");
}

std::optional<std::string> Server::process(const std::string& raw)
{
    ensure_running("process");
    if (settings_.log_io)
        log_.inbound(raw);

    std::optional<mcplib::Json> response;
    mcplib::Json message;
    try
    {
        message = util::json::parse(raw);
    }
    catch (const mcplib::Json::parse_error& e)
    {
        response = mcp::make_error(nullptr, mcp::ErrorCode::ParseError,
                                   std::string("Parse error: ") + e.what());
    }
    if (!response)
        response = mcp::handle_message(message, tools_, settings_, log_);
    if (!response)
        return std::nullopt;

    std::string out = util::json::dump(*response);
    if (settings_.log_io)
        log_.outbound(out);
    return out;
}

std::optional<mcplib::Json> Server::process_parsed(const mcplib::Json& message)
{
    ensure_running("process_parsed");
    if (settings_.log_io)
        log_.inbound(util::json::dump(message));
    auto response = mcp::handle_message(message, tools_, settings_, log_);
    if (response && settings_.log_io)
        log_.outbound(util::json::dump(*response));
    return response;
}

} // namespace mcplib::server
