#include "mcplib/mcp/handler.hpp"

#include "mcplib/exceptions.hpp"
#include "mcplib/util/json.hpp"

#include <string>

namespace mcplib::mcp
{

static mcplib::Json text_result(const std::string& text, bool is_error)
{
    return mcplib::Json{
        {"content", mcplib::Json::array({mcplib::Json{{"type", "text"}, {"text", text}}})},
        {"isError", is_error}};
}

static mcplib::Json handle_initialize(const Envelope& req, const tools::ToolManager& tools,
                                      const Settings& settings)
{
    // Any client protocolVersion is accepted; ours is always advertised.
    mcplib::Json tools_cap = mcplib::Json::object();
    if (!tools.empty())
        tools_cap["listChanged"] = true;

    return make_result(
        req.id, mcplib::Json{{"protocolVersion", settings.protocol_version},
                             {"capabilities", mcplib::Json{{"tools", tools_cap},
                                                           {"resources", mcplib::Json::object()},
                                                           {"prompts", mcplib::Json::object()}}},
                             {"serverInfo", mcplib::Json{{"name", settings.server_name},
                                                         {"version", settings.server_version}}}});
}

static mcplib::Json handle_tools_list(const Envelope& req, const tools::ToolManager& tools)
{
    mcplib::Json tools_array = mcplib::Json::array();
    for (const auto& tool : tools.list())
        tools_array.push_back(tool->to_list_entry());
    return make_result(req.id, mcplib::Json{{"tools", tools_array}});
}

// Only the first argument entry is ever passed to the handler.
static std::optional<std::string> first_argument(const mcplib::Json& args)
{
    if (args.empty())
        return std::nullopt;
    const auto& value = args.begin().value();
    if (value.is_string())
        return value.get<std::string>();
    return util::json::dump(value);
}

static mcplib::Json handle_tools_call(const Envelope& req, const tools::ToolManager& tools,
                                      const server::Logger& log)
{
    const auto& params = req.params;
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string())
        return make_error(req.id, ErrorCode::InvalidParams, "Missing tool name");
    std::string name = params["name"].get<std::string>();

    // Held for the whole call: the handler may replace or unregister itself.
    tools::ToolPtr tool = tools.find(name);
    if (!tool)
        return make_error(req.id, ErrorCode::InvalidRequest, "Tool not found: " + name);

    mcplib::Json args = params.value("arguments", mcplib::Json::object());
    if (!args.is_object())
        return make_error(req.id, ErrorCode::InvalidParams, "Tool arguments must be an object");

    std::optional<std::string> arg = first_argument(args);
    if (tool->handler().arity() == 1 && !arg)
        return make_error(req.id, ErrorCode::InvalidParams,
                          "Missing argument: " + tool->handler().parameters().front());

    try
    {
        return make_result(req.id, text_result(tool->invoke(arg), false));
    }
    catch (const ToolError& e)
    {
        return make_result(req.id, text_result(e.what(), true));
    }
    catch (const std::exception& e)
    {
        log.log(server::LogLevel::Error, "tools/call " + name + ": " + e.what());
        return make_error(req.id, ErrorCode::InternalError,
                          std::string("Internal error executing tool: ") + e.what());
    }
    catch (...)
    {
        log.log(server::LogLevel::Error, "tools/call " + name + ": unknown exception");
        return make_error(req.id, ErrorCode::InternalError,
                          "Internal error executing tool: unknown exception");
    }
}

std::optional<mcplib::Json> dispatch(const Envelope& request, const tools::ToolManager& tools,
                                     const Settings& settings, const server::Logger& log)
{
    const std::string& method = request.method;

    if (request.kind == MessageKind::Notification)
    {
        // Cancellation is acknowledged only; in-flight handlers run to completion.
        if (method != "notifications/initialized" && method != "notifications/cancelled")
            log.log(server::LogLevel::Warn, "ignoring notification " + method);
        return std::nullopt;
    }

    if (method == "initialize")
        return handle_initialize(request, tools, settings);
    if (method == "tools/list")
        return handle_tools_list(request, tools);
    if (method == "tools/call")
        return handle_tools_call(request, tools, log);

    return make_error(request.id, ErrorCode::MethodNotFound, "Method not found: " + method);
}

std::optional<mcplib::Json> handle_message(const mcplib::Json& message,
                                           const tools::ToolManager& tools,
                                           const Settings& settings, const server::Logger& log)
{
    Envelope request = validate_envelope(message);
    if (request.kind == MessageKind::Invalid)
        return request.error;

    try
    {
        return dispatch(request, tools, settings, log);
    }
    catch (const std::exception& e)
    {
        log.log(server::LogLevel::Error, request.method + ": " + e.what());
        if (request.kind == MessageKind::Notification)
            return std::nullopt;
        return make_error(request.id, ErrorCode::InternalError,
                          std::string("Internal error: ") + e.what());
    }
    catch (...)
    {
        log.log(server::LogLevel::Error, request.method + ": unknown exception");
        if (request.kind == MessageKind::Notification)
            return std::nullopt;
        return make_error(request.id, ErrorCode::InternalError,
                          "Internal error: unknown exception");
    }
}

McpHandler make_mcp_handler(const tools::ToolManager& tools, Settings settings,
                            server::Logger log)
{
    return [&tools, settings = std::move(settings),
            log = std::move(log)](const mcplib::Json& message) -> std::optional<mcplib::Json>
    { return handle_message(message, tools, settings, log); };
}

} // namespace mcplib::mcp
