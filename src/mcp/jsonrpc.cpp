#include "mcplib/mcp/jsonrpc.hpp"

#include "mcplib/util/json.hpp"

namespace mcplib::mcp
{

mcplib::Json make_result(const mcplib::Json& id, mcplib::Json result)
{
    return mcplib::Json{{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"result", std::move(result)}};
}

mcplib::Json make_error(const mcplib::Json& id, ErrorCode code, const std::string& message)
{
    return mcplib::Json{
        {"jsonrpc", JSONRPC_VERSION},
        {"id", id},
        {"error", mcplib::Json{{"code", static_cast<int>(code)}, {"message", message}}}};
}

bool is_notification_method(const std::string& method)
{
    return method.rfind(NOTIFICATION_PREFIX, 0) == 0;
}

static Envelope invalid(const mcplib::Json& id, const std::string& message)
{
    Envelope env;
    env.kind = MessageKind::Invalid;
    env.id = id;
    env.error = make_error(id, ErrorCode::InvalidRequest, "Invalid Request: " + message);
    return env;
}

Envelope validate_envelope(const mcplib::Json& message)
{
    if (!message.is_object())
        return invalid(nullptr, "message must be a JSON object");

    const auto id_it = message.find("id");
    const bool has_id = id_it != message.end();
    const mcplib::Json id = has_id ? *id_it : mcplib::Json();

    const auto version_it = message.find("jsonrpc");
    if (version_it == message.end() || !version_it->is_string() ||
        version_it->get<std::string>() != JSONRPC_VERSION)
        return invalid(id, "jsonrpc must be \"2.0\"");

    const auto method_it = message.find("method");
    const bool method_present = method_it != message.end();
    const bool has_method = method_present && method_it->is_string();
    const std::string method = has_method ? method_it->get<std::string>() : std::string();

    const bool notification = is_notification_method(method);
    if (notification && has_id)
        return invalid(id, "notifications must not include an id");
    if (!notification && !has_id)
        return invalid(id, "requests must include an id");
    if (!method_present)
        return invalid(id, "missing method");
    if (!has_method)
        return invalid(id, "method must be a string");

    Envelope env;
    env.id = id;
    env.method = method;
    const auto params_it = message.find("params");
    if (params_it != message.end())
    {
        if (!params_it->is_object() && !params_it->is_array())
            return invalid(id, "params must be an object or an array");
        env.params = *params_it;
    }
    env.kind = notification ? MessageKind::Notification : MessageKind::Request;
    return env;
}

std::string create_tools_list_request(const mcplib::Json& id)
{
    mcplib::Json req = {{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"method", "tools/list"}};
    return util::json::dump(req);
}

std::string create_tools_call_request(const std::string& name, const mcplib::Json& id,
                                      const Arguments& arguments)
{
    mcplib::Json args = mcplib::Json::object();
    for (const auto& kv : arguments)
        args[kv.first] = kv.second;
    mcplib::Json req = {{"jsonrpc", JSONRPC_VERSION},
                        {"id", id},
                        {"method", "tools/call"},
                        {"params", mcplib::Json{{"name", name}, {"arguments", args}}}};
    return util::json::dump(req);
}

} // namespace mcplib::mcp
