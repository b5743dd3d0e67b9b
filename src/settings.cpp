#include "mcplib/settings.hpp"

#include "mcplib/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mcplib
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static bool is_truthy(const std::string& v)
{
    return v == "1" || v == "true" || v == "TRUE";
}

static std::string string_field(const Json& j, const char* key, const std::string& defv)
{
    auto it = j.find(key);
    if (it == j.end())
        return defv;
    if (!it->is_string())
        throw ValidationError(std::string("Settings field '") + key + "' must be a string");
    return it->get<std::string>();
}

static bool bool_field(const Json& j, const char* key, bool defv)
{
    auto it = j.find(key);
    if (it == j.end())
        return defv;
    if (!it->is_boolean())
        throw ValidationError(std::string("Settings field '") + key + "' must be a boolean");
    return it->get<bool>();
}

Settings Settings::from_env()
{
    Settings s;
    s.server_name = getenv_str("MCPLIB_SERVER_NAME", s.server_name);
    s.server_version = getenv_str("MCPLIB_SERVER_VERSION", s.server_version);
    s.protocol_version = getenv_str("MCPLIB_PROTOCOL_VERSION", s.protocol_version);
    s.log_level = to_upper(getenv_str("MCPLIB_LOG_LEVEL", s.log_level));
    s.log_io = is_truthy(getenv_str("MCPLIB_LOG_IO", "0"));
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (!j.is_object())
        throw ValidationError("Settings must be a JSON object");
    s.server_name = string_field(j, "server_name", s.server_name);
    s.server_version = string_field(j, "server_version", s.server_version);
    s.protocol_version = string_field(j, "protocol_version", s.protocol_version);
    s.log_level = to_upper(string_field(j, "log_level", s.log_level));
    s.log_io = bool_field(j, "log_io", s.log_io);
    return s;
}

} // namespace mcplib
