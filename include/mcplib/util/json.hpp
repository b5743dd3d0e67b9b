#pragma once
#include "mcplib/types.hpp"

#include <string>

namespace mcplib::util::json
{

inline mcplib::Json parse(const std::string& s)
{
    return mcplib::Json::parse(s);
}
// Invalid UTF-8 in tool output is replaced rather than thrown on.
inline std::string dump(const mcplib::Json& j)
{
    return j.dump(-1, ' ', false, mcplib::Json::error_handler_t::replace);
}
inline std::string dump_pretty(const mcplib::Json& j, int indent = 2)
{
    return j.dump(indent);
}

} // namespace mcplib::util::json
