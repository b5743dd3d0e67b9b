#pragma once
#include "mcplib/types.hpp"

#include <string>

namespace mcplib
{

struct Settings
{
    std::string server_name{"mcplib"};
    std::string server_version{"0.1.0"};
    std::string protocol_version{"2025-03-26"};
    std::string log_level{"INFO"};
    bool log_io{false};

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace mcplib
