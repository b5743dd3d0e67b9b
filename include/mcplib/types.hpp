#pragma once
#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace mcplib
{

/// Object members keep their wire order, so "the first tool argument" is the
/// one the client wrote first and responses serialize in protocol order.
using Json = nlohmann::ordered_json;

/// Ordered key/value list used for tool arguments on the client side.
using Arguments = std::vector<std::pair<std::string, std::string>>;

} // namespace mcplib
