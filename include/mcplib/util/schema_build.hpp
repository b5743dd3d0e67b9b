#pragma once
#include "mcplib/types.hpp"

#include <string>
#include <vector>

namespace mcplib::util::schema_build
{

/// Marker that introduces the parameter section of a handler's documentation.
constexpr const char* PARAMS_MARKER = "MCP Parameters:";

struct ParamDoc
{
    std::string name;
    std::string description;
};

// Scan the "MCP Parameters:" section of a handler's documentation.
// Grammar, one entry per line after the marker line:
//   <ws>* name <ws>+ "-" (<ws>+ description)?
// where name is [A-Za-z_][A-Za-z0-9_-]*. Blank lines are skipped and the first
// other non-matching line ends the section. Returns an empty list when the
// marker is absent. Throws ValidationError on a duplicate name.
std::vector<ParamDoc> parse_param_docs(const std::string& doc);

// Derive the inputSchema for a handler from its declared parameters (0 or 1)
// and its documentation.
//   0 parameters: {"type":"object"}
//   1 parameter:  {"type":"object","properties":{p:{"type":"string",...}},"required":[p]}
// Throws ValidationError for more than one parameter, a documented name that
// differs from the declared one, or a declared parameter left undocumented.
mcplib::Json derive_input_schema(const std::vector<std::string>& declared_params,
                                 const std::string& doc);

} // namespace mcplib::util::schema_build
