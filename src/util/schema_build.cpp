#include "mcplib/util/schema_build.hpp"

#include "mcplib/exceptions.hpp"

#include <cctype>
#include <cstring>
#include <sstream>
#include <unordered_set>

namespace mcplib::util::schema_build
{

static bool is_space(char c)
{
    return c == ' ' || c == '\t';
}

static std::string trim(const std::string& s)
{
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b]))
        ++b;
    while (e > b && (is_space(s[e - 1]) || s[e - 1] == '\r'))
        --e;
    return s.substr(b, e - b);
}

static bool is_name_start(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_name_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

// Parses "name - description" from an already trimmed line.
static bool parse_entry(const std::string& line, ParamDoc& out)
{
    if (line.empty() || !is_name_start(line[0]))
        return false;
    size_t pos = 1;
    while (pos < line.size() && is_name_char(line[pos]))
        ++pos;
    std::string name = line.substr(0, pos);

    size_t gap = pos;
    while (pos < line.size() && is_space(line[pos]))
        ++pos;
    if (pos == gap || pos >= line.size() || line[pos] != '-')
        return false;
    ++pos;
    if (pos < line.size() && !is_space(line[pos]))
        return false;

    out.name = std::move(name);
    out.description = trim(line.substr(pos));
    return true;
}

std::vector<ParamDoc> parse_param_docs(const std::string& doc)
{
    std::vector<ParamDoc> params;
    std::istringstream in(doc);
    std::string line;

    bool in_section = false;
    while (std::getline(in, line))
    {
        std::string t = trim(line);
        if (!in_section)
        {
            in_section = t.compare(0, std::strlen(PARAMS_MARKER), PARAMS_MARKER) == 0;
            continue;
        }
        if (t.empty())
            continue;
        ParamDoc entry;
        if (!parse_entry(t, entry))
            break;
        params.push_back(std::move(entry));
    }

    std::unordered_set<std::string> seen;
    for (const auto& p : params)
        if (!seen.insert(p.name).second)
            throw ValidationError("Duplicate parameter '" + p.name + "' in " + PARAMS_MARKER);
    return params;
}

mcplib::Json derive_input_schema(const std::vector<std::string>& declared_params,
                                 const std::string& doc)
{
    if (declared_params.empty())
        return mcplib::Json{{"type", "object"}};
    if (declared_params.size() > 1)
        throw ValidationError("MCP tool handlers take at most one parameter, got " +
                              std::to_string(declared_params.size()));

    const std::string& param = declared_params.front();
    if (param.empty())
        throw ValidationError("Handler parameter name must not be empty");

    bool documented = false;
    std::string description;
    for (const auto& d : parse_param_docs(doc))
    {
        if (d.name != param)
            throw ValidationError("Documented parameter '" + d.name +
                                  "' does not match handler parameter '" + param + "'");
        documented = true;
        description = d.description;
    }
    if (!documented)
        throw ValidationError("Parameter '" + param + "' is not documented in " +
                              PARAMS_MARKER + " section");

    mcplib::Json prop = {{"type", "string"}};
    if (!description.empty())
        prop["description"] = description;
    return mcplib::Json{
        {"type", "object"},
        {"properties", mcplib::Json{{param, prop}}},
        {"required", mcplib::Json::array({param})},
    };
}

} // namespace mcplib::util::schema_build
