/// @file basic.cpp
/// @brief ToolHandler variants and Tool listing entries

#include "mcplib/tools/tool.hpp"

#include <cassert>
#include <cctype>
#include <iostream>
#include <stdexcept>

using namespace mcplib;
using namespace mcplib::tools;

int main()
{
    std::cout << "Tool basic tests\n";

    // Nullary handler
    auto version = ToolHandler::nullary([] { return std::string("1.2.3"); });
    assert(version.arity() == 0);
    assert(version.parameters().empty());
    assert(version.callable());
    assert(version.invoke(std::nullopt) == "1.2.3");
    // Arguments are ignored by nullary handlers
    assert(version.invoke(std::string("ignored")) == "1.2.3");

    // Unary handler
    auto upper = ToolHandler::unary(
        "text",
        [](const std::string& s)
        {
            std::string out = s;
            for (auto& c : out)
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return out;
        },
        "MCP Parameters:\n  text - text to upper-case");
    assert(upper.arity() == 1);
    assert(upper.parameters() == std::vector<std::string>{"text"});
    assert(upper.doc().find("MCP Parameters:") != std::string::npos);
    assert(upper.invoke(std::string("abc")) == "ABC");

    bool threw = false;
    try
    {
        upper.invoke(std::nullopt);
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    assert(threw);

    // Empty callables are detectable
    assert(!ToolHandler::nullary(nullptr).callable());
    assert(!ToolHandler::unary("x", nullptr, "").callable());

    // Listing entry without annotations
    Tool plain("version", "Report version", Json{{"type", "object"}}, version);
    auto entry = plain.to_list_entry();
    assert(entry["name"] == "version");
    assert(entry["description"] == "Report version");
    assert(entry["inputSchema"] == Json({{"type", "object"}}));
    assert(!entry.contains("annotations"));
    assert(plain.annotations().is_null());

    // Title only
    Tool titled("version", "Report version", Json{{"type", "object"}}, version, "Version");
    assert(titled.to_list_entry()["annotations"] == Json({{"title", "Version"}}));

    // Explicit false is advertised, never dropped
    Tool writable("version", "Report version", Json{{"type", "object"}}, version, std::nullopt,
                  false);
    auto ann = writable.to_list_entry()["annotations"];
    assert(ann.contains("readOnlyHint"));
    assert(ann["readOnlyHint"] == false);
    assert(!ann.contains("title"));

    Tool both("version", "Report version", Json{{"type", "object"}}, version, "Version", true);
    auto ann2 = both.annotations();
    assert(ann2["title"] == "Version");
    assert(ann2["readOnlyHint"] == true);

    std::cout << "All Tool basic tests passed\n";
    return 0;
}
