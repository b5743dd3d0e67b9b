/// @file test_tool_manager.cpp
/// @brief Tests for ToolManager
///
/// Tests cover:
/// - Registration validation and schema derivation
/// - Re-registration, unregistration and lookup
/// - Listing order

#include "mcplib/exceptions.hpp"
#include "mcplib/tools/manager.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace mcplib;
using namespace mcplib::tools;

/// Helper to create an echo handler
ToolHandler echo_handler()
{
    return ToolHandler::unary("text", [](const std::string& s) { return s; },
                              "Return TEXT unchanged.\n\nMCP Parameters:\n  text - text to echo");
}

/// Helper to create a nullary handler returning a fixed string
ToolHandler const_handler(const std::string& value)
{
    return ToolHandler::nullary([value] { return value; });
}

template <typename F>
static bool throws_validation(F&& f)
{
    try
    {
        f();
    }
    catch (const ValidationError&)
    {
        return true;
    }
    return false;
}

//------------------------------------------------------------------------------
// Registration
//------------------------------------------------------------------------------

void test_register_single_tool()
{
    std::cout << "  test_register_single_tool... " << std::flush;

    ToolManager tm;
    auto tool = tm.register_tool(echo_handler(), "echo", "Echoes input");
    assert(tool->name() == "echo");
    assert(tool->description() == "Echoes input");
    assert(tool->input_schema()["required"] == Json::array({"text"}));
    assert(!tool->title());
    assert(!tool->read_only());
    assert(tm.find("echo") == tool);

    assert(tm.size() == 1);
    assert(tm.contains("echo"));

    std::cout << "PASSED\n";
}

void test_register_zero_arg_tool()
{
    std::cout << "  test_register_zero_arg_tool... " << std::flush;

    ToolManager tm;
    auto tool = tm.register_tool(const_handler("42"), "answer", "The answer", "Answer", true);
    assert(tool->input_schema() == Json({{"type", "object"}}));
    assert(*tool->title() == "Answer");
    assert(*tool->read_only() == true);

    std::cout << "PASSED\n";
}

void test_register_rejections()
{
    std::cout << "  test_register_rejections... " << std::flush;

    ToolManager tm;
    assert(throws_validation([&] { tm.register_tool(ToolHandler::nullary(nullptr), "x", "d"); }));
    assert(throws_validation([&] { tm.register_tool(const_handler("v"), "", "d"); }));
    assert(throws_validation([&] { tm.register_tool(const_handler("v"), "x", ""); }));
    // One parameter without an MCP Parameters section
    assert(throws_validation(
        [&]
        {
            tm.register_tool(ToolHandler::unary("text", [](const std::string& s) { return s; },
                                                "Return TEXT unchanged."),
                             "echo", "Echoes input");
        }));
    // Rejected registrations leave nothing behind
    assert(tm.empty());

    std::cout << "PASSED\n";
}

void test_reregister_replaces()
{
    std::cout << "  test_reregister_replaces... " << std::flush;

    ToolManager tm;
    tm.register_tool(const_handler("a"), "first", "First");
    tm.register_tool(const_handler("b"), "second", "Second");
    tm.register_tool(const_handler("c"), "first", "First again", std::nullopt, false);

    assert(tm.size() == 2);
    const auto& t = tm.get("first");
    assert(t.description() == "First again");
    assert(t.invoke(std::nullopt) == "c");
    assert(t.read_only() && *t.read_only() == false);

    // Slot is kept
    auto names = tm.list_names();
    assert(names[0] == "first");
    assert(names[1] == "second");

    std::cout << "PASSED\n";
}

//------------------------------------------------------------------------------
// Unregistration and lookup
//------------------------------------------------------------------------------

void test_unregister()
{
    std::cout << "  test_unregister... " << std::flush;

    ToolManager tm;
    tm.register_tool(const_handler("a"), "a", "A");
    tm.register_tool(const_handler("b"), "b", "B");
    tm.register_tool(const_handler("c"), "c", "C");

    assert(tm.unregister_tool("b"));
    assert(!tm.unregister_tool("b"));
    assert(!tm.unregister_tool("never-registered"));

    assert(tm.size() == 2);
    assert(tm.find("b") == nullptr);
    // Index stays consistent after erase
    assert(tm.get("c").invoke(std::nullopt) == "c");
    auto names = tm.list_names();
    assert(names.size() == 2 && names[0] == "a" && names[1] == "c");

    std::cout << "PASSED\n";
}

void test_held_records_survive_mutation()
{
    std::cout << "  test_held_records_survive_mutation... " << std::flush;

    ToolManager tm;
    auto first = tm.register_tool(const_handler("one"), "first", "First");
    auto second = tm.register_tool(const_handler("two"), "second", "Second");

    // Enough registrations to force the registry to grow
    for (int i = 0; i < 64; ++i)
        tm.register_tool(const_handler("n"), "filler-" + std::to_string(i), "Filler");
    assert(first->name() == "first");
    assert(first->invoke(std::nullopt) == "one");

    // Replaced and unregistered records stay usable through the held pointer
    tm.register_tool(const_handler("uno"), "first", "First again");
    assert(tm.unregister_tool("second"));
    assert(first->invoke(std::nullopt) == "one");
    assert(first->description() == "First");
    assert(second->invoke(std::nullopt) == "two");
    assert(tm.get("first").invoke(std::nullopt) == "uno");
    assert(tm.find("second") == nullptr);

    std::cout << "PASSED\n";
}

void test_get_missing_throws()
{
    std::cout << "  test_get_missing_throws... " << std::flush;

    ToolManager tm;
    bool threw = false;
    try
    {
        tm.get("ghost");
    }
    catch (const NotFoundError& e)
    {
        threw = std::string(e.what()).find("ghost") != std::string::npos;
    }
    assert(threw);
    assert(tm.find("ghost") == nullptr);

    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "ToolManager tests\n";
    test_register_single_tool();
    test_register_zero_arg_tool();
    test_register_rejections();
    test_reregister_replaces();
    test_unregister();
    test_held_records_survive_mutation();
    test_get_missing_throws();
    std::cout << "All ToolManager tests passed\n";
    return 0;
}
