#include <mcplib.hpp>

#include <iostream>

// Example: in-process MCP tool server
//
// Registers two tools, then plays a scripted client session through
// Server::process() and prints every response line. A real host would hand
// process() the lines its transport receives instead.
//
// Usage:
//   MCPLIB_LOG_IO=1 ./mcplib_example_simple_echo

int main()
{
    using mcplib::tools::ToolHandler;

    mcplib::server::Server server(mcplib::Settings::from_env());

    server.register_tool(ToolHandler::unary("text", [](const std::string& text) { return text; },
                                            "Return TEXT unchanged.\n"
                                            "\n"
                                            "MCP Parameters:\n"
                                            "  text - the text to echo back"),
                         "echo", "Echoes input");

    server.register_tool(ToolHandler::nullary([] { return std::string("mcplib 0.1.0"); }),
                         "version", "Report the library version", "Library version", true);

    server.register_tool(ToolHandler::unary("path",
                                            [](const std::string& path) -> std::string
                                            {
                                                if (path.empty() || path[0] != '/')
                                                    throw mcplib::ToolError(
                                                        "path must be absolute: " + path);
                                                return "opened " + path;
                                            },
                                            "MCP Parameters:\n"
                                            "  path - absolute path of the file to open"),
                         "open", "Open a file by absolute path");

    server.start();

    const std::string session[] = {
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26"}})",
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
        mcplib::mcp::create_tools_list_request(2),
        mcplib::mcp::create_tools_call_request("echo", 3, {{"text", "hi"}}),
        mcplib::mcp::create_tools_call_request("open", 4, {{"path", "relative.txt"}}),
        mcplib::mcp::create_tools_call_request("ghost", 5),
        R"({"jsonrpc":"2.0","id":6,"method":"resources/list"})",
        "{not json",
    };

    for (const auto& line : session)
        if (auto response = server.process(line))
            std::cout << *response << std::endl;

    server.stop();
    return 0;
}
