#pragma once
#include "mcplib/server/logging.hpp"
#include "mcplib/settings.hpp"
#include "mcplib/tools/manager.hpp"
#include "mcplib/types.hpp"

#include <optional>
#include <string>

namespace mcplib::server
{

/// MCP server context: tool registry, settings, log sink and running flag.
///
/// Owned by the host; independent instances share nothing. The host's
/// transport feeds raw messages to process() and writes back what it returns.
/// Calls must be serialized by the host (see ToolManager).
///
/// Usage:
/// @code
///   mcplib::server::Server srv;
///   srv.register_tool(mcplib::tools::ToolHandler::unary(
///                         "text", [](const std::string& s) { return s; },
///                         "Echo text.\n\nMCP Parameters:\n  text - text to echo"),
///                     "echo", "Echoes input");
///   srv.start();
///   if (auto out = srv.process(line))
///       transport.send(*out);
/// @endcode
class Server
{
  public:
    explicit Server(Settings settings = Settings{}, LogCallback log_callback = nullptr);

    tools::ToolPtr register_tool(tools::ToolHandler handler, const std::string& name,
                                 const std::string& description,
                                 std::optional<std::string> title = std::nullopt,
                                 std::optional<bool> read_only = std::nullopt);
    bool unregister_tool(const std::string& name);

    const tools::ToolManager& tools() const
    {
        return tools_;
    }
    const Settings& settings() const
    {
        return settings_;
    }

    // Lifecycle. Both throw StateError when already in the requested state.
    // Registered tools survive stop/start.
    void start();
    void stop();
    bool running() const
    {
        return running_;
    }

    // Process one raw JSON-RPC message. Returns the serialized response, or
    // std::nullopt for notifications. Throws StateError when stopped; protocol
    // and tool failures are always encoded in the response.
    std::optional<std::string> process(const std::string& raw);

    // Same pipeline for an already decoded message (no parse step).
    std::optional<mcplib::Json> process_parsed(const mcplib::Json& message);

    void set_log_io(bool enabled)
    {
        settings_.log_io = enabled;
    }

  private:
    void ensure_running(const char* operation) const;

    Settings settings_;
    Logger log_;
    tools::ToolManager tools_;
    bool running_{false};
};

} // namespace mcplib::server
