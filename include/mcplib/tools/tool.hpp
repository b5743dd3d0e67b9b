#pragma once
#include "mcplib/types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcplib::tools
{

/// Callable behind a tool, with its declared parameter list and documentation.
///
/// Arity is chosen explicitly by the factory used, never introspected. The
/// documentation is where the "MCP Parameters:" section is looked up.
class ToolHandler
{
  public:
    using NullaryFn = std::function<std::string()>;
    using UnaryFn = std::function<std::string(const std::string&)>;
    using Fn = std::variant<NullaryFn, UnaryFn>;

    static ToolHandler nullary(NullaryFn fn, std::string doc = {})
    {
        return ToolHandler(Fn(std::in_place_type<NullaryFn>, std::move(fn)), {}, std::move(doc));
    }

    static ToolHandler unary(std::string param, UnaryFn fn, std::string doc)
    {
        return ToolHandler(Fn(std::in_place_type<UnaryFn>, std::move(fn)), std::move(param),
                           std::move(doc));
    }

    size_t arity() const
    {
        return std::holds_alternative<UnaryFn>(fn_) ? 1 : 0;
    }
    std::vector<std::string> parameters() const
    {
        if (arity() == 0)
            return {};
        return {param_};
    }
    const std::string& doc() const
    {
        return doc_;
    }
    bool callable() const
    {
        return std::visit([](const auto& f) { return static_cast<bool>(f); }, fn_);
    }

    // Unary handlers require an argument; std::invalid_argument otherwise.
    std::string invoke(const std::optional<std::string>& arg) const;

  private:
    ToolHandler(Fn fn, std::string param, std::string doc)
        : fn_(std::move(fn)), param_(std::move(param)), doc_(std::move(doc))
    {
    }

    Fn fn_;
    std::string param_;
    std::string doc_;
};

/// Registration record owned by the ToolManager.
class Tool
{
  public:
    Tool(std::string name, std::string description, mcplib::Json input_schema,
         ToolHandler handler, std::optional<std::string> title = std::nullopt,
         std::optional<bool> read_only = std::nullopt)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), handler_(std::move(handler)),
          title_(std::move(title)), read_only_(read_only)
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const mcplib::Json& input_schema() const
    {
        return input_schema_;
    }
    const ToolHandler& handler() const
    {
        return handler_;
    }
    const std::optional<std::string>& title() const
    {
        return title_;
    }
    // Unset and false differ: false is advertised as readOnlyHint=false.
    const std::optional<bool>& read_only() const
    {
        return read_only_;
    }

    std::string invoke(const std::optional<std::string>& arg) const
    {
        return handler_.invoke(arg);
    }

    // {"title"?, "readOnlyHint"?}, or null when neither is set.
    mcplib::Json annotations() const;

    // {"name", "description", "inputSchema", "annotations"?} for tools/list.
    mcplib::Json to_list_entry() const;

  private:
    std::string name_;
    std::string description_;
    mcplib::Json input_schema_;
    ToolHandler handler_;
    std::optional<std::string> title_;
    std::optional<bool> read_only_;
};

} // namespace mcplib::tools
