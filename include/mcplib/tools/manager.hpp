#pragma once
#include "mcplib/tools/tool.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcplib::tools
{

using ToolPtr = std::shared_ptr<const Tool>;

/// Tool registry keyed by name.
///
/// Iteration follows first-registration order; re-registering a name replaces
/// the record in place. Records are shared: a ToolPtr obtained from the
/// registry stays valid after the tool is replaced or unregistered, so a
/// handler may change the registry during its own call. No internal locking:
/// callers serialize access.
class ToolManager
{
  public:
    // Validates and stores a registration, replacing any tool of the same name.
    // Throws ValidationError when the handler is empty, the name or description
    // is empty, or the handler's parameters/documentation are rejected.
    ToolPtr register_tool(ToolHandler handler, const std::string& name,
                          const std::string& description,
                          std::optional<std::string> title = std::nullopt,
                          std::optional<bool> read_only = std::nullopt);

    bool unregister_tool(const std::string& name);

    // nullptr when absent.
    ToolPtr find(const std::string& name) const;
    // Throws NotFoundError. The reference is valid until the tool is replaced
    // or unregistered; hold find()'s ToolPtr to keep a record longer.
    const Tool& get(const std::string& name) const;
    bool contains(const std::string& name) const
    {
        return index_.count(name) != 0;
    }

    const std::vector<ToolPtr>& list() const
    {
        return tools_;
    }
    std::vector<std::string> list_names() const;

    size_t size() const
    {
        return tools_.size();
    }
    bool empty() const
    {
        return tools_.empty();
    }

  private:
    std::vector<ToolPtr> tools_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace mcplib::tools
