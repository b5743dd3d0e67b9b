#include "mcplib/tools/manager.hpp"

#include "mcplib/exceptions.hpp"
#include "mcplib/util/schema_build.hpp"

#include <cstddef>

namespace mcplib::tools
{

ToolPtr ToolManager::register_tool(ToolHandler handler, const std::string& name,
                                   const std::string& description,
                                   std::optional<std::string> title, std::optional<bool> read_only)
{
    if (!handler.callable())
        throw ValidationError("Tool handler must be callable");
    if (name.empty())
        throw ValidationError("Tool name must not be empty");
    if (description.empty())
        throw ValidationError("Tool '" + name + "' requires a description");

    auto schema = util::schema_build::derive_input_schema(handler.parameters(), handler.doc());
    auto tool = std::make_shared<const Tool>(name, description, std::move(schema),
                                             std::move(handler), std::move(title), read_only);

    auto it = index_.find(name);
    if (it != index_.end())
    {
        tools_[it->second] = tool;
        return tool;
    }
    index_.emplace(name, tools_.size());
    tools_.push_back(tool);
    return tool;
}

bool ToolManager::unregister_tool(const std::string& name)
{
    auto it = index_.find(name);
    if (it == index_.end())
        return false;
    tools_.erase(tools_.begin() + static_cast<std::ptrdiff_t>(it->second));
    index_.clear();
    for (size_t i = 0; i < tools_.size(); ++i)
        index_.emplace(tools_[i]->name(), i);
    return true;
}

ToolPtr ToolManager::find(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return tools_[it->second];
}

const Tool& ToolManager::get(const std::string& name) const
{
    auto it = index_.find(name);
    if (it != index_.end())
        return *tools_[it->second];
    throw NotFoundError("tool not found: " + name);
}

std::vector<std::string> ToolManager::list_names() const
{
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& t : tools_)
        names.push_back(t->name());
    return names;
}

} // namespace mcplib::tools
