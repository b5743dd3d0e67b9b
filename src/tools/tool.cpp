#include "mcplib/tools/tool.hpp"

#include <stdexcept>

namespace mcplib::tools
{

std::string ToolHandler::invoke(const std::optional<std::string>& arg) const
{
    if (const auto* fn = std::get_if<NullaryFn>(&fn_))
        return (*fn)();
    if (!arg)
        throw std::invalid_argument("Missing argument: " + param_);
    return std::get<UnaryFn>(fn_)(*arg);
}

mcplib::Json Tool::annotations() const
{
    if (!title_ && !read_only_)
        return mcplib::Json();
    mcplib::Json ann = mcplib::Json::object();
    if (title_)
        ann["title"] = *title_;
    if (read_only_)
        ann["readOnlyHint"] = *read_only_;
    return ann;
}

mcplib::Json Tool::to_list_entry() const
{
    mcplib::Json entry = {
        {"name", name_},
        {"description", description_},
        {"inputSchema", input_schema_},
    };
    auto ann = annotations();
    if (!ann.is_null())
        entry["annotations"] = std::move(ann);
    return entry;
}

} // namespace mcplib::tools
