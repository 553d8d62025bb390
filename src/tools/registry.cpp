#include "mcptool/tools/registry.hpp"

#include "mcptool/logging.hpp"

namespace mcptool::tools
{

void ToolRegistry::register_tool(std::unique_ptr<ToolHandler> tool)
{
    if (!tool)
        throw ValidationError("cannot register a null tool");
    if (find(tool->name()) != nullptr)
        throw ValidationError("duplicate tool name: " + tool->name());
    logging::debug("tools", "registered tool " + tool->name());
    tools_.push_back(std::move(tool));
}

const ToolHandler* ToolRegistry::find(const std::string& name) const
{
    for (const auto& tool : tools_)
        if (tool->name() == name)
            return tool.get();
    return nullptr;
}

std::vector<ToolDefinition> ToolRegistry::list() const
{
    std::vector<ToolDefinition> defs;
    defs.reserve(tools_.size());
    for (const auto& tool : tools_)
        defs.push_back(tool->definition());
    return defs;
}

CallToolResult ToolRegistry::call(const std::string& name, const Json& arguments) const
{
    const ToolHandler* tool = find(name);
    if (!tool)
        throw NotFoundError("tool not found: " + name);

    try
    {
        return tool->call(arguments);
    }
    catch (const ToolError&)
    {
        throw;
    }
    catch (const Json::exception& e)
    {
        throw ResultSerializeError(e.what());
    }
    catch (const std::exception& e)
    {
        throw ToolExecutionError(e.what());
    }
}

} // namespace mcptool::tools
