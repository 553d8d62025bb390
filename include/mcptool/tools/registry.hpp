#pragma once
#include "mcptool/exceptions.hpp"
#include "mcptool/tools/tool.hpp"
#include "mcptool/tools/typed_tool.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mcptool::tools
{

/// Owns the registered tools and adapts (name, untyped arguments) calls onto
/// them. Tools are kept in registration order; lookups are a linear scan.
class ToolRegistry
{
  public:
    /// Throws ValidationError if a tool with the same name is already present.
    void register_tool(std::unique_ptr<ToolHandler> tool);

    template <typename Impl>
    void add(Impl impl)
    {
        register_tool(std::make_unique<TypedTool<Impl>>(std::move(impl)));
    }

    const ToolHandler* find(const std::string& name) const;

    std::vector<ToolDefinition> list() const;

    /// Resolve and invoke a tool.
    /// Throws NotFoundError for an unknown name, ArgumentParseError when the
    /// arguments do not match, ToolExecutionError when the tool itself throws.
    CallToolResult call(const std::string& name, const Json& arguments) const;

    std::size_t size() const
    {
        return tools_.size();
    }

  private:
    std::vector<std::unique_ptr<ToolHandler>> tools_;
};

} // namespace mcptool::tools
