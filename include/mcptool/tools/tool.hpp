#pragma once
#include "mcptool/content.hpp"
#include "mcptool/types.hpp"

#include <optional>
#include <string>

namespace mcptool::tools
{

/// What tools/list advertises for one tool.
struct ToolDefinition
{
    std::string name;
    std::optional<std::string> description;
    Json input_schema = Json{{"type", "object"}};
};

inline void to_json(Json& j, const ToolDefinition& d)
{
    j = Json{{"name", d.name}, {"inputSchema", d.input_schema}};
    if (d.description)
        j["description"] = *d.description;
}

/// Uniform, untyped face of a tool as seen by the registry and dispatcher.
///
/// Implementations accept the raw "arguments" object of a tools/call request
/// and either return a CallToolResult or throw a ToolError:
/// - ArgumentParseError when the arguments do not fit the tool's shape
/// - ToolExecutionError when the tool itself fails unexpectedly
class ToolHandler
{
  public:
    virtual ~ToolHandler() = default;

    virtual const ToolDefinition& definition() const = 0;

    const std::string& name() const
    {
        return definition().name;
    }

    virtual CallToolResult call(const Json& arguments) const = 0;
};

} // namespace mcptool::tools
