#pragma once
#include "mcptool/tools/arguments.hpp"
#include "mcptool/tools/tool.hpp"

#include <string>
#include <utility>

namespace mcptool::tools
{

/// Bridges a strongly-typed tool implementation to ToolHandler.
///
/// Impl provides:
///   static constexpr const char* kName;
///   static constexpr const char* kDescription;
///   using Properties = ...;                       // argument struct with fields()
///   CallToolResult call(const Properties&) const;
///
/// The definition (and its inputSchema) is computed once, at construction.
template <typename Impl>
class TypedTool : public ToolHandler
{
  public:
    using Properties = typename Impl::Properties;

    explicit TypedTool(Impl impl) : impl_(std::move(impl)), definition_(def()) {}

    static ToolDefinition def()
    {
        ToolDefinition d;
        d.name = Impl::kName;
        d.description = std::string(Impl::kDescription);
        d.input_schema = input_schema<Properties>();
        return d;
    }

    const ToolDefinition& definition() const override
    {
        return definition_;
    }

    CallToolResult call(const Json& arguments) const override
    {
        return impl_.call(parse_arguments<Properties>(arguments));
    }

    const Impl& impl() const
    {
        return impl_;
    }

  private:
    Impl impl_;
    ToolDefinition definition_;
};

} // namespace mcptool::tools
