#pragma once
#include "mcptool/tools/arguments.hpp"

#include <string>
#include <tuple>

namespace mcptool::tools
{

/// Returns its message unchanged as a single text item.
struct EchoTool
{
    static constexpr const char* kName = "echo";
    static constexpr const char* kDescription = "Echoes back the input message";

    struct Properties
    {
        std::string message;

        static auto fields()
        {
            return std::make_tuple(field("message", &Properties::message, "The message to echo"));
        }
    };

    CallToolResult call(const Properties& args) const
    {
        return CallToolResult::success(args.message);
    }
};

} // namespace mcptool::tools
