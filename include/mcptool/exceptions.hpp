#pragma once
#include <stdexcept>
#include <string>

namespace mcptool
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Unknown method, tool or route.
struct NotFoundError : public Error
{
    using Error::Error;
};

/// Malformed request params.
struct ValidationError : public Error
{
    using Error::Error;
};

/// I/O failure on a transport channel.
struct TransportError : public Error
{
    using Error::Error;
};

/// Failures raised while adapting or running a tool.
struct ToolError : public Error
{
    using Error::Error;
};

/// Arguments do not match the tool's argument shape.
struct ArgumentParseError : public ToolError
{
    explicit ArgumentParseError(const std::string& detail)
        : ToolError("Failed to parse tool arguments: " + detail)
    {
    }
};

/// The tool's own logic failed.
struct ToolExecutionError : public ToolError
{
    explicit ToolExecutionError(const std::string& detail)
        : ToolError("Tool execution failed: " + detail)
    {
    }
};

struct ResultSerializeError : public ToolError
{
    explicit ResultSerializeError(const std::string& detail)
        : ToolError("Failed to serialize tool result: " + detail)
    {
    }
};

} // namespace mcptool
