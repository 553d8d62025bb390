#pragma once

/// @file mcptool.hpp
/// @brief Main header for mcptool - includes the server, its transports and
/// the built-in tools.
///
/// Usage:
/// @code
/// #include <mcptool.hpp>
///
/// int main() {
///     mcptool::server::Server server({"my-server", "1.0.0"});
///     server.add_tool(mcptool::tools::EchoTool{});
///     mcptool::server::StdioTransport transport;
///     return server.run(transport) ? 0 : 1;
/// }
/// @endcode

// Core types and exceptions
#include "mcptool/content.hpp"
#include "mcptool/exceptions.hpp"
#include "mcptool/types.hpp"
#include "mcptool/version.hpp"

// Ambient
#include "mcptool/logging.hpp"
#include "mcptool/settings.hpp"

// Catalogue
#include "mcptool/prompts/prompt.hpp"
#include "mcptool/resources/resource.hpp"
#include "mcptool/tools/registry.hpp"
#include "mcptool/tools/typed_tool.hpp"

// Built-in tools
#include "mcptool/tools/echo.hpp"
#include "mcptool/tools/fetch.hpp"
#include "mcptool/tools/memory.hpp"

// Pipeline
#include "mcptool/mcp/dispatcher.hpp"
#include "mcptool/server/server.hpp"
#include "mcptool/server/stdio_transport.hpp"
#include "mcptool/server/websocket_transport.hpp"
