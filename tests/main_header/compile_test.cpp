/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for the umbrella mcptool.hpp header
///
/// Including just <mcptool.hpp> must be enough to assemble a server with the
/// built-in tools. Each header under include/mcptool/ is also compiled on its
/// own by the mcptool_header_check target.

#include "mcptool.hpp"

#include <cassert>
#include <iostream>
#include <memory>

using namespace mcptool;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_server_with_builtin_tools..." << std::endl;
    {
        server::Server srv(Implementation{"umbrella", VERSION});
        srv.add_tool(tools::EchoTool{});
        srv.add_tool(tools::MemoryTool(std::make_shared<tools::MemoryStore>()));
        srv.add_tool(tools::FetchTool{});
        assert(srv.tools().size() == 3);
        assert(srv.dispatcher().has_method("tools/call"));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_tool_results_accessible..." << std::endl;
    {
        CallToolResult ok = CallToolResult::success("fine");
        assert(!ok.content.empty());
        server::MessageQueue queue(1);
        assert(queue.push("{}"));
    }
    std::cout << "  PASSED" << std::endl;
    return 0;
}
