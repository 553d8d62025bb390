#include "mcptool/exceptions.hpp"
#include "mcptool/tools/echo.hpp"
#include "mcptool/tools/registry.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace mcptool;
using namespace mcptool::tools;

struct BrokenTool
{
    static constexpr const char* kName = "broken";
    static constexpr const char* kDescription = "Always throws";

    struct Properties
    {
        static auto fields()
        {
            return std::make_tuple();
        }
    };

    CallToolResult call(const Properties&) const
    {
        throw std::runtime_error("disk on fire");
    }
};

struct BadJsonTool
{
    static constexpr const char* kName = "bad_json";
    static constexpr const char* kDescription = "Trips a json exception";

    struct Properties
    {
        static auto fields()
        {
            return std::make_tuple();
        }
    };

    CallToolResult call(const Properties&) const
    {
        Json j = Json::object();
        return CallToolResult::success(j.at("missing").get<std::string>());
    }
};

int main()
{
    ToolRegistry registry;
    registry.add(EchoTool{});
    registry.add(BrokenTool{});
    registry.add(BadJsonTool{});

    std::cout << "Test 1: registration order and lookup...\n";
    assert(registry.size() == 3);
    auto defs = registry.list();
    assert(defs.size() == 3);
    assert(defs[0].name == "echo");
    assert(defs[1].name == "broken");
    assert(registry.find("echo") != nullptr);
    assert(registry.find("nope") == nullptr);
    std::cout << "  [PASS] tools listed in registration order\n";

    std::cout << "Test 2: duplicate names are rejected...\n";
    bool threw = false;
    try
    {
        registry.add(EchoTool{});
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);
    assert(registry.size() == 3);
    std::cout << "  [PASS] duplicate rejected\n";

    std::cout << "Test 3: call passes the result through...\n";
    auto result = registry.call("echo", Json{{"message", "hi"}});
    assert(result.content.size() == 1);
    assert(result.content[0]["text"] == "hi");
    assert(result.is_error == false);
    std::cout << "  [PASS] echo result returned unchanged\n";

    std::cout << "Test 4: unknown tool...\n";
    threw = false;
    try
    {
        registry.call("nonexistent", Json::object());
    }
    catch (const NotFoundError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS] NotFoundError\n";

    std::cout << "Test 5: argument shape mismatch...\n";
    threw = false;
    try
    {
        registry.call("echo", Json{{"message", 42}});
    }
    catch (const ArgumentParseError& e)
    {
        threw = std::string(e.what()).find("message") != std::string::npos;
    }
    assert(threw);
    std::cout << "  [PASS] ArgumentParseError\n";

    std::cout << "Test 6: tool failures are wrapped...\n";
    threw = false;
    try
    {
        registry.call("broken", Json());
    }
    catch (const ToolExecutionError& e)
    {
        threw = std::string(e.what()) == "Tool execution failed: disk on fire";
    }
    assert(threw);

    threw = false;
    try
    {
        registry.call("bad_json", Json());
    }
    catch (const ResultSerializeError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS] ToolExecutionError / ResultSerializeError\n";

    std::cout << "Test 7: null tool...\n";
    threw = false;
    try
    {
        registry.register_tool(nullptr);
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS] null rejected\n";
    return 0;
}
