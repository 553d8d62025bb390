/// @file handler.cpp
/// @brief Server method table end to end: initialize, listings and tools/call

#include "mcptool/server/server.hpp"
#include "mcptool/tools/echo.hpp"
#include "mcptool/tools/memory.hpp"
#include "mcptool/util/json.hpp"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>

using namespace mcptool;

struct ExplodingTool
{
    static constexpr const char* kName = "explode";
    static constexpr const char* kDescription = "Fails unexpectedly";

    struct Properties
    {
        static auto fields()
        {
            return std::make_tuple();
        }
    };

    CallToolResult call(const Properties&) const
    {
        throw std::runtime_error("kaboom");
    }
};

static std::unique_ptr<server::Server> make_server()
{
    ServerCapabilities caps;
    caps.tools = ListChangedCapability{false};
    caps.resources = ResourcesCapability{false, false};
    caps.prompts = ListChangedCapability{false};

    auto srv = std::make_unique<server::Server>(
        Implementation{"test-server", "1.2.3"}, caps,
        std::string("Basic MCP server with tool support"));
    srv->add_tool(tools::EchoTool{});
    srv->add_tool(tools::MemoryTool(std::make_shared<tools::MemoryStore>()));
    srv->add_tool(ExplodingTool{});

    resources::Resource res;
    res.uri = "file:///example.txt";
    res.name = "example.txt";
    res.description = "An example text file";
    res.mime_type = "text/plain";
    srv->add_resource(res);

    prompts::Prompt greet;
    greet.name = "greet";
    greet.description = "A friendly greeting prompt";
    greet.arguments = std::vector<prompts::PromptArgument>{
        {"name", std::string("Name of the person to greet"), true}};
    srv->add_prompt(greet);
    return srv;
}

static Json call(const server::Server& srv, const Json& request)
{
    auto out = srv.handle(util::json::dump(request));
    assert(out.has_value());
    return util::json::parse(*out);
}

static Json tool_call(int id, const std::string& name, const Json& arguments)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id},
                {"method", "tools/call"},
                {"params", {{"name", name}, {"arguments", arguments}}}};
}

void test_initialize()
{
    auto owner = make_server();
    const auto& srv = *owner;
    auto r = call(srv, Json{{"jsonrpc", "2.0"},
                            {"id", 1},
                            {"method", "initialize"},
                            {"params",
                             {{"capabilities", Json::object()},
                              {"clientInfo", {{"name", "c"}, {"version", "0"}}},
                              {"protocolVersion", "2024-11-05"}}}});
    const auto& result = r["result"];
    assert(result["protocolVersion"] == "2024-11-05");
    assert(result["serverInfo"] == Json({{"name", "test-server"}, {"version", "1.2.3"}}));
    assert(result["instructions"] == "Basic MCP server with tool support");
    assert(result["capabilities"]["tools"]["listChanged"] == false);
    assert(result["capabilities"]["resources"]["subscribe"] == false);
    assert(result["capabilities"]["prompts"]["listChanged"] == false);
    assert(!result["capabilities"].contains("logging"));

    // Missing clientInfo
    r = call(srv, Json{{"jsonrpc", "2.0"},
                       {"id", 2},
                       {"method", "initialize"},
                       {"params", {{"capabilities", Json::object()}, {"protocolVersion", "x"}}}});
    assert(r["error"]["code"] == -32602);
    assert(r["error"]["message"] == "Invalid params: missing field `clientInfo`");

    r = call(srv, Json{{"jsonrpc", "2.0"}, {"id", 3}, {"method", "ping"}});
    assert(r["result"] == Json::object());
}

void test_listings()
{
    auto owner = make_server();
    const auto& srv = *owner;
    auto r = call(srv, Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    const auto& tools = r["result"]["tools"];
    assert(tools.size() == 3);
    assert(tools[0]["name"] == "echo");
    assert(tools[0]["description"] == "Echoes back the input message");
    assert(tools[0]["inputSchema"]["required"] == Json::array({"message"}));
    assert(r["result"].contains("nextCursor") && r["result"]["nextCursor"].is_null());

    r = call(srv, Json{{"jsonrpc", "2.0"}, {"id", 2}, {"method", "resources/list"}});
    assert(r["result"]["resources"].size() == 1);
    assert(r["result"]["resources"][0]["mimeType"] == "text/plain");
    assert(r["result"]["resources"][0]["uri"] == "file:///example.txt");
    assert(r["result"]["nextCursor"].is_null());

    r = call(srv, Json{{"jsonrpc", "2.0"}, {"id", 3}, {"method", "prompts/list"}});
    assert(r["result"]["prompts"][0]["name"] == "greet");
    assert(r["result"]["prompts"][0]["arguments"][0]["required"] == true);
    assert(r["result"]["nextCursor"].is_null());
}

void test_echo_scenario()
{
    auto owner = make_server();
    const auto& srv = *owner;
    auto out = srv.handle(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})");
    assert(out.has_value());
    auto expected = util::json::parse(
        R"({"jsonrpc":"2.0","id":1,"result":{"content":[{"type":"text","text":"hi"}],"isError":false}})");
    assert(util::json::parse(*out) == expected);
}

void test_memory_scenario()
{
    auto owner = make_server();
    const auto& srv = *owner;
    auto stored =
        call(srv, tool_call(1, "memory", {{"action", "store"}, {"key", "k"}, {"value", {{"a", 1}}}}));
    assert(stored["result"]["isError"] == false);

    auto got = call(srv, tool_call(2, "memory", {{"action", "retrieve"}, {"key", "k"}}));
    auto text = got["result"]["content"][0]["text"].get<std::string>();
    assert(util::json::parse(text) == Json({{"a", 1}}));

    auto missing = call(srv, tool_call(3, "memory", {{"action", "store"}, {"value", 1}}));
    assert(missing["result"]["isError"] == true);
}

void test_call_errors()
{
    auto owner = make_server();
    const auto& srv = *owner;
    auto r = call(srv, tool_call(42, "nonexistent", Json::object()));
    assert(r["id"] == 42);
    assert(r["error"]["code"] == -32601);
    assert(!r.contains("result"));

    r = call(srv, tool_call(43, "echo", Json::object()));
    assert(r["error"]["code"] == -32602);
    assert(r["error"]["message"] ==
           "Invalid params: Failed to parse tool arguments: missing field `message`");

    r = call(srv, tool_call(44, "memory", {{"action", "explode"}}));
    assert(r["error"]["code"] == -32602);

    r = call(srv, tool_call(45, "explode", Json::object()));
    assert(r["error"]["code"] == -32603);
    assert(r["error"]["message"] == "Internal error");

    r = call(srv, tool_call(46, "echo", Json::array({"hi"})));
    assert(r["error"]["code"] == -32602);

    r = call(srv, Json{{"jsonrpc", "2.0"}, {"id", 47}, {"method", "tools/call"}});
    assert(r["error"]["code"] == -32602);
    assert(r["error"]["message"] == "Invalid params: invalid type: null, expected an object");

    r = call(srv, Json{{"jsonrpc", "2.0"},
                       {"id", 147},
                       {"method", "tools/call"},
                       {"params", {{"name", 7}}}});
    assert(r["error"]["code"] == -32602);
    assert(r["error"]["message"] ==
           "Invalid params: invalid type: number, expected a string for field `name`");

    r = call(srv, Json{{"jsonrpc", "2.0"},
                       {"id", 48},
                       {"method", "tools/call"},
                       {"params", {{"name", "memory"}, {"arguments", {{"action", "list"}}}}}});
    assert(r["result"]["content"][0]["text"] == "[]");

    // arguments may be omitted entirely
    r = call(srv, Json{{"jsonrpc", "2.0"},
                       {"id", 49},
                       {"method", "tools/call"},
                       {"params", {{"name", "explode"}}}});
    assert(r["error"]["code"] == -32603);

    r = call(srv, Json{{"jsonrpc", "2.0"}, {"id", 50}, {"method", "resources/read"}});
    assert(r["error"]["code"] == -32601);
}

void test_notifications()
{
    auto owner = make_server();
    const auto& srv = *owner;
    assert(!srv.handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    assert(!srv.handle(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":7,"reason":"user"}})")
                .has_value());
    assert(!srv.handle(R"({"jsonrpc":"2.0","method":"cancelled","params":{"requestId":"abc"}})")
                .has_value());
    // Unparseable cancellation params are still silent.
    assert(!srv.handle(R"({"jsonrpc":"2.0","method":"cancelled","params":{"requestId":[1]}})")
                .has_value());
    assert(!srv.handle(R"({"jsonrpc":"2.0","method":"notifications/cancelled"})").has_value());
}

int main()
{
    test_initialize();
    test_listings();
    test_echo_scenario();
    test_memory_scenario();
    test_call_errors();
    test_notifications();
    return 0;
}
