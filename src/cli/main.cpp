#include "mcptool/exceptions.hpp"
#include "mcptool/logging.hpp"
#include "mcptool/server/server.hpp"
#include "mcptool/server/stdio_transport.hpp"
#include "mcptool/server/websocket_transport.hpp"
#include "mcptool/settings.hpp"
#include "mcptool/tools/echo.hpp"
#include "mcptool/tools/fetch.hpp"
#include "mcptool/tools/memory.hpp"
#include "mcptool/util/json.hpp"
#include "mcptool/version.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "mcptool-server " << mcptool::VERSION << "\n";
    std::cout << "Usage:\n";
    std::cout << "  mcptool-server [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --transport <stdio|websocket>  Transport to serve on (default: stdio)\n";
    std::cout << "  --ws-addr <host:port>          WebSocket listen address (default: 127.0.0.1:8080)\n";
    std::cout << "  --log-file <path>              Log file (default: mcp_server.log)\n";
    std::cout << "  --log-level <level>            DEBUG, INFO, WARN, ERROR or OFF (default: INFO)\n";
    std::cout << "  --config <path>                JSON settings file\n";
    std::cout << "  --version                      Print the version and exit\n";
    std::cout << "  --help                         Show this help\n";
    std::cout << "\n";
    std::cout << "Environment: MCPTOOL_TRANSPORT, MCPTOOL_WS_ADDR, MCPTOOL_LOG_FILE, MCPTOOL_LOG_LEVEL\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            if (i + 1 >= args.size())
                throw mcptool::ValidationError("missing value for " + flag);
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
        const std::string prefix = flag + "=";
        if (args[i].rfind(prefix, 0) == 0)
        {
            std::string value = args[i].substr(prefix.size());
            args.erase(args.begin() + static_cast<long long>(i));
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static mcptool::Json read_config_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw mcptool::ValidationError("cannot open config file: " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    try
    {
        return mcptool::util::json::parse(buffer.str());
    }
    catch (const mcptool::Json::exception& e)
    {
        throw mcptool::ValidationError("invalid config file " + path + ": " + e.what());
    }
}

// defaults < --config file < MCPTOOL_* environment < command line
static mcptool::Settings load_settings(std::vector<std::string>& args)
{
    mcptool::Settings settings;
    if (auto config = consume_flag_value(args, "--config"))
        settings.apply_json(read_config_file(*config));
    settings.apply_env();

    if (auto v = consume_flag_value(args, "--log-file"))
        settings.log_file = *v;
    if (auto v = consume_flag_value(args, "--log-level"))
        settings.log_level = *v;
    if (auto v = consume_flag_value(args, "--transport"))
        settings.transport = *v;
    if (auto v = consume_flag_value(args, "--ws-addr"))
        settings.ws_addr = *v;

    if (!args.empty())
        throw mcptool::ValidationError("Unknown option: " + args.front());
    settings.validate();
    return settings;
}

static mcptool::ServerCapabilities default_capabilities()
{
    mcptool::ServerCapabilities caps;
    caps.tools = mcptool::ListChangedCapability{false};
    caps.resources = mcptool::ResourcesCapability{false, false};
    caps.prompts = mcptool::ListChangedCapability{false};
    return caps;
}

static void register_catalogue(mcptool::server::Server& server,
                               const std::shared_ptr<mcptool::tools::MemoryStore>& memory)
{
    server.add_tool(mcptool::tools::EchoTool{});
    server.add_tool(mcptool::tools::MemoryTool(memory));
    server.add_tool(mcptool::tools::FetchTool());

    mcptool::resources::Resource example;
    example.uri = "file:///example.txt";
    example.name = "example.txt";
    example.description = "An example text file";
    example.mime_type = "text/plain";
    server.add_resource(std::move(example));

    mcptool::prompts::Prompt greet;
    greet.name = "greet";
    greet.description = "A friendly greeting prompt";
    greet.arguments = std::vector<mcptool::prompts::PromptArgument>{
        {"name", std::string("Name of the person to greet"), true}};
    server.add_prompt(std::move(greet));
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);
    if (consume_flag(args, "--version"))
    {
        std::cout << "mcptool-server " << mcptool::VERSION << "\n";
        return 0;
    }

    mcptool::Settings settings;
    try
    {
        settings = load_settings(args);
    }
    catch (const mcptool::Error& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    namespace logging = mcptool::logging;
    logging::set_level(logging::level_from_string(settings.log_level));
    try
    {
        logging::log_to_file(settings.log_file);
    }
    catch (const mcptool::Error& e)
    {
        std::cerr << "Warning: " << e.what() << "; logging to stderr\n";
    }

    try
    {
        mcptool::server::Server server(
            mcptool::Implementation{"mcptool-server", mcptool::VERSION}, default_capabilities(),
            std::string("Basic MCP server with tool support"), settings.queue_capacity);
        auto memory = std::make_shared<mcptool::tools::MemoryStore>();
        register_catalogue(server, memory);

        logging::info("main", "starting " + settings.transport + " transport");
        bool ok = false;
        if (settings.transport == "websocket")
        {
            mcptool::server::WebSocketTransport transport(settings.ws_addr);
            ok = server.run(transport);
        }
        else
        {
            mcptool::server::StdioTransport transport;
            ok = server.run(transport);
        }
        return ok ? 0 : 1;
    }
    catch (const std::exception& e)
    {
        logging::error("main", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
