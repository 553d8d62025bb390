#pragma once
#include "mcptool/mcp/dispatcher.hpp"
#include "mcptool/prompts/prompt.hpp"
#include "mcptool/resources/resource.hpp"
#include "mcptool/server/transport.hpp"
#include "mcptool/tools/registry.hpp"
#include "mcptool/types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcptool::server
{

/// Owns the tool, resource and prompt catalogue together with the capability
/// descriptor, and runs the read -> dispatch -> write loop over a Transport.
///
/// The catalogue is filled once before run(); run() processes one message at
/// a time, in arrival order.
class Server
{
  public:
    explicit Server(Implementation info, ServerCapabilities capabilities = {},
                    std::optional<std::string> instructions = std::nullopt,
                    std::size_t queue_capacity = 32);

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    template <typename Impl>
    void add_tool(Impl impl)
    {
        tools_.add(std::move(impl));
    }
    void add_tool(std::unique_ptr<tools::ToolHandler> tool)
    {
        tools_.register_tool(std::move(tool));
    }
    void add_resource(resources::Resource resource)
    {
        resources_.push_back(std::move(resource));
    }
    void add_prompt(prompts::Prompt prompt)
    {
        prompts_.push_back(std::move(prompt));
    }

    const Implementation& info() const
    {
        return info_;
    }
    const ServerCapabilities& capabilities() const
    {
        return capabilities_;
    }
    const std::optional<std::string>& instructions() const
    {
        return instructions_;
    }
    const tools::ToolRegistry& tools() const
    {
        return tools_;
    }
    const mcp::Dispatcher& dispatcher() const
    {
        return dispatcher_;
    }

    /// Dispatch one raw message; nullopt when nothing is to be written back.
    std::optional<std::string> handle(const std::string& text) const
    {
        return dispatcher_.handle_request(text);
    }

    /// Blocking. Runs transport.start() on a reader thread and dispatches its
    /// messages on the calling thread until the transport finishes or stop()
    /// is called. Returns false if reading or any write failed.
    bool run(Transport& transport);

    /// Ask a running run() to return. Safe from any thread.
    void stop();

  private:
    void install_methods();

    Json initialize(const Json& params) const;
    Json list_tools() const;
    Json list_resources() const;
    Json list_prompts() const;
    Json call_tool(const Json& params) const;
    void cancelled(const Json& params) const;

    Implementation info_;
    ServerCapabilities capabilities_;
    std::optional<std::string> instructions_;
    std::size_t queue_capacity_;

    tools::ToolRegistry tools_;
    std::vector<resources::Resource> resources_;
    std::vector<prompts::Prompt> prompts_;
    mcp::Dispatcher dispatcher_;

    std::mutex run_mutex_;
    Transport* active_transport_{nullptr};
    MessageQueue* active_queue_{nullptr};
};

} // namespace mcptool::server
