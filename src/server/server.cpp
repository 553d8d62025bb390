#include "mcptool/server/server.hpp"

#include "mcptool/exceptions.hpp"
#include "mcptool/logging.hpp"
#include "mcptool/util/json.hpp"

#include <atomic>
#include <thread>

namespace mcptool::server
{

namespace
{
constexpr const char* kComponent = "server";

template <typename T>
Json list_result(const char* key, const std::vector<T>& items)
{
    Json array = Json::array();
    for (const auto& item : items)
        array.push_back(item);
    return Json{{key, array}, {"nextCursor", nullptr}};
}
} // namespace

Server::Server(Implementation info, ServerCapabilities capabilities,
               std::optional<std::string> instructions, std::size_t queue_capacity)
    : info_(std::move(info)), capabilities_(std::move(capabilities)),
      instructions_(std::move(instructions)), queue_capacity_(queue_capacity)
{
    install_methods();
}

void Server::install_methods()
{
    dispatcher_.add_method("initialize", [this](const Json& p) { return initialize(p); });
    dispatcher_.add_method("ping", [](const Json&) { return Json::object(); });
    dispatcher_.add_method("tools/list", [this](const Json&) { return list_tools(); });
    dispatcher_.add_method("resources/list", [this](const Json&) { return list_resources(); });
    dispatcher_.add_method("prompts/list", [this](const Json&) { return list_prompts(); });
    dispatcher_.add_method("tools/call", [this](const Json& p) { return call_tool(p); });

    dispatcher_.add_notification("notifications/initialized", [](const Json&)
                                 { logging::info(kComponent, "client initialized"); });
    dispatcher_.add_notification("cancelled", [this](const Json& p) { cancelled(p); });
    dispatcher_.add_notification("notifications/cancelled",
                                 [this](const Json& p) { cancelled(p); });
}

Json Server::initialize(const Json& params) const
{
    auto request = params.get<InitializeRequestParams>();
    logging::info(kComponent, "initialize from " + request.client_info.name + " " +
                                  request.client_info.version + " (protocol " +
                                  request.protocol_version + ")");

    InitializeResult result;
    result.capabilities = capabilities_;
    result.protocol_version = request.protocol_version;
    result.server_info = info_;
    result.instructions = instructions_;
    return result;
}

Json Server::list_tools() const
{
    return list_result("tools", tools_.list());
}

Json Server::list_resources() const
{
    return list_result("resources", resources_);
}

Json Server::list_prompts() const
{
    return list_result("prompts", prompts_);
}

Json Server::call_tool(const Json& params) const
{
    auto request = params.get<CallToolRequestParams>();
    auto result = tools_.call(request.name, request.arguments.value_or(Json()));
    if (!result.is_error)
        result.is_error = false;
    return result;
}

void Server::cancelled(const Json& params) const
{
    auto cancel = params.get<CancelledNotificationParams>();
    // Tool calls run to completion before the next message is read, so there
    // is nothing in flight to abort.
    logging::info(kComponent, "request " + util::json::dump(cancel.request_id) +
                                  " cancelled" + (cancel.reason ? ": " + *cancel.reason : ""));
}

bool Server::run(Transport& transport)
{
    MessageQueue inbound(queue_capacity_);
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (active_transport_)
            throw Error("server is already running");
        active_transport_ = &transport;
        active_queue_ = &inbound;
    }

    std::atomic<bool> ok{true};
    std::thread reader(
        [&]
        {
            try
            {
                transport.start(inbound);
            }
            catch (const std::exception& e)
            {
                logging::error(kComponent, std::string("transport failed: ") + e.what());
                ok = false;
            }
            inbound.close();
        });

    logging::info(kComponent, info_.name + " " + info_.version + " ready");
    std::string message;
    while (inbound.pop(message))
    {
        auto response = dispatcher_.handle_request(message);
        if (!response)
            continue;
        try
        {
            transport.send_response(*response);
        }
        catch (const TransportError& e)
        {
            logging::error(kComponent, e.what());
            ok = false;
        }
    }

    transport.stop();
    reader.join();

    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        active_transport_ = nullptr;
        active_queue_ = nullptr;
    }
    logging::info(kComponent, "stopped");
    return ok;
}

void Server::stop()
{
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (active_queue_)
        active_queue_->close();
    if (active_transport_)
        active_transport_->stop();
}

} // namespace mcptool::server
