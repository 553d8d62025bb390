#include "mcptool/mcp/dispatcher.hpp"

#include "mcptool/exceptions.hpp"
#include "mcptool/logging.hpp"
#include "mcptool/util/json.hpp"

#include <algorithm>

namespace mcptool::mcp
{

namespace
{
constexpr const char* kComponent = "dispatcher";

bool valid_id(const Json& id)
{
    return id.is_string() || id.is_number() || id.is_null();
}
} // namespace

Json make_result(const Json& id, Json result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

Json make_error(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id},
                {"error", Json{{"code", code}, {"message", message}}}};
}

void Dispatcher::add_method(const std::string& name, MethodHandler handler)
{
    methods_[name] = std::move(handler);
}

void Dispatcher::add_notification(const std::string& name, NotificationHandler handler)
{
    notifications_[name] = std::move(handler);
}

bool Dispatcher::has_method(const std::string& name) const
{
    return methods_.count(name) > 0;
}

bool Dispatcher::has_notification(const std::string& name) const
{
    return notifications_.count(name) > 0;
}

std::vector<std::string> Dispatcher::method_names() const
{
    std::vector<std::string> names;
    names.reserve(methods_.size());
    for (const auto& kv : methods_)
        names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    return names;
}

bool Dispatcher::is_notification_method(const std::string& method)
{
    return method.rfind("notifications/", 0) == 0 || method == "cancelled";
}

std::optional<std::string> Dispatcher::handle_request(const std::string& text) const
{
    Json message = util::json::try_parse(text);
    if (message.is_discarded())
    {
        // No id can be recovered from text that is not JSON.
        logging::warn(kComponent, "dropping unparseable message: " + text);
        return std::nullopt;
    }

    auto response = handle_message(message);
    if (!response)
        return std::nullopt;
    return util::json::dump(*response);
}

std::optional<Json> Dispatcher::handle_message(const Json& message) const
{
    if (!message.is_array())
        return handle_single(message);

    if (message.empty())
    {
        logging::warn(kComponent, "dropping empty batch");
        return std::nullopt;
    }

    Json responses = Json::array();
    for (const auto& item : message)
        if (auto response = handle_single(item))
            responses.push_back(std::move(*response));
    if (responses.empty())
        return std::nullopt;
    return responses;
}

std::optional<Json> Dispatcher::handle_single(const Json& message) const
{
    if (!message.is_object())
    {
        logging::warn(kComponent, "dropping non-object message: " + util::json::dump(message));
        return std::nullopt;
    }

    auto id_it = message.find("id");
    const bool has_id = id_it != message.end();
    if (has_id && !valid_id(*id_it))
    {
        logging::warn(kComponent, "dropping message with invalid id: " + util::json::dump(*id_it));
        return std::nullopt;
    }
    const Json id = has_id ? *id_it : Json();

    auto method_it = message.find("method");
    auto version_it = message.find("jsonrpc");
    const bool well_formed = method_it != message.end() && method_it->is_string() &&
                             version_it != message.end() && *version_it == "2.0";
    if (!well_formed)
    {
        if (!has_id)
        {
            logging::warn(kComponent, "dropping invalid envelope: " + util::json::dump(message));
            return std::nullopt;
        }
        logging::error(kComponent, "invalid request envelope: " + util::json::dump(message));
        return make_error(id, error_code::kInvalidRequest, "Invalid Request");
    }

    const std::string method = method_it->get<std::string>();
    Json params = message.value("params", Json());

    if (!has_id || is_notification_method(method))
    {
        run_notification(method, params);
        return std::nullopt;
    }

    if (!params.is_null() && !params.is_object() && !params.is_array())
    {
        logging::error(kComponent, method + ": params must be structured");
        return make_error(id, error_code::kInvalidParams,
                          "Invalid params: params must be an object or an array");
    }

    return run_method(id, method, params);
}

void Dispatcher::run_notification(const std::string& method, const Json& params) const
{
    auto it = notifications_.find(method);
    if (it == notifications_.end())
    {
        logging::debug(kComponent, "ignoring unknown notification " + method);
        return;
    }

    try
    {
        it->second(params);
    }
    catch (const std::exception& e)
    {
        logging::error(kComponent, "notification " + method + " failed: " + e.what());
    }
}

Json Dispatcher::run_method(const Json& id, const std::string& method, const Json& params) const
{
    auto it = methods_.find(method);
    if (it == methods_.end())
    {
        logging::error(kComponent, "method not found: " + method);
        return make_error(id, error_code::kMethodNotFound, "Method not found");
    }

    logging::info(kComponent, "handling " + method + " request");
    try
    {
        return make_result(id, it->second(params));
    }
    catch (const NotFoundError& e)
    {
        logging::error(kComponent, method + ": " + e.what());
        return make_error(id, error_code::kMethodNotFound, "Method not found");
    }
    catch (const ValidationError& e)
    {
        logging::error(kComponent, method + ": " + e.what());
        return make_error(id, error_code::kInvalidParams, std::string("Invalid params: ") + e.what());
    }
    catch (const ArgumentParseError& e)
    {
        logging::error(kComponent, method + ": " + e.what());
        return make_error(id, error_code::kInvalidParams, std::string("Invalid params: ") + e.what());
    }
    catch (const Json::exception& e)
    {
        // nlohmann's own wording stays in the log.
        logging::error(kComponent, method + ": failed to parse params: " + e.what());
        return make_error(id, error_code::kInvalidParams, "Invalid params");
    }
    catch (const std::exception& e)
    {
        logging::error(kComponent, method + " failed: " + e.what());
        return make_error(id, error_code::kInternalError, "Internal error");
    }
}

} // namespace mcptool::mcp
