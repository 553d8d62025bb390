#pragma once
#include "mcptool/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcptool::mcp
{

namespace error_code
{
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
} // namespace error_code

Json make_result(const Json& id, Json result);
Json make_error(const Json& id, int code, const std::string& message);

/// JSON-RPC 2.0 envelope parsing and method routing.
///
/// Stateless across messages apart from the method table, which is filled
/// before the first message arrives. Request handlers return the "result"
/// value or throw:
/// - ValidationError / ArgumentParseError / json parse errors -> -32602
/// - NotFoundError                                            -> -32601
/// - any other std::exception                                 -> -32603 "Internal error"
/// Detail of internal errors goes to the log only.
///
/// A message is a notification when it carries no "id" or when its method
/// lives under a notification prefix ("notifications/", "cancelled"). A
/// notification never produces output, whether or not it is known and
/// whether or not its handler fails.
class Dispatcher
{
  public:
    using MethodHandler = std::function<Json(const Json& params)>;
    using NotificationHandler = std::function<void(const Json& params)>;

    void add_method(const std::string& name, MethodHandler handler);
    void add_notification(const std::string& name, NotificationHandler handler);

    bool has_method(const std::string& name) const;
    bool has_notification(const std::string& name) const;
    std::vector<std::string> method_names() const;

    /// Parse raw text and dispatch it. Returns the serialized response, or
    /// nullopt when nothing must be written back (notifications, or input
    /// with no recoverable id).
    std::optional<std::string> handle_request(const std::string& text) const;

    /// Dispatch an already-parsed message (single envelope or batch array).
    std::optional<Json> handle_message(const Json& message) const;

    static bool is_notification_method(const std::string& method);

  private:
    std::optional<Json> handle_single(const Json& message) const;
    void run_notification(const std::string& method, const Json& params) const;
    Json run_method(const Json& id, const std::string& method, const Json& params) const;

    std::unordered_map<std::string, MethodHandler> methods_;
    std::unordered_map<std::string, NotificationHandler> notifications_;
};

} // namespace mcptool::mcp
