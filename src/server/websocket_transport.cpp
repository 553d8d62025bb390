#include "mcptool/server/websocket_transport.hpp"

#include "mcptool/exceptions.hpp"
#include "mcptool/logging.hpp"
#include "mcptool/util/url.hpp"
#include "mcptool/util/utf8.hpp"

#include <httplib.h>

#include <utility>

namespace mcptool::server
{

namespace
{
constexpr const char* kComponent = "websocket";
}

WebSocketTransport::WebSocketTransport(const std::string& addr)
{
    auto host_port = util::split_host_port(addr);
    host_ = host_port.first;
    port_ = host_port.second;
    svr_ = std::make_unique<httplib::Server>();
}

WebSocketTransport::~WebSocketTransport()
{
    stop();
}

void WebSocketTransport::start(MessageQueue& inbound)
{
    svr_->set_ws_handler(
        "/",
        [this](const httplib::Request& /*req*/, std::shared_ptr<httplib::WebSocket> ws)
        { on_open(ws); },
        [this, &inbound](const httplib::Request& /*req*/, std::shared_ptr<httplib::WebSocket> ws,
                         const std::string& message, bool is_binary)
        { on_message(ws, message, is_binary, inbound); },
        [this](const httplib::Request& /*req*/, std::shared_ptr<httplib::WebSocket> ws,
               int status, const std::string& reason) { on_close(ws, status, reason); });

    if (stop_requested_)
        return;

    logging::info(kComponent,
                  "listening on ws://" + host_ + ":" + std::to_string(port_) + "/");
    const bool ok = svr_->listen(host_, port_);

    {
        std::lock_guard<std::mutex> lock(writer_mutex_);
        writer_.reset();
    }

    if (!ok && !stop_requested_)
        throw TransportError("websocket: failed to listen on " + host_ + ":" +
                             std::to_string(port_));
    logging::info(kComponent, "listener stopped");
}

void WebSocketTransport::on_open(const std::shared_ptr<httplib::WebSocket>& ws)
{
    std::shared_ptr<httplib::WebSocket> superseded;
    {
        std::lock_guard<std::mutex> lock(writer_mutex_);
        superseded = std::move(writer_);
        writer_ = ws;
    }
    if (!superseded)
    {
        logging::info(kComponent, "peer connected");
        return;
    }
    // Closed outside the lock: its on_close runs on the old connection's thread.
    logging::info(kComponent, "new connection supersedes the current peer, closing it");
    superseded->close();
}

void WebSocketTransport::on_message(const std::shared_ptr<httplib::WebSocket>& ws,
                                    const std::string& message, bool is_binary,
                                    MessageQueue& inbound)
{
    {
        std::lock_guard<std::mutex> lock(writer_mutex_);
        if (ws != writer_)
        {
            logging::debug(kComponent, "ignoring frame from a superseded connection");
            return;
        }
    }

    if (is_binary || !util::utf8::is_valid(message))
    {
        logging::debug(kComponent, "skipping non-text frame");
        return;
    }

    logging::debug(kComponent, "received: " + message);
    if (!inbound.push(message))
        logging::debug(kComponent, "dispatch loop closed, dropping frame");
}

void WebSocketTransport::on_close(const std::shared_ptr<httplib::WebSocket>& ws, int status,
                                  const std::string& reason)
{
    std::lock_guard<std::mutex> lock(writer_mutex_);
    if (ws != writer_)
        return;
    writer_.reset();
    logging::info(kComponent, "peer disconnected (" + std::to_string(status) +
                                  (reason.empty() ? "" : ": " + reason) + ")");
}

void WebSocketTransport::send_response(const std::string& text)
{
    if (text.empty())
        return;

    std::lock_guard<std::mutex> lock(writer_mutex_);
    if (!writer_)
    {
        logging::debug(kComponent, "no peer connected, dropping response");
        return;
    }

    logging::debug(kComponent, "sending: " + text);
    try
    {
        writer_->send(text);
    }
    catch (const std::exception& e)
    {
        writer_.reset();
        throw TransportError(std::string("websocket: write failed: ") + e.what());
    }
}

void WebSocketTransport::stop()
{
    stop_requested_ = true;
    if (svr_)
        svr_->stop();
}

void WebSocketTransport::wait_until_ready() const
{
    svr_->wait_until_ready();
}

bool WebSocketTransport::connected() const
{
    std::lock_guard<std::mutex> lock(writer_mutex_);
    return writer_ != nullptr;
}

} // namespace mcptool::server
