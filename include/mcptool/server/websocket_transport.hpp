#pragma once
#include "mcptool/server/transport.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace httplib
{
class Server;
class WebSocket;
} // namespace httplib

namespace mcptool::server
{

/**
 * One-peer WebSocket listener: every text frame is one inbound message and
 * every response goes out as one text frame.
 *
 * The listener binds once in start() and keeps accepting connections until
 * stop(). The most recent connection becomes the current writer and the
 * previous one is closed; frames still arriving from a superseded connection
 * are ignored, so only one peer is served at a time. When the current peer disconnects the writer is
 * cleared and responses are dropped until the next peer connects.
 */
class WebSocketTransport : public Transport
{
  public:
    /// addr is "host:port"; throws ValidationError when it is malformed.
    explicit WebSocketTransport(const std::string& addr);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void start(MessageQueue& inbound) override;
    void send_response(const std::string& text) override;
    void stop() override;

    /// Blocks until start() is accepting connections (or has failed to bind).
    void wait_until_ready() const;

    bool connected() const;

    const std::string& host() const
    {
        return host_;
    }
    int port() const
    {
        return port_;
    }

  private:
    void on_open(const std::shared_ptr<httplib::WebSocket>& ws);
    void on_message(const std::shared_ptr<httplib::WebSocket>& ws, const std::string& message,
                    bool is_binary, MessageQueue& inbound);
    void on_close(const std::shared_ptr<httplib::WebSocket>& ws, int status,
                  const std::string& reason);

    std::string host_;
    int port_;
    std::unique_ptr<httplib::Server> svr_;

    mutable std::mutex writer_mutex_;
    std::shared_ptr<httplib::WebSocket> writer_;

    std::atomic<bool> stop_requested_{false};
};

} // namespace mcptool::server
