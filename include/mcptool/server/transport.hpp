#pragma once
#include "mcptool/util/bounded_queue.hpp"

#include <string>

namespace mcptool::server
{

using MessageQueue = util::BoundedQueue<std::string>;

/// Moves raw JSON-RPC text between the process and one peer.
///
/// start() is run on its own thread by Server::run(): it pushes every inbound
/// message onto the queue (blocking when the queue is full) and returns when
/// the channel closes, stop() is called or the queue is closed. It throws
/// TransportError on a fatal read error.
///
/// send_response() is called from the dispatch thread and writes one message
/// with the channel's framing. It throws TransportError when a write on an
/// open channel fails.
class Transport
{
  public:
    virtual ~Transport() = default;

    virtual void start(MessageQueue& inbound) = 0;
    virtual void send_response(const std::string& text) = 0;

    /// Ask start() to return. Safe to call from any thread, more than once.
    virtual void stop() = 0;
};

} // namespace mcptool::server
