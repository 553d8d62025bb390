#pragma once
#include "mcptool/server/transport.hpp"

#include <atomic>
#include <iosfwd>
#include <mutex>

namespace mcptool::server
{

/**
 * Newline-delimited JSON-RPC over a pair of streams (stdin/stdout by default).
 *
 * Each non-empty, valid UTF-8 line read from the input stream is one inbound
 * message; other lines are skipped. Responses are written one per line and
 * flushed immediately. Reading ends at EOF or after stop(); stop() takes
 * effect once the blocking read on the current line returns.
 */
class StdioTransport : public Transport
{
  public:
    StdioTransport();
    StdioTransport(std::istream& in, std::ostream& out);

    void start(MessageQueue& inbound) override;
    void send_response(const std::string& text) override;
    void stop() override;

  private:
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace mcptool::server
