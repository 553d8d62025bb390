#include "mcptool/server/stdio_transport.hpp"

#include "mcptool/exceptions.hpp"
#include "mcptool/logging.hpp"
#include "mcptool/util/utf8.hpp"

#include <iostream>
#include <string>

namespace mcptool::server
{

namespace
{
constexpr const char* kComponent = "stdio";
}

StdioTransport::StdioTransport() : StdioTransport(std::cin, std::cout) {}

StdioTransport::StdioTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

void StdioTransport::start(MessageQueue& inbound)
{
    logging::info(kComponent, "reading messages from stdin");

    std::string line;
    while (!stop_requested_ && std::getline(in_, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        if (!util::utf8::is_valid(line))
        {
            logging::debug(kComponent, "skipping line that is not valid UTF-8");
            continue;
        }

        logging::debug(kComponent, "received: " + line);
        if (!inbound.push(std::move(line)))
            break;
        line.clear();
    }

    if (in_.bad())
        throw TransportError("stdio: read failed");
    logging::info(kComponent, "input closed");
}

void StdioTransport::send_response(const std::string& text)
{
    if (text.empty())
        return;

    std::lock_guard<std::mutex> lock(write_mutex_);
    logging::debug(kComponent, "sending: " + text);
    out_ << text << '\n';
    out_.flush();
    if (!out_)
        throw TransportError("stdio: write failed");
}

void StdioTransport::stop()
{
    stop_requested_ = true;
}

} // namespace mcptool::server
