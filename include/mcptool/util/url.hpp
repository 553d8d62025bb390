#pragma once
#include <string>
#include <utility>

namespace mcptool::util
{

struct Url
{
    std::string scheme; // "http" or "https"
    std::string host;
    int port{80};
    std::string path{"/"}; // includes leading '/' and any query; fragment dropped

    /// scheme://host:port
    std::string origin() const;
    std::string to_string() const;
};

/// Parse an absolute http(s) URL. Throws ValidationError on a missing or
/// unsupported scheme, an empty host or a malformed port.
Url parse_url(const std::string& url);

/// Split "host:port" (or "[v6]:port"). Throws ValidationError when the port is
/// missing, non-numeric or out of range.
std::pair<std::string, int> split_host_port(const std::string& addr);

} // namespace mcptool::util
