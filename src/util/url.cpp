#include "mcptool/util/url.hpp"

#include "mcptool/exceptions.hpp"

#include <algorithm>
#include <cctype>

namespace mcptool::util
{

namespace
{
int parse_port(const std::string& text, const std::string& context)
{
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; }))
        throw ValidationError("invalid port in " + context);
    long value = 0;
    try
    {
        value = std::stol(text);
    }
    catch (const std::exception&)
    {
        throw ValidationError("invalid port in " + context);
    }
    if (value <= 0 || value > 65535)
        throw ValidationError("port out of range in " + context);
    return static_cast<int>(value);
}

// Splits an authority into host and optional port text; handles [v6] literals.
std::pair<std::string, std::string> split_authority(const std::string& authority)
{
    if (!authority.empty() && authority.front() == '[')
    {
        auto close = authority.find(']');
        if (close == std::string::npos)
            return {authority, ""};
        std::string host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':')
            return {host, authority.substr(close + 2)};
        return {host, ""};
    }
    auto colon = authority.rfind(':');
    if (colon == std::string::npos)
        return {authority, ""};
    return {authority.substr(0, colon), authority.substr(colon + 1)};
}
} // namespace

std::string Url::origin() const
{
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return scheme + "://" + h + ":" + std::to_string(port);
}

std::string Url::to_string() const
{
    return origin() + path;
}

Url parse_url(const std::string& url)
{
    Url result;
    auto scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos)
        throw ValidationError("relative URL without a base: " + url);

    result.scheme = url.substr(0, scheme_pos);
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (result.scheme != "http" && result.scheme != "https")
        throw ValidationError("Unsupported URL scheme: " + result.scheme +
                              " (only http and https are allowed)");

    std::string remaining = url.substr(scheme_pos + 3);
    auto fragment = remaining.find('#');
    if (fragment != std::string::npos)
        remaining.erase(fragment);

    auto path_pos = remaining.find_first_of("/?");
    std::string authority = remaining.substr(0, path_pos);
    if (path_pos != std::string::npos)
        result.path = remaining.substr(path_pos);
    if (result.path.empty() || result.path[0] != '/')
        result.path.insert(result.path.begin(), '/');

    // Drop userinfo
    auto at = authority.rfind('@');
    if (at != std::string::npos)
        authority = authority.substr(at + 1);

    auto [host, port_text] = split_authority(authority);
    if (host.empty())
        throw ValidationError("empty host in URL: " + url);
    result.host = host;
    result.port = port_text.empty() ? (result.scheme == "https" ? 443 : 80)
                                    : parse_port(port_text, url);
    return result;
}

std::pair<std::string, int> split_host_port(const std::string& addr)
{
    auto [host, port_text] = split_authority(addr);
    if (port_text.empty())
        throw ValidationError("missing port in address: " + addr);
    if (host.empty())
        throw ValidationError("missing host in address: " + addr);
    return {host, parse_port(port_text, addr)};
}

} // namespace mcptool::util
