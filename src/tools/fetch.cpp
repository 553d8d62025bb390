#include "mcptool/tools/fetch.hpp"

#include "mcptool/exceptions.hpp"
#include "mcptool/logging.hpp"
#include "mcptool/util/html.hpp"
#include "mcptool/util/robots.hpp"
#include "mcptool/util/url.hpp"
#include "mcptool/util/utf8.hpp"
#include "mcptool/version.hpp"

#include <httplib.h>
#include <memory>

namespace mcptool::tools
{

namespace
{
constexpr const char* kComponent = "fetch";

std::unique_ptr<httplib::Client> make_client(const util::Url& url, const FetchOptions& options)
{
    auto cli = std::make_unique<httplib::Client>(url.origin());
    cli->set_connection_timeout(options.timeout_seconds, 0);
    cli->set_read_timeout(options.timeout_seconds, 0);
    cli->set_write_timeout(options.timeout_seconds, 0);
    cli->set_follow_location(options.follow_redirects);
    return cli;
}

// Path component only, for robots.txt matching.
std::string path_only(const std::string& path_and_query)
{
    auto q = path_and_query.find('?');
    return q == std::string::npos ? path_and_query : path_and_query.substr(0, q);
}
} // namespace

FetchTool::FetchTool(FetchOptions options) : options_(std::move(options))
{
    if (options_.user_agent.empty())
        options_.user_agent =
            std::string("mcptool/") + VERSION + " (+https://modelcontextprotocol.io)";
    if (options_.timeout_seconds <= 0)
        throw ValidationError("fetch timeout must be positive");
}

CallToolResult FetchTool::call(const Properties& args) const
{
    util::Url url;
    try
    {
        url = util::parse_url(args.url);
    }
    catch (const ValidationError& e)
    {
        return CallToolResult::error(std::string("Invalid URL: ") + e.what());
    }

    const httplib::Headers headers = {{"User-Agent", options_.user_agent}};
    auto cli = make_client(url, options_);

    if (options_.respect_robots_txt)
    {
        auto robots = cli->Get("/robots.txt", headers);
        // Unreachable or missing robots.txt means no restrictions.
        if (robots && robots->status >= 200 && robots->status < 300 &&
            !util::robots_allows(robots->body, options_.user_agent, path_only(url.path)))
        {
            logging::info(kComponent, "robots.txt disallows " + url.to_string());
            return CallToolResult::error("Access denied by robots.txt: " + url.to_string() +
                                         " is disallowed for this user agent");
        }
    }

    logging::debug(kComponent, "GET " + url.to_string());
    auto res = cli->Get(url.path, headers);
    if (!res)
        return CallToolResult::error("Failed to fetch URL: " + httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
        return CallToolResult::error("Failed to fetch URL: HTTP status " +
                                     std::to_string(res->status));

    const std::string content_type = res->get_header_value("Content-Type");
    std::string content;
    if (args.raw.value_or(false) || !util::html::looks_like_html(res->body, content_type))
        content = res->body;
    else
        content = util::html::to_markdown(util::html::extract_main_content(res->body));

    const std::size_t start = args.start_index.value_or(0);
    const std::size_t max_length = args.max_length.value_or(kDefaultMaxLength);
    return CallToolResult::success(util::utf8::substr(content, start, max_length));
}

} // namespace mcptool::tools
