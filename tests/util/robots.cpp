#include "mcptool/util/robots.hpp"

#include <cassert>
#include <string>

using mcptool::util::robots_allows;

int main()
{
    const std::string agent = "mcptool/0.1.0 (+https://modelcontextprotocol.io)";

    // Wildcard group
    const std::string basic = "User-agent: *\nDisallow: /private/\n";
    assert(robots_allows(basic, agent, "/test"));
    assert(!robots_allows(basic, agent, "/private/test"));
    assert(robots_allows(basic, agent, "/privateer"));

    // A group naming our product token takes precedence over '*'
    const std::string specific = "User-agent: *\n"
                                 "Disallow: /\n"
                                 "\n"
                                 "User-agent: McpTool\n"
                                 "Disallow: /admin\n";
    assert(robots_allows(specific, agent, "/docs"));
    assert(!robots_allows(specific, agent, "/admin/panel"));
    assert(!robots_allows(specific, "OtherBot/1.0", "/docs"));

    // Longest match wins; Allow wins ties
    const std::string mixed = "User-agent: *\n"
                              "Disallow: /shop\n"
                              "Allow: /shop/public\n"
                              "Disallow: /*.pdf$\n"
                              "Allow: /same\n"
                              "Disallow: /same\n";
    assert(!robots_allows(mixed, agent, "/shop/cart"));
    assert(robots_allows(mixed, agent, "/shop/public/item"));
    assert(!robots_allows(mixed, agent, "/files/report.pdf"));
    assert(robots_allows(mixed, agent, "/files/report.pdf.html"));
    assert(robots_allows(mixed, agent, "/same"));

    // Consecutive User-agent lines share one group; comments are ignored
    const std::string shared = "# crawl rules\n"
                               "User-agent: a\n"
                               "User-agent: mcptool   # us\n"
                               "Disallow: /x\n";
    assert(!robots_allows(shared, agent, "/x/y"));

    // Empty Disallow, empty file, no matching group
    assert(robots_allows("User-agent: *\nDisallow:\n", agent, "/anything"));
    assert(robots_allows("", agent, "/anything"));
    assert(robots_allows("User-agent: other\nDisallow: /\n", agent, "/anything"));
    return 0;
}
