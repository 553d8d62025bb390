#pragma once
#include "mcptool/tools/arguments.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <tuple>

namespace mcptool::tools
{

struct FetchOptions
{
    std::string user_agent;  // empty: "mcptool/<version> (+https://modelcontextprotocol.io)"
    int timeout_seconds{30}; // connect and read
    bool follow_redirects{true};
    bool respect_robots_txt{true};
};

/// Fetches a URL and returns its contents, converted to markdown when the
/// response is HTML.
///
/// Invalid URLs, robots.txt denials, network failures and non-2xx statuses
/// come back as isError results rather than exceptions.
class FetchTool
{
  public:
    static constexpr const char* kName = "fetch";
    static constexpr const char* kDescription =
        "Fetches a URL from the internet and extracts its contents as markdown";
    static constexpr std::size_t kDefaultMaxLength = 5000;

    struct Properties
    {
        std::string url;
        std::optional<std::size_t> max_length;
        std::optional<std::size_t> start_index;
        std::optional<bool> raw;

        static auto fields()
        {
            return std::make_tuple(
                field("url", &Properties::url, "URL to fetch"),
                field("max_length", &Properties::max_length,
                      "Maximum number of characters to return")
                    .with_default(kDefaultMaxLength),
                field("start_index", &Properties::start_index,
                      "Start content from this character index")
                    .with_default(0),
                field("raw", &Properties::raw, "Get raw content without markdown conversion")
                    .with_default(false));
        }
    };

    explicit FetchTool(FetchOptions options = {});

    CallToolResult call(const Properties& args) const;

    const std::string& user_agent() const
    {
        return options_.user_agent;
    }

  private:
    FetchOptions options_;
};

} // namespace mcptool::tools
