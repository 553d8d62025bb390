#pragma once
#include "mcptool/types.hpp"

#include <cstddef>
#include <string>

namespace mcptool
{

struct Settings
{
    std::string log_level{"INFO"};
    std::string log_file{"mcp_server.log"};
    std::string transport{"stdio"}; // "stdio" or "websocket"
    std::string ws_addr{"127.0.0.1:8080"};
    std::size_t queue_capacity{32};

    static Settings from_env();
    static Settings from_json(const Json& j);

    /// Overlay MCPTOOL_* environment variables onto this instance.
    void apply_env();
    /// Overlay the members present in j onto this instance.
    void apply_json(const Json& j);

    /// Throws ValidationError on an unknown transport, a malformed ws_addr or a
    /// zero queue capacity.
    void validate() const;
};

} // namespace mcptool
