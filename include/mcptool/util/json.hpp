#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace mcptool::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}
// Invalid UTF-8 inside strings is replaced rather than thrown on; tool output
// may carry arbitrary bytes fetched from the network.
inline std::string dump(const json& j)
{
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
inline std::string dump_pretty(const json& j, int indent = 2)
{
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

// Non-throwing parse; returns a discarded value on malformed input.
inline json try_parse(const std::string& s)
{
    return json::parse(s, nullptr, /*allow_exceptions=*/false);
}

} // namespace mcptool::util::json
