#pragma once
#include "mcptool/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mcptool
{

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

// nlohmann::json adapters
inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

/// Outcome of a tool invocation.
///
/// is_error=true is still a JSON-RPC success: the failure text travels to the
/// peer as content. Protocol-level failures never take this shape.
struct CallToolResult
{
    std::vector<Json> content;
    std::optional<bool> is_error;
    std::optional<Json> meta;

    static CallToolResult success(std::string text)
    {
        CallToolResult r;
        r.content.push_back(Json(TextContent{"text", std::move(text)}));
        r.is_error = false;
        return r;
    }

    static CallToolResult error(std::string text)
    {
        CallToolResult r;
        r.content.push_back(Json(TextContent{"text", std::move(text)}));
        r.is_error = true;
        return r;
    }

    bool failed() const
    {
        return is_error.value_or(false);
    }
};

inline void to_json(Json& j, const CallToolResult& r)
{
    j = Json{{"content", r.content}};
    if (r.is_error)
        j["isError"] = *r.is_error;
    if (r.meta)
        j["_meta"] = *r.meta;
}

inline void from_json(const Json& j, CallToolResult& r)
{
    r.content = j.at("content").get<std::vector<Json>>();
    r.is_error.reset();
    r.meta.reset();
    if (j.contains("isError") && !j["isError"].is_null())
        r.is_error = j["isError"].get<bool>();
    if (j.contains("_meta") && !j["_meta"].is_null())
        r.meta = j["_meta"];
}

} // namespace mcptool
