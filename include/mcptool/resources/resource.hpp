#pragma once
#include "mcptool/types.hpp"

#include <optional>
#include <string>

namespace mcptool::resources
{

/// MCP Resource definition. Static: the server only lists resources.
struct Resource
{
    std::string uri;                        // e.g., "file:///example.txt"
    std::string name;                       // Human-readable name
    std::optional<std::string> description; // Optional description
    std::optional<std::string> mime_type;   // MIME type hint
    std::optional<Json> annotations;
};

inline void to_json(Json& j, const Resource& r)
{
    j = Json{{"uri", r.uri}, {"name", r.name}};
    if (r.description)
        j["description"] = *r.description;
    if (r.mime_type)
        j["mimeType"] = *r.mime_type;
    if (r.annotations)
        j["annotations"] = *r.annotations;
}

inline void from_json(const Json& j, Resource& r)
{
    r.uri = j.at("uri").get<std::string>();
    r.name = j.at("name").get<std::string>();
    if (j.contains("description"))
        r.description = j["description"].get<std::string>();
    if (j.contains("mimeType"))
        r.mime_type = j["mimeType"].get<std::string>();
    if (j.contains("annotations"))
        r.annotations = j["annotations"];
}

} // namespace mcptool::resources
