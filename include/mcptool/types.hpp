#pragma once
#include "mcptool/exceptions.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mcptool
{

using Json = nlohmann::json;

/// Name and version of an MCP peer (clientInfo / serverInfo).
struct Implementation
{
    std::string name;
    std::string version;
};

struct ListChangedCapability
{
    std::optional<bool> list_changed;
};

struct ResourcesCapability
{
    std::optional<bool> list_changed;
    std::optional<bool> subscribe;
};

/// Feature areas advertised by the server at initialize time.
struct ServerCapabilities
{
    std::optional<Json> experimental;
    std::optional<Json> logging;
    std::optional<ListChangedCapability> prompts;
    std::optional<ResourcesCapability> resources;
    std::optional<ListChangedCapability> tools;
};

struct InitializeRequestParams
{
    Json capabilities = Json::object(); // client capabilities are opaque to the server
    Implementation client_info;
    std::string protocol_version;
};

struct InitializeResult
{
    ServerCapabilities capabilities;
    std::string protocol_version;
    Implementation server_info;
    std::optional<std::string> instructions;
    std::optional<Json> meta;
};

struct CallToolRequestParams
{
    std::string name;
    std::optional<Json> arguments;
};

/// requestId is a string or an integer; kept as raw JSON.
struct CancelledNotificationParams
{
    Json request_id;
    std::optional<std::string> reason;
};

namespace detail
{
inline const Json& require_field(const Json& j, const char* key)
{
    if (!j.is_object())
        throw ValidationError(std::string("invalid type: ") + j.type_name() +
                              ", expected an object");
    auto it = j.find(key);
    if (it == j.end())
        throw ValidationError(std::string("missing field `") + key + "`");
    return *it;
}

inline std::string require_string(const Json& j, const char* key)
{
    const auto& v = require_field(j, key);
    if (!v.is_string())
        throw ValidationError(std::string("invalid type: ") + v.type_name() +
                              ", expected a string for field `" + key + "`");
    return v.get<std::string>();
}
} // namespace detail

// nlohmann::json adapters
inline void to_json(Json& j, const Implementation& impl)
{
    j = Json{{"name", impl.name}, {"version", impl.version}};
}

inline void from_json(const Json& j, Implementation& impl)
{
    impl.name = detail::require_string(j, "name");
    impl.version = detail::require_string(j, "version");
}

inline void to_json(Json& j, const ListChangedCapability& c)
{
    j = Json::object();
    if (c.list_changed)
        j["listChanged"] = *c.list_changed;
}

inline void to_json(Json& j, const ResourcesCapability& c)
{
    j = Json::object();
    if (c.list_changed)
        j["listChanged"] = *c.list_changed;
    if (c.subscribe)
        j["subscribe"] = *c.subscribe;
}

inline void to_json(Json& j, const ServerCapabilities& caps)
{
    j = Json::object();
    if (caps.experimental)
        j["experimental"] = *caps.experimental;
    if (caps.logging)
        j["logging"] = *caps.logging;
    if (caps.prompts)
        j["prompts"] = *caps.prompts;
    if (caps.resources)
        j["resources"] = *caps.resources;
    if (caps.tools)
        j["tools"] = *caps.tools;
}

inline void from_json(const Json& j, InitializeRequestParams& p)
{
    const auto& caps = detail::require_field(j, "capabilities");
    if (!caps.is_object())
        throw ValidationError("capabilities must be an object");
    p.capabilities = caps;
    p.client_info = detail::require_field(j, "clientInfo").get<Implementation>();
    p.protocol_version = detail::require_string(j, "protocolVersion");
}

inline void to_json(Json& j, const InitializeResult& r)
{
    j = Json{{"capabilities", r.capabilities},
             {"protocolVersion", r.protocol_version},
             {"serverInfo", r.server_info}};
    if (r.instructions)
        j["instructions"] = *r.instructions;
    if (r.meta)
        j["_meta"] = *r.meta;
}

inline void from_json(const Json& j, CallToolRequestParams& p)
{
    p.name = detail::require_string(j, "name");
    auto it = j.find("arguments");
    if (it != j.end() && !it->is_null())
    {
        if (!it->is_object())
            throw ValidationError("arguments must be an object");
        p.arguments = *it;
    }
}

inline void from_json(const Json& j, CancelledNotificationParams& p)
{
    const auto& id = detail::require_field(j, "requestId");
    if (!id.is_string() && !id.is_number_integer())
        throw ValidationError("requestId must be a string or an integer");
    p.request_id = id;
    auto it = j.find("reason");
    if (it != j.end() && !it->is_null())
        p.reason = detail::require_string(j, "reason");
}

} // namespace mcptool
