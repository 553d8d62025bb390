#pragma once
#include "mcptool/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mcptool::prompts
{

/// MCP Prompt argument definition
struct PromptArgument
{
    std::string name;
    std::optional<std::string> description;
    std::optional<bool> required;
};

/// MCP Prompt template as advertised by prompts/list
struct Prompt
{
    std::string name;
    std::optional<std::string> description;
    std::optional<std::vector<PromptArgument>> arguments;
};

inline void to_json(Json& j, const PromptArgument& a)
{
    j = Json{{"name", a.name}};
    if (a.description)
        j["description"] = *a.description;
    if (a.required)
        j["required"] = *a.required;
}

inline void from_json(const Json& j, PromptArgument& a)
{
    a.name = j.at("name").get<std::string>();
    if (j.contains("description"))
        a.description = j["description"].get<std::string>();
    if (j.contains("required"))
        a.required = j["required"].get<bool>();
}

inline void to_json(Json& j, const Prompt& p)
{
    j = Json{{"name", p.name}};
    if (p.description)
        j["description"] = *p.description;
    if (p.arguments)
        j["arguments"] = *p.arguments;
}

inline void from_json(const Json& j, Prompt& p)
{
    p.name = j.at("name").get<std::string>();
    if (j.contains("description"))
        p.description = j["description"].get<std::string>();
    if (j.contains("arguments"))
        p.arguments = j["arguments"].get<std::vector<PromptArgument>>();
}

} // namespace mcptool::prompts
