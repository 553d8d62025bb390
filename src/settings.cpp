#include "mcptool/settings.hpp"

#include "mcptool/exceptions.hpp"
#include "mcptool/util/url.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace mcptool
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

void Settings::apply_env()
{
    auto lvl = getenv_str("MCPTOOL_LOG_LEVEL", log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    log_level = lvl;
    log_file = getenv_str("MCPTOOL_LOG_FILE", log_file);
    transport = getenv_str("MCPTOOL_TRANSPORT", transport);
    ws_addr = getenv_str("MCPTOOL_WS_ADDR", ws_addr);
}

void Settings::apply_json(const Json& j)
{
    if (!j.is_object())
        throw ValidationError(std::string("config must be a JSON object, got ") + j.type_name());
    try
    {
        if (j.contains("log_level"))
            log_level = j.at("log_level").get<std::string>();
        if (j.contains("log_file"))
            log_file = j.at("log_file").get<std::string>();
        if (j.contains("transport"))
            transport = j.at("transport").get<std::string>();
        if (j.contains("ws_addr"))
            ws_addr = j.at("ws_addr").get<std::string>();
    }
    catch (const Json::exception& e)
    {
        throw ValidationError(std::string("invalid config value: ") + e.what());
    }
    if (j.contains("queue_capacity"))
    {
        const auto& v = j.at("queue_capacity");
        if (!v.is_number_integer() || v.get<std::int64_t>() <= 0)
            throw ValidationError("queue_capacity must be a positive integer");
        queue_capacity = static_cast<std::size_t>(v.get<std::int64_t>());
    }
}

Settings Settings::from_env()
{
    Settings s;
    s.apply_env();
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    s.apply_json(j);
    return s;
}

void Settings::validate() const
{
    if (transport != "stdio" && transport != "websocket")
        throw ValidationError("Invalid transport type: " + transport);
    if (transport == "websocket")
        (void)util::split_host_port(ws_addr);
    if (queue_capacity == 0)
        throw ValidationError("queue_capacity must be positive");
}

} // namespace mcptool
