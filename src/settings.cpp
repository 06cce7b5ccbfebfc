#include "mcphub/settings.hpp"

#include "mcphub/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mcphub
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::chrono::milliseconds getenv_ms(const char* key, std::chrono::milliseconds defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        long long ms = std::stoll(v);
        if (ms <= 0)
            return defv;
        return std::chrono::milliseconds(ms);
    }
    catch (const std::exception&)
    {
        throw ValidationError(std::string("Invalid millisecond value for ") + key + ": " + v);
    }
}

static std::chrono::milliseconds json_ms(const Json& j, const char* key,
                                         std::chrono::milliseconds defv)
{
    if (!j.contains(key))
        return defv;
    const auto& v = j.at(key);
    if (!v.is_number_integer() || v.get<long long>() <= 0)
        throw ValidationError(std::string("Setting '") + key +
                              "' must be a positive integer (milliseconds)");
    return std::chrono::milliseconds(v.get<long long>());
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MCPHUB_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;
    s.connect_timeout = getenv_ms("MCPHUB_CONNECT_TIMEOUT_MS", s.connect_timeout);
    s.request_timeout = getenv_ms("MCPHUB_REQUEST_TIMEOUT_MS", s.request_timeout);
    s.cleanup_timeout = getenv_ms("MCPHUB_CLEANUP_TIMEOUT_MS", s.cleanup_timeout);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    s.connect_timeout = json_ms(j, "connect_timeout", s.connect_timeout);
    s.request_timeout = json_ms(j, "request_timeout", s.request_timeout);
    s.cleanup_timeout = json_ms(j, "cleanup_timeout", s.cleanup_timeout);
    s.close_timeout = json_ms(j, "close_timeout", s.close_timeout);
    s.terminate_grace = json_ms(j, "terminate_grace", s.terminate_grace);
    if (j.contains("channel_capacity"))
        s.channel_capacity = j.at("channel_capacity").get<std::size_t>();
    if (j.contains("protocol_version"))
        s.protocol_version = j.at("protocol_version").get<std::string>();
    if (j.contains("client_name"))
        s.client_name = j.at("client_name").get<std::string>();
    if (j.contains("client_version"))
        s.client_version = j.at("client_version").get<std::string>();
    return s;
}

} // namespace mcphub
