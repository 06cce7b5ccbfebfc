#pragma once
#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace mcphub::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}
inline std::string dump(const json& j)
{
    return j.dump();
}
inline std::string dump_pretty(const json& j, int indent = 2)
{
    return j.dump(indent);
}

/// Parse without throwing; on failure returns nullopt and fills @p error
inline std::optional<json> try_parse(const std::string& s, std::string& error)
{
    try
    {
        return json::parse(s);
    }
    catch (const json::parse_error& e)
    {
        error = e.what();
        return std::nullopt;
    }
}

} // namespace mcphub::util::json
