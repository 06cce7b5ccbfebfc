#include "mcphub/config.hpp"

#include "mcphub/exceptions.hpp"
#include "mcphub/util/json.hpp"
#include "mcphub/util/log.hpp"

#include <fstream>
#include <sstream>

namespace mcphub::config
{

namespace
{
client::ServerDescriptor parse_descriptor(const std::string& name, const Json& entry)
{
    if (!entry.is_object())
        throw ValidationError("Server '" + name + "' must be an object");
    if (!entry.contains("command") || !entry["command"].is_string() ||
        entry["command"].get<std::string>().empty())
        throw ValidationError("Server '" + name + "' is missing 'command'");

    client::ServerDescriptor d;
    d.name = name;
    d.command = entry["command"].get<std::string>();
    try
    {
        if (entry.contains("args") && !entry["args"].is_null())
            d.args = entry["args"].get<std::vector<std::string>>();
        if (entry.contains("env") && !entry["env"].is_null())
            d.env = entry["env"].get<std::map<std::string, std::string>>();
        d.enabled = !entry.value("disabled", false);
    }
    catch (const Json::type_error& e)
    {
        throw ValidationError("Server '" + name + "': " + e.what());
    }
    return d;
}
} // namespace

std::vector<client::ServerDescriptor> descriptors_from_json(const Json& document)
{
    if (!document.is_object() || !document.contains("mcpServers") ||
        !document["mcpServers"].is_object())
        throw ValidationError("Configuration must contain an 'mcpServers' object");

    std::vector<client::ServerDescriptor> out;
    for (const auto& [name, entry] : document["mcpServers"].items())
        out.push_back(parse_descriptor(name, entry));
    return out;
}

std::vector<client::ServerDescriptor> load_descriptors(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in)
        throw ValidationError("Cannot open configuration file " + path.string());
    std::stringstream buffer;
    buffer << in.rdbuf();

    std::string error;
    auto document = util::json::try_parse(buffer.str(), error);
    if (!document)
        throw ValidationError("Cannot parse " + path.string() + ": " + error);

    auto descriptors = descriptors_from_json(*document);
    log::info("Loaded " + std::to_string(descriptors.size()) + " server configurations from " +
              path.string());
    return descriptors;
}

} // namespace mcphub::config
