#include "mcphub/client/types.hpp"

#include "mcphub/exceptions.hpp"

namespace mcphub::client
{

std::optional<std::pair<std::string, std::string>>
split_qualified_tool_name(const std::string& qualified)
{
    auto pos = qualified.find('_');
    if (pos == std::string::npos || pos == 0 || pos + 1 == qualified.size())
        return std::nullopt;
    return std::make_pair(qualified.substr(0, pos), qualified.substr(pos + 1));
}

void to_json(Json& j, const ServerDescriptor& d)
{
    j = Json{{"name", d.name},
             {"command", d.command},
             {"args", d.args},
             {"env", d.env},
             {"disabled", !d.enabled}};
}

void from_json(const Json& j, ServerInfo& s)
{
    s.name = j.value("name", "");
    s.version = j.value("version", "");
}

void to_json(Json& j, const ServerInfo& s)
{
    j = Json{{"name", s.name}, {"version", s.version}};
}

void from_json(const Json& j, InitializeResult& r)
{
    if (!j.is_object())
        throw ValidationError("initialize result must be an object");
    if (!j.contains("protocolVersion") || !j["protocolVersion"].is_string())
        throw ValidationError("initialize result is missing 'protocolVersion'");
    if (!j.contains("serverInfo") || !j["serverInfo"].is_object())
        throw ValidationError("initialize result is missing 'serverInfo'");
    r.protocolVersion = j["protocolVersion"].get<std::string>();
    r.serverInfo = j["serverInfo"].get<ServerInfo>();
    r.capabilities = j.value("capabilities", Json::object());
    if (j.contains("instructions") && j["instructions"].is_string())
        r.instructions = j["instructions"].get<std::string>();
}

void to_json(Json& j, const ToolInfo& t)
{
    j = Json{{"name", t.name}, {"inputSchema", t.inputSchema}};
    if (t.title)
        j["title"] = *t.title;
    if (t.description)
        j["description"] = *t.description;
    if (t.outputSchema)
        j["outputSchema"] = *t.outputSchema;
    if (t.annotations)
        j["annotations"] = *t.annotations;
}

void from_json(const Json& j, ToolInfo& t)
{
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string())
        throw ValidationError("tool entry is missing 'name'");
    t.name = j["name"].get<std::string>();
    if (j.contains("title") && j["title"].is_string())
        t.title = j["title"].get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        t.description = j["description"].get<std::string>();
    t.inputSchema = j.value("inputSchema", Json::object());
    if (j.contains("outputSchema"))
        t.outputSchema = j["outputSchema"];
    if (j.contains("annotations"))
        t.annotations = j["annotations"];
}

void to_json(Json& j, const CallToolResult& r)
{
    j = Json{{"content", r.content}, {"isError", r.isError}};
    if (r.structuredContent)
        j["structuredContent"] = *r.structuredContent;
    if (r.meta)
        j["_meta"] = *r.meta;
}

void from_json(const Json& j, CallToolResult& r)
{
    if (!j.is_object())
        throw ValidationError("tools/call result must be an object");
    r.content = j.value("content", Json::array());
    if (!r.content.is_array())
        throw ValidationError("tools/call result 'content' must be an array");
    r.isError = j.value("isError", false);
    if (j.contains("structuredContent"))
        r.structuredContent = j["structuredContent"];
    if (j.contains("_meta"))
        r.meta = j["_meta"];
}

void to_json(Json& j, const QualifiedTool& t)
{
    j = Json{{"server", t.server},
             {"name", t.tool.name},
             {"qualifiedName", t.qualified_name()},
             {"inputSchema", t.tool.inputSchema}};
    if (t.tool.description)
        j["description"] = *t.tool.description;
}

} // namespace mcphub::client
