#pragma once
/// @file client/types.hpp
/// @brief Descriptors and MCP result types exchanged with stdio servers

#include "mcphub/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcphub::client
{

// ============================================================================
// Server Descriptor
// ============================================================================

/// How to launch one named server. Immutable once loaded.
struct ServerDescriptor
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< Overrides on top of the inherited environment
    bool enabled{true};
};

// ============================================================================
// Handshake
// ============================================================================

struct ServerInfo
{
    std::string name;
    std::string version;
};

/// Result of the initialize handshake
struct InitializeResult
{
    std::string protocolVersion;
    ServerInfo serverInfo;
    Json capabilities = Json::object();
    std::optional<std::string> instructions;
};

// ============================================================================
// Tool Types
// ============================================================================

/// Tool information as returned by tools/list
struct ToolInfo
{
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    Json inputSchema = Json::object();
    std::optional<Json> outputSchema;
    std::optional<Json> annotations;
};

/// Result of tools/call. Content blocks are kept as plain JSON so they can be
/// embedded in a follow-up model request unchanged.
struct CallToolResult
{
    Json content = Json::array();
    bool isError{false};
    std::optional<Json> structuredContent;
    std::optional<Json> meta;

    /// Text of the first text content block
    std::string text() const
    {
        for (const auto& block : content)
            if (block.is_object() && block.value("type", "") == "text")
                return block.value("text", "");
        return "";
    }
};

/// A tool together with the server that provides it
struct QualifiedTool
{
    std::string server;
    ToolInfo tool;

    /// "<server>_<tool>", the name exposed to a chat provider
    std::string qualified_name() const
    {
        return server + "_" + tool.name;
    }
};

/// Inverse of QualifiedTool::qualified_name; splits at the first underscore
std::optional<std::pair<std::string, std::string>>
split_qualified_tool_name(const std::string& qualified);

// ============================================================================
// JSON conversions
// ============================================================================

void to_json(Json& j, const ServerDescriptor& d);
void from_json(const Json& j, ServerInfo& s);
void to_json(Json& j, const ServerInfo& s);
void from_json(const Json& j, InitializeResult& r);
void to_json(Json& j, const ToolInfo& t);
void from_json(const Json& j, ToolInfo& t);
void to_json(Json& j, const CallToolResult& r);
void from_json(const Json& j, CallToolResult& r);
void to_json(Json& j, const QualifiedTool& t);

} // namespace mcphub::client
