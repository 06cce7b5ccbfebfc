#include "mcphub/client/types.hpp"
#include "mcphub/exceptions.hpp"

#include <cassert>
#include <iostream>

int main()
{
    using mcphub::Json;
    using namespace mcphub::client;

    std::cout << "Test: InitializeResult requires version and server info...\n";
    {
        auto r = Json{{"protocolVersion", "2024-11-05"},
                      {"serverInfo", {{"name", "fs"}, {"version", "1.2.0"}}},
                      {"instructions", "Use absolute paths"}}
                     .get<InitializeResult>();
        assert(r.serverInfo.name == "fs");
        assert(r.capabilities == Json::object());
        assert(r.instructions && *r.instructions == "Use absolute paths");

        bool rejected = false;
        try
        {
            (void)Json{{"serverInfo", {{"name", "fs"}}}}.get<InitializeResult>();
        }
        catch (const mcphub::ValidationError&)
        {
            rejected = true;
        }
        assert(rejected);
        std::cout << "  [PASS] handshake result validated\n";
    }

    std::cout << "Test: ToolInfo keeps optional metadata only when present...\n";
    {
        auto t = Json{{"name", "read_file"},
                      {"description", "Read a file"},
                      {"inputSchema", {{"type", "object"}}}}
                     .get<ToolInfo>();
        assert(t.name == "read_file");
        assert(!t.title && !t.outputSchema);
        Json back = t;
        assert(!back.contains("title"));
        assert(back["description"] == "Read a file");
        std::cout << "  [PASS] optional fields omitted\n";
    }

    std::cout << "Test: CallToolResult exposes the first text block...\n";
    {
        auto r = Json{{"content", Json::array({{{"type", "image"}, {"data", "AAAA"}},
                                               {{"type", "text"}, {"text", "ok"}}})},
                      {"isError", true}}
                     .get<CallToolResult>();
        assert(r.text() == "ok");
        assert(r.isError);
        assert(CallToolResult{}.text().empty());
        std::cout << "  [PASS] text() and isError\n";
    }

    std::cout << "Test: qualified tool names split at the first underscore...\n";
    {
        QualifiedTool q{"github", ToolInfo{}};
        q.tool.name = "create_issue";
        assert(q.qualified_name() == "github_create_issue");
        auto parts = split_qualified_tool_name("github_create_issue");
        assert(parts && parts->first == "github" && parts->second == "create_issue");
        assert(!split_qualified_tool_name("noseparator"));
        assert(!split_qualified_tool_name("_leading"));
        assert(!split_qualified_tool_name("trailing_"));

        Json j = q;
        assert(j["qualifiedName"] == "github_create_issue");
        assert(j["server"] == "github");
        std::cout << "  [PASS] naming round trip\n";
    }

    std::cout << "\n[OK] client type tests passed\n";
    return 0;
}
