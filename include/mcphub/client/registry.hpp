#pragma once
/// @file client/registry.hpp
/// @brief Name -> connection registry for stdio MCP servers

#include "mcphub/client/command_resolver.hpp"
#include "mcphub/client/connection.hpp"
#include "mcphub/client/types.hpp"
#include "mcphub/settings.hpp"
#include "mcphub/util/cancellation.hpp"

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub::client
{

enum class ConnectStatus
{
    Connected,
    AlreadyConnected
};

std::string to_string(ConnectStatus status);

struct ConnectAllResult
{
    std::vector<std::string> connected;
    std::map<std::string, std::string> failures; ///< name -> error message
};

/**
 * Maps server names to at most one live Connection each.
 *
 * The map and the table of in-flight connects are guarded by one mutex that is never held
 * across spawn, handshake or close. Failures are thrown as mcphub exceptions; see
 * mcphub/exceptions.hpp for the taxonomy.
 *
 * Usage:
 * @code
 * Registry registry(config::load_descriptors("servers.json"), Settings::from_env());
 * registry.connect("filesystem");
 * auto tools = registry.list_tools("filesystem");
 * auto result = registry.call_tool("filesystem", "read_file", {{"path", "/tmp/x"}});
 * registry.cleanup_all();
 * @endcode
 */
class Registry
{
  public:
    Registry(std::vector<ServerDescriptor> descriptors, Settings settings = {},
             CommandResolver resolver = CommandResolver::for_host());
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// All descriptors, including disabled ones, in name order
    std::vector<ServerDescriptor> list_descriptors() const;

    /// Look up one descriptor; throws UnknownServerError
    const ServerDescriptor& descriptor(const std::string& name) const;

    ConnectStatus connect(const std::string& name, const util::CancellationToken& cancel = {});

    /// Connect every enabled server; failures are recorded, never fatal
    ConnectAllResult connect_all(const util::CancellationToken& cancel = {});

    std::vector<ToolInfo> list_tools(const std::string& name);

    /// Tools of every connected server, for handing to a chat provider
    std::vector<QualifiedTool> list_all_tools();

    CallToolResult call_tool(const std::string& name, const std::string& tool, const Json& args,
                             const CallToolOptions& options = {});

    void ping(const std::string& name);

    bool is_connected(const std::string& name) const;
    std::vector<std::string> connected_names() const;

    /// Session details from the handshake
    std::optional<InitializeResult> server_info(const std::string& name) const;

    /// Child process id for a connected server (0 if none)
    int pid(const std::string& name) const;

    /// Close one connection; returns false if it was not connected
    bool disconnect(const std::string& name);

    /// Remove and close every connection within Settings::cleanup_timeout
    void cleanup_all();

    const Settings& settings() const
    {
        return settings_;
    }

  private:
    std::shared_ptr<Connection> ready_connection(const std::string& name);
    std::shared_ptr<Connection> take_entry(const std::string& name);
    void evict_if_failed(const std::string& name, const std::shared_ptr<Connection>& conn);
    ConnectStatus establish(const ServerDescriptor& descriptor, const util::CancellationToken& cancel);
    void close_with_timeout(const std::shared_ptr<Connection>& conn,
                            std::chrono::milliseconds timeout);

    std::map<std::string, ServerDescriptor> descriptors_;
    Settings settings_;
    CommandResolver resolver_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Connection>> connections_;
    std::map<std::string, std::shared_future<void>> connecting_;
    /// Bumped by cleanup_all; a connect that started earlier must not insert
    std::uint64_t generation_{0};
};

} // namespace mcphub::client
