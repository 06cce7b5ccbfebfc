#pragma once
/// @file client/connection.hpp
/// @brief One live stdio link to a server: process, pumps and session

#include "mcphub/client/command_resolver.hpp"
#include "mcphub/client/session.hpp"
#include "mcphub/client/types.hpp"
#include "mcphub/settings.hpp"
#include "mcphub/util/cancellation.hpp"
#include "mcphub/util/resource_group.hpp"

#include <memory>
#include <string>

namespace mcphub::process
{
class Process;
}

namespace mcphub::client
{

/**
 * Everything opened for one server. open() acquires, in order: the child process, the
 * channels, the reader pump, the writer pump and the session dispatch loop, each
 * registered with one ResourceGroup. Any failure before the handshake completes
 * releases the group and rethrows, so a Connection only exists once it is Ready.
 */
class Connection
{
  public:
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Spawn, start pumps and run the handshake before @p deadline
    static std::shared_ptr<Connection> open(const ServerDescriptor& descriptor,
                                            const CommandResolver& resolver,
                                            const Settings& settings, Deadline deadline,
                                            const util::CancellationToken& cancel = {});

    const ServerDescriptor& descriptor() const
    {
        return descriptor_;
    }

    Session& session()
    {
        return *session_;
    }

    bool is_ready() const
    {
        return session_ && session_->is_ready();
    }

    /// Process id of the child (0 if it never started)
    int pid() const;

    /// Fail pending requests, stop pumps and dispatch, terminate the process. Idempotent.
    void close();

    /// SIGKILL the child without waiting; used when a close is abandoned
    void force_kill();

  private:
    explicit Connection(ServerDescriptor descriptor);

    ServerDescriptor descriptor_;
    std::shared_ptr<process::Process> process_;
    std::shared_ptr<util::ResourceGroup> resources_;
    std::unique_ptr<Session> session_;
};

} // namespace mcphub::client
