#include "mcphub/client/registry.hpp"

#include "mcphub/exceptions.hpp"
#include "mcphub/util/log.hpp"

#include <thread>

namespace mcphub::client
{

namespace
{
std::string join_names(const std::vector<std::string>& names)
{
    if (names.empty())
        return "none";
    std::string out;
    for (const auto& n : names)
    {
        if (!out.empty())
            out += ", ";
        out += n;
    }
    return out;
}

/// Runs Connection::close on its own thread so the caller can stop waiting
struct PendingClose
{
    std::string name;
    std::shared_ptr<Connection> conn;
    std::future<void> done;
    std::thread closer;
};

PendingClose start_close(std::string name, std::shared_ptr<Connection> conn)
{
    PendingClose pc;
    pc.name = std::move(name);
    pc.conn = std::move(conn);
    auto promise = std::make_shared<std::promise<void>>();
    pc.done = promise->get_future();
    pc.closer = std::thread(
        [name = pc.name, conn = pc.conn, promise]()
        {
            try
            {
                conn->close();
            }
            catch (const std::exception& e)
            {
                log::error("Error closing connection to " + name + ": " + e.what());
            }
            catch (...)
            {
                log::error("Error closing connection to " + name + ": unknown exception");
            }
            promise->set_value();
        });
    return pc;
}

void finish_close(PendingClose& pc, Deadline deadline)
{
    if (pc.done.wait_until(deadline) == std::future_status::ready)
    {
        pc.closer.join();
        log::info("Closed connection to " + pc.name);
        return;
    }
    log::warn("Timeout closing connection to " + pc.name + ", killing its process");
    pc.conn->force_kill();
    pc.closer.detach();
}
} // namespace

std::string to_string(ConnectStatus status)
{
    return status == ConnectStatus::Connected ? "connected" : "already_connected";
}

Registry::Registry(std::vector<ServerDescriptor> descriptors, Settings settings,
                   CommandResolver resolver)
    : settings_(std::move(settings)), resolver_(std::move(resolver))
{
    for (auto& d : descriptors)
    {
        if (d.name.empty())
            throw ValidationError("Server descriptor with an empty name");
        std::string name = d.name;
        if (!descriptors_.emplace(name, std::move(d)).second)
            throw ValidationError("Duplicate server name: " + name);
    }
}

Registry::~Registry()
{
    cleanup_all();
}

std::vector<ServerDescriptor> Registry::list_descriptors() const
{
    std::vector<ServerDescriptor> out;
    out.reserve(descriptors_.size());
    for (const auto& [name, d] : descriptors_)
        out.push_back(d);
    return out;
}

const ServerDescriptor& Registry::descriptor(const std::string& name) const
{
    auto it = descriptors_.find(name);
    if (it == descriptors_.end())
        throw UnknownServerError("Unknown server: " + name);
    return it->second;
}

// ============================================================================
// Connect
// ============================================================================

ConnectStatus Registry::connect(const std::string& name, const util::CancellationToken& cancel)
{
    const ServerDescriptor& desc = descriptor(name);
    if (!desc.enabled)
        throw DisabledServerError("Server " + name + " is disabled");
    return establish(desc, cancel);
}

ConnectStatus Registry::establish(const ServerDescriptor& desc,
                                  const util::CancellationToken& cancel)
{
    const std::string& name = desc.name;
    std::shared_ptr<Connection> stale;
    std::shared_future<void> in_flight;
    std::promise<void> attempt;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = generation_;
        auto it = connections_.find(name);
        if (it != connections_.end())
        {
            if (it->second->is_ready())
            {
                log::info("Already connected to " + name);
                return ConnectStatus::AlreadyConnected;
            }
            stale = it->second;
            connections_.erase(it);
        }

        auto pending = connecting_.find(name);
        if (pending != connecting_.end())
            in_flight = pending->second;
        else
            connecting_.emplace(name, attempt.get_future().share());
    }

    if (in_flight.valid())
    {
        // Someone else is connecting this name; share their outcome
        while (in_flight.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready)
        {
            if (cancel.is_cancelled())
                throw CancelledError("Connection to " + name + " was cancelled");
        }
        in_flight.get();
        return ConnectStatus::AlreadyConnected;
    }

    if (stale)
    {
        log::info("Cleaning up previous resources for " + name);
        close_with_timeout(stale, settings_.close_timeout);
    }

    log::info("Connecting to server: " + name);
    std::shared_ptr<Connection> conn;
    try
    {
        conn = Connection::open(desc, resolver_, settings_,
                                deadline_after(settings_.connect_timeout), cancel);
    }
    catch (const std::exception& e)
    {
        log::error("Failed to connect to " + name + ": " + e.what());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connecting_.erase(name);
        }
        attempt.set_exception(std::current_exception());
        throw;
    }

    bool drained = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connecting_.erase(name);
        if (generation_ == generation)
            connections_[name] = conn;
        else
            drained = true;
    }

    if (drained)
    {
        // cleanup_all ran while the handshake was in progress
        log::warn("Registry was cleaned up while connecting to " + name +
                  "; closing the new connection");
        close_with_timeout(conn, settings_.close_timeout);
        auto error = std::make_exception_ptr(
            CancelledError("Connection to " + name + " was abandoned by cleanup"));
        attempt.set_exception(error);
        std::rethrow_exception(error);
    }

    attempt.set_value();
    log::info("Successfully connected to " + name);
    return ConnectStatus::Connected;
}

ConnectAllResult Registry::connect_all(const util::CancellationToken& cancel)
{
    ConnectAllResult result;
    for (const auto& [name, desc] : descriptors_)
    {
        if (!desc.enabled)
            continue;
        if (cancel.is_cancelled())
        {
            result.failures[name] = "cancelled";
            continue;
        }
        try
        {
            establish(desc, cancel);
            result.connected.push_back(name);
        }
        catch (const std::exception& e)
        {
            result.failures[name] = e.what();
        }
    }
    log::info("Connected to " + std::to_string(result.connected.size()) +
              " servers: " + join_names(result.connected));
    return result;
}

// ============================================================================
// Operations on connected servers
// ============================================================================

std::shared_ptr<Connection> Registry::ready_connection(const std::string& name)
{
    std::shared_ptr<Connection> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(name);
        if (it == connections_.end())
            throw NotConnectedError("Server " + name + " not connected");
        if (it->second->is_ready())
            return it->second;
        stale = it->second;
        connections_.erase(it);
    }

    std::string why = stale->session().failure().value_or("session closed");
    close_with_timeout(stale, settings_.close_timeout);
    throw NotConnectedError("Server " + name + " not connected: " + why);
}

void Registry::evict_if_failed(const std::string& name, const std::shared_ptr<Connection>& conn)
{
    if (conn->is_ready())
        return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(name);
        if (it == connections_.end() || it->second != conn)
            return;
        connections_.erase(it);
    }
    log::warn("Connection to " + name + " failed; removed from registry");
    close_with_timeout(conn, settings_.close_timeout);
}

std::vector<ToolInfo> Registry::list_tools(const std::string& name)
{
    auto conn = ready_connection(name);
    try
    {
        return conn->session().list_tools();
    }
    catch (const TransportError&)
    {
        evict_if_failed(name, conn);
        throw;
    }
}

std::vector<QualifiedTool> Registry::list_all_tools()
{
    std::vector<QualifiedTool> out;
    for (const auto& name : connected_names())
    {
        try
        {
            for (auto& tool : list_tools(name))
                out.push_back(QualifiedTool{name, std::move(tool)});
        }
        catch (const std::exception& e)
        {
            log::error("Error listing tools for server " + name + ": " + e.what());
        }
    }
    return out;
}

CallToolResult Registry::call_tool(const std::string& name, const std::string& tool,
                                   const Json& args, const CallToolOptions& options)
{
    auto conn = ready_connection(name);
    try
    {
        return conn->session().call_tool(tool, args, options);
    }
    catch (const TransportError&)
    {
        evict_if_failed(name, conn);
        throw;
    }
}

void Registry::ping(const std::string& name)
{
    auto conn = ready_connection(name);
    try
    {
        conn->session().ping();
    }
    catch (const TransportError&)
    {
        evict_if_failed(name, conn);
        throw;
    }
}

bool Registry::is_connected(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    return it != connections_.end() && it->second->is_ready();
}

std::vector<std::string> Registry::connected_names() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, conn] : connections_)
        if (conn->is_ready())
            names.push_back(name);
    return names;
}

std::optional<InitializeResult> Registry::server_info(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    if (it == connections_.end())
        return std::nullopt;
    return it->second->session().server_info();
}

int Registry::pid(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    return it == connections_.end() ? 0 : it->second->pid();
}

// ============================================================================
// Teardown
// ============================================================================

std::shared_ptr<Connection> Registry::take_entry(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    if (it == connections_.end())
        return nullptr;
    auto conn = it->second;
    connections_.erase(it);
    return conn;
}

bool Registry::disconnect(const std::string& name)
{
    auto conn = take_entry(name);
    if (!conn)
        return false;
    close_with_timeout(conn, settings_.cleanup_timeout);
    return true;
}

void Registry::close_with_timeout(const std::shared_ptr<Connection>& conn,
                                  std::chrono::milliseconds timeout)
{
    auto pc = start_close(conn->descriptor().name, conn);
    finish_close(pc, deadline_after(timeout));
}

void Registry::cleanup_all()
{
    std::map<std::string, std::shared_ptr<Connection>> entries;
    std::map<std::string, std::shared_future<void>> in_flight;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // In-flight connects see the new generation and close their own connection
        ++generation_;
        entries.swap(connections_);
        in_flight = connecting_;
    }
    if (entries.empty() && in_flight.empty())
        return;

    const auto deadline = deadline_after(settings_.cleanup_timeout);
    std::vector<PendingClose> closes;
    closes.reserve(entries.size());
    for (auto& [name, conn] : entries)
        closes.push_back(start_close(name, conn));
    for (auto& pc : closes)
        finish_close(pc, deadline);

    for (auto& [name, attempt] : in_flight)
    {
        if (attempt.wait_until(deadline) != std::future_status::ready)
            log::warn("Connect to " + name + " still running after cleanup timeout");
    }

    log::info("All server connections cleaned up");
}

} // namespace mcphub::client
