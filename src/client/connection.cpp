#include "mcphub/client/connection.hpp"

#include "internal/process.hpp"
#include "internal/stdio_pumps.hpp"
#include "mcphub/exceptions.hpp"
#include "mcphub/util/log.hpp"

#include <sstream>

namespace mcphub::client
{

namespace
{
std::string describe(const LaunchCommand& cmd)
{
    std::ostringstream oss;
    oss << cmd.command;
    for (const auto& a : cmd.args)
        oss << " " << a;
    return oss.str();
}
} // namespace

Connection::Connection(ServerDescriptor descriptor)
    : descriptor_(std::move(descriptor)), resources_(std::make_shared<util::ResourceGroup>())
{
}

Connection::~Connection()
{
    close();
}

std::shared_ptr<Connection> Connection::open(const ServerDescriptor& descriptor,
                                             const CommandResolver& resolver,
                                             const Settings& settings, Deadline deadline,
                                             const util::CancellationToken& cancel)
{
    std::shared_ptr<Connection> conn(new Connection(descriptor));
    auto& group = conn->resources_;
    const std::string& name = descriptor.name;

    try
    {
        if (cancel.is_cancelled())
            throw CancelledError("Connection to " + name + " was cancelled");

        LaunchCommand cmd = resolver.resolve(LaunchCommand{descriptor.command, descriptor.args});
        for (const auto& [key, value] : descriptor.env)
            log::debug("[" + name + "] environment override " + key + "=" + value);
        log::info("Starting " + describe(cmd));

        process::ProcessOptions options;
        options.environment = descriptor.env;
        auto proc = std::make_shared<process::Process>();
        proc->spawn(cmd.command, cmd.args, options);
        conn->process_ = proc;
        const auto grace = settings.terminate_grace;
        group->acquire("process " + name, [proc, grace]() { proc->shutdown(grace); });

        auto inbound = std::make_shared<transport::InboundChannel>(settings.channel_capacity);
        auto outbound = std::make_shared<transport::OutboundChannel>(settings.channel_capacity);
        group->acquire("channels " + name,
                       [inbound, outbound]()
                       {
                           inbound->close();
                           outbound->close();
                       });

        auto reader = std::make_shared<transport::ReaderPump>(proc, inbound, name);
        reader->start();
        group->acquire("stdout reader " + name, [reader]() { reader->stop(); });

        auto writer = std::make_shared<transport::WriterPump>(proc, outbound, name);
        writer->start();
        group->acquire("stdin writer " + name, [writer]() { writer->stop(); });

        SessionOptions session_options;
        session_options.protocol_version = settings.protocol_version;
        session_options.client_name = settings.client_name;
        session_options.client_version = settings.client_version;
        session_options.request_timeout = settings.request_timeout;
        conn->session_ = std::make_unique<Session>(inbound, outbound, group, session_options, name);
        conn->session_->start();

        auto budget = remaining_until(deadline);
        if (budget.count() == 0)
            throw TimeoutError("Timeout connecting to " + name);
        try
        {
            conn->session_->initialize(budget, cancel);
        }
        catch (const TimeoutError&)
        {
            throw TimeoutError("Timeout connecting to " + name + " after " +
                               std::to_string(budget.count()) + " ms");
        }
        return conn;
    }
    catch (...)
    {
        conn->close();
        throw;
    }
}

int Connection::pid() const
{
    return process_ ? process_->pid() : 0;
}

void Connection::close()
{
    if (session_)
        session_->close();
    if (resources_)
        resources_->release_all();
}

void Connection::force_kill()
{
    if (process_)
        process_->kill();
}

} // namespace mcphub::client
