// Registry scenarios against real child processes (tests/support/mock_stdio_server.cpp)

#include "mcphub/client/registry.hpp"
#include "mcphub/exceptions.hpp"

#include <atomic>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <set>
#include <sys/wait.h>
#include <thread>
#include <vector>

using mcphub::Json;
using mcphub::Settings;
using mcphub::client::CallToolOptions;
using mcphub::client::ConnectStatus;
using mcphub::client::Registry;
using mcphub::client::ServerDescriptor;
using namespace std::chrono_literals;

namespace
{

ServerDescriptor mock(const std::string& name, const std::string& mode, bool enabled = true)
{
    ServerDescriptor d;
    d.name = name;
    d.command = MCPHUB_MOCK_SERVER;
    d.args = {mode};
    d.enabled = enabled;
    return d;
}

Settings test_settings()
{
    Settings s;
    s.connect_timeout = 5000ms;
    s.request_timeout = 5000ms;
    s.cleanup_timeout = 5000ms;
    s.close_timeout = 1000ms;
    s.terminate_grace = 300ms;
    return s;
}

// True once every child of this process has exited and been reaped
bool no_children()
{
    int status = 0;
    return ::waitpid(-1, &status, WNOHANG) == -1 && errno == ECHILD;
}

template <typename E, typename F>
bool throws(F&& fn)
{
    try
    {
        fn();
    }
    catch (const E&)
    {
        return true;
    }
    return false;
}

} // namespace

int main()
{
    std::cout << "Test: connect, list and call against a well-behaved server...\n";
    {
        Registry registry({mock("echo", "echo")}, test_settings());
        assert(registry.connect("echo") == ConnectStatus::Connected);
        assert(registry.connect("echo") == ConnectStatus::AlreadyConnected);
        assert(registry.is_connected("echo"));
        assert(registry.pid("echo") > 0);
        assert(registry.server_info("echo")->serverInfo.name == "mock-echo");

        auto tools = registry.list_tools("echo");
        assert(tools.size() == 2);
        assert(tools[0].name == "ping");

        auto result = registry.call_tool("echo", "ping", Json::object());
        assert(result.text() == "ok");
        assert(!result.isError);

        auto echoed = registry.call_tool("echo", "echo", Json{{"x", 1}});
        assert(Json::parse(echoed.text()) == Json({{"x", 1}}));

        registry.ping("echo");
        std::cout << "  [PASS] ping tool returned \"ok\"\n";
    }
    assert(no_children());

    std::cout << "Test: unknown, disabled and unconnected names...\n";
    {
        Registry registry({mock("echo", "echo"), mock("off", "echo", false)}, test_settings());
        assert(throws<mcphub::UnknownServerError>([&] { registry.connect("missing"); }));
        assert(throws<mcphub::DisabledServerError>([&] { registry.connect("off"); }));
        assert(throws<mcphub::NotConnectedError>([&] { registry.list_tools("missing"); }));
        assert(throws<mcphub::NotConnectedError>(
            [&] { registry.call_tool("echo", "ping", Json::object()); }));
        assert(throws<mcphub::NotConnectedError>([&] { registry.ping("off"); }));
        assert(registry.connected_names().empty());
        assert(registry.list_descriptors().size() == 2);
        std::cout << "  [PASS] each refusal has its own error kind\n";
    }

    std::cout << "Test: duplicate descriptor names are rejected...\n";
    {
        assert(throws<mcphub::ValidationError>(
            [] { Registry r({mock("a", "echo"), mock("a", "echo")}, test_settings()); }));
        std::cout << "  [PASS] ValidationError\n";
    }

    std::cout << "Test: a silent server times out and leaves nothing behind...\n";
    {
        auto settings = test_settings();
        settings.connect_timeout = 1000ms;
        Registry registry({mock("silent", "silent")}, settings);
        auto start = std::chrono::steady_clock::now();
        bool timed_out = false;
        try
        {
            registry.connect("silent");
        }
        catch (const mcphub::TimeoutError& e)
        {
            timed_out = true;
            assert(std::string(e.what()).find("silent") != std::string::npos);
        }
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(timed_out);
        assert(elapsed >= 900ms && elapsed < 4s);
        assert(!registry.is_connected("silent"));
        assert(no_children());
        std::cout << "  [PASS] TimeoutError after ~1s, child reaped\n";
    }

    std::cout << "Test: a child that exits during the handshake...\n";
    {
        Registry registry({mock("dead", "exit")}, test_settings());
        bool failed = false;
        try
        {
            registry.connect("dead");
        }
        catch (const mcphub::Error& e)
        {
            failed = e.kind() == mcphub::ErrorKind::Transport || e.kind() == mcphub::ErrorKind::Spawn;
        }
        assert(failed);
        assert(registry.connected_names().empty());
        assert(no_children());
        std::cout << "  [PASS] connect failed, registry unchanged\n";
    }

    std::cout << "Test: a missing executable raises SpawnError...\n";
    {
        ServerDescriptor d;
        d.name = "ghost";
        d.command = "mcphub_nonexistent_command_xyz";
        Registry registry({d}, test_settings());
        assert(throws<mcphub::SpawnError>([&] { registry.connect("ghost"); }));
        assert(!registry.is_connected("ghost"));
        std::cout << "  [PASS] SpawnError\n";
    }

    std::cout << "Test: an unparseable handshake reply is a transport failure...\n";
    {
        Registry registry({mock("noise", "garbage")}, test_settings());
        assert(throws<mcphub::TransportError>([&] { registry.connect("noise"); }));
        assert(!registry.is_connected("noise"));
        std::cout << "  [PASS] TransportError\n";
    }

    std::cout << "Test: concurrent connects share one child process...\n";
    {
        Registry registry({mock("shared", "echo")}, test_settings());
        std::atomic<int> connected{0};
        std::atomic<int> already{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i)
        {
            threads.emplace_back(
                [&]()
                {
                    auto status = registry.connect("shared");
                    if (status == ConnectStatus::Connected)
                        ++connected;
                    else
                        ++already;
                });
        }
        for (auto& t : threads)
            t.join();
        assert(connected == 1);
        assert(already == 7);

        // Only one child exists: reaping it leaves no others
        int pid = registry.pid("shared");
        assert(pid > 0);
        registry.cleanup_all();
        assert(no_children());
        std::cout << "  [PASS] 1 connected, 7 already connected\n";
    }

    std::cout << "Test: a remote error keeps the connection Ready...\n";
    {
        Registry registry({mock("echo", "echo")}, test_settings());
        registry.connect("echo");
        bool caught = false;
        try
        {
            registry.call_tool("echo", "boom", Json::object());
        }
        catch (const mcphub::RemoteError& e)
        {
            caught = true;
            assert(e.code() == -32000);
        }
        assert(caught);
        assert(registry.is_connected("echo"));
        assert(registry.call_tool("echo", "fail", Json::object()).isError);
        assert(registry.call_tool("echo", "ping", Json::object()).text() == "ok");
        std::cout << "  [PASS] RemoteError, connection still usable\n";
    }

    std::cout << "Test: a per-call timeout does not drop the connection...\n";
    {
        Registry registry({mock("echo", "echo")}, test_settings());
        registry.connect("echo");
        CallToolOptions options;
        options.timeout = 200ms;
        assert(throws<mcphub::TimeoutError>(
            [&] { registry.call_tool("echo", "sleep", Json{{"ms", 1000}}, options); }));
        assert(registry.is_connected("echo"));
        assert(registry.call_tool("echo", "ping", Json::object()).text() == "ok");
        std::cout << "  [PASS] TimeoutError, late reply dropped\n";
    }

    std::cout << "Test: a malformed line mid-session evicts the connection...\n";
    {
        Registry registry({mock("echo", "echo")}, test_settings());
        registry.connect("echo");
        assert(throws<mcphub::TransportError>(
            [&] { registry.call_tool("echo", "garbage", Json::object()); }));
        assert(!registry.is_connected("echo"));
        assert(registry.connected_names().empty());
        assert(throws<mcphub::NotConnectedError>([&] { registry.list_tools("echo"); }));
        std::cout << "  [PASS] TransportError, entry removed\n";
    }

    std::cout << "Test: a server crash can be followed by a reconnect...\n";
    {
        Registry registry({mock("echo", "echo")}, test_settings());
        registry.connect("echo");
        int first_pid = registry.pid("echo");
        assert(throws<mcphub::TransportError>(
            [&] { registry.call_tool("echo", "exit", Json::object()); }));
        assert(!registry.is_connected("echo"));
        assert(registry.connect("echo") == ConnectStatus::Connected);
        assert(registry.pid("echo") != first_pid);
        assert(registry.call_tool("echo", "ping", Json::object()).text() == "ok");
        std::cout << "  [PASS] fresh child after the crash\n";
    }

    std::cout << "Test: paginated listings and qualified tool names...\n";
    {
        Registry registry({mock("echo", "echo"), mock("paged", "paged")}, test_settings());
        auto report = registry.connect_all();
        assert(report.connected.size() == 2);
        assert(report.failures.empty());
        assert(registry.list_tools("paged").size() == 2);

        std::set<std::string> names;
        for (const auto& q : registry.list_all_tools())
            names.insert(q.qualified_name());
        assert((names == std::set<std::string>{"echo_ping", "echo_echo", "paged_ping", "paged_echo"}));
        std::cout << "  [PASS] 4 tools across 2 servers\n";
    }

    std::cout << "Test: connect_all records failures without stopping...\n";
    {
        auto settings = test_settings();
        settings.connect_timeout = 500ms;
        Registry registry({mock("good", "echo"), mock("bad", "silent"), mock("off", "echo", false)},
                          settings);
        auto report = registry.connect_all();
        assert(report.connected == std::vector<std::string>{"good"});
        assert(report.failures.size() == 1 && report.failures.count("bad") == 1);
        assert(registry.is_connected("good"));
        std::cout << "  [PASS] one connected, one failure, disabled skipped\n";
    }

    std::cout << "Test: a cancelled connect spawns nothing...\n";
    {
        Registry registry({mock("echo", "echo")}, test_settings());
        mcphub::util::CancellationSource source;
        source.cancel();
        assert(throws<mcphub::CancelledError>([&] { registry.connect("echo", source.token()); }));
        assert(!registry.is_connected("echo"));
        std::cout << "  [PASS] CancelledError\n";
    }

    std::cout << "Test: cancelling during the handshake releases the attempt...\n";
    {
        Registry registry({mock("silent", "silent")}, test_settings());
        mcphub::util::CancellationSource source;
        std::thread canceller(
            [&]()
            {
                std::this_thread::sleep_for(200ms);
                source.cancel();
            });
        auto start = std::chrono::steady_clock::now();
        assert(throws<mcphub::CancelledError>([&] { registry.connect("silent", source.token()); }));
        auto elapsed = std::chrono::steady_clock::now() - start;
        canceller.join();
        assert(elapsed < 3s);
        assert(!registry.is_connected("silent"));
        assert(no_children());
        std::cout << "  [PASS] CancelledError, child reaped\n";
    }

    std::cout << "Test: arguments that cannot be encoded are refused...\n";
    {
        Registry registry({mock("echo", "echo")}, test_settings());
        registry.connect("echo");
        assert(throws<mcphub::ValidationError>(
            [&] { registry.call_tool("echo", "echo", Json{{"text", std::string("caf\xe9")}}); }));
        assert(registry.is_connected("echo"));
        assert(registry.call_tool("echo", "ping", Json::object()).text() == "ok");
        std::cout << "  [PASS] invalid UTF-8 rejected, connection still usable\n";
    }

    std::cout << "Test: cleanup_all during a slow connect leaves nothing running...\n";
    {
        ServerDescriptor slow;
        slow.name = "slow";
        slow.command = "/bin/sh";
        slow.args = {"-c", std::string("sleep 0.5; exec '") + MCPHUB_MOCK_SERVER + "' echo"};
        Registry registry({slow}, test_settings());

        bool abandoned = false;
        std::thread connector(
            [&]()
            {
                abandoned = throws<mcphub::CancelledError>([&] { registry.connect("slow"); });
            });
        std::this_thread::sleep_for(100ms);
        registry.cleanup_all();
        assert(registry.connected_names().empty());
        assert(no_children());

        connector.join();
        assert(abandoned);
        assert(!registry.is_connected("slow"));
        assert(registry.connect("slow") == ConnectStatus::Connected);
        std::cout << "  [PASS] in-flight connect closed by cleanup, later connect works\n";
    }

    std::cout << "Test: disconnect closes one server only...\n";
    {
        Registry registry({mock("a", "echo"), mock("b", "echo")}, test_settings());
        registry.connect_all();
        assert(registry.disconnect("a"));
        assert(!registry.disconnect("a"));
        assert(!registry.is_connected("a"));
        assert(registry.is_connected("b"));
        std::cout << "  [PASS] b still connected\n";
    }

    std::cout << "Test: cleanup_all closes every connection in time...\n";
    {
        Registry registry({mock("a", "echo"), mock("b", "paged"), mock("c", "stubborn")},
                          test_settings());
        auto report = registry.connect_all();
        assert(report.connected.size() == 3);

        auto start = std::chrono::steady_clock::now();
        registry.cleanup_all();
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(elapsed < 5s);
        assert(registry.connected_names().empty());
        assert(no_children());
        registry.cleanup_all();
        std::cout << "  [PASS] 3 closed, stubborn child killed\n";
    }

    std::cout << "\n[OK] registry tests passed\n";
    return 0;
}
