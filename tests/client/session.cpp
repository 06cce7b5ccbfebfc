// Session against an in-memory peer that plays the server side of the channels

#include "mcphub/client/session.hpp"
#include "mcphub/exceptions.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

using mcphub::Json;
using mcphub::client::CallToolOptions;
using mcphub::client::Session;
using mcphub::client::SessionOptions;
using mcphub::client::SessionState;
using mcphub::transport::Channel;
using mcphub::transport::Frame;
using mcphub::transport::JsonRpcMessage;
using namespace std::chrono_literals;

namespace
{

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 5000ms)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

class Peer
{
  public:
    using Handler = std::function<void(Peer&, const JsonRpcMessage&)>;

    Peer(std::shared_ptr<Channel<Frame>> to_client, std::shared_ptr<Channel<JsonRpcMessage>> from_client)
        : to_client_(std::move(to_client)), from_client_(std::move(from_client))
    {
    }

    ~Peer()
    {
        from_client_->close();
        to_client_->close();
        if (thread_.joinable())
            thread_.join();
    }

    void start(Handler handler)
    {
        handler_ = std::move(handler);
        thread_ = std::thread(
            [this]()
            {
                while (auto message = from_client_->receive())
                {
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        seen_.push_back(*message);
                    }
                    handler_(*this, *message);
                }
            });
    }

    void push(JsonRpcMessage message)
    {
        (void)to_client_->send(Frame::decoded(std::move(message)));
    }

    // Occupies free slots on the client's outbound channel
    void fill_outbound()
    {
        while (from_client_->try_send(JsonRpcMessage::notification("filler")) ==
               mcphub::transport::ChannelStatus::Ok)
        {
        }
    }

    void push_garbage()
    {
        (void)to_client_->send(Frame::parse_error("Invalid JSON", "{oops"));
    }

    void reply(const JsonRpcMessage& request, Json result)
    {
        push(JsonRpcMessage::response(request.id, std::move(result)));
    }

    std::optional<JsonRpcMessage> find(const std::function<bool(const JsonRpcMessage&)>& pred)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& m : seen_)
            if (pred(m))
                return m;
        return std::nullopt;
    }

    bool saw_method(const std::string& method)
    {
        return find([&](const JsonRpcMessage& m) { return m.method == method; }).has_value();
    }

    std::optional<JsonRpcMessage> held;

  private:
    std::shared_ptr<Channel<Frame>> to_client_;
    std::shared_ptr<Channel<JsonRpcMessage>> from_client_;
    Handler handler_;
    std::mutex mutex_;
    std::vector<JsonRpcMessage> seen_;
    std::thread thread_;
};

Json text_result(const std::string& text)
{
    return Json{{"content", Json::array({{{"type", "text"}, {"text", text}}})}, {"isError", false}};
}

Json tool_entry(const std::string& name)
{
    return Json{{"name", name}, {"inputSchema", {{"type", "object"}}}};
}

// A well-behaved server with a few tools that misbehave on purpose
void serve(Peer& peer, const JsonRpcMessage& m)
{
    if (!m.is_request())
        return;
    if (m.method == "initialize")
    {
        peer.reply(m, Json{{"protocolVersion", "2024-11-05"},
                           {"capabilities", {{"tools", Json::object()}}},
                           {"serverInfo", {{"name", "peer"}, {"version", "0.0.1"}}}});
        return;
    }
    if (m.method == "ping")
    {
        peer.reply(m, Json::object());
        return;
    }
    if (m.method == "tools/list")
    {
        const Json params = m.params.value_or(Json::object());
        if (params.value("cursor", "") == "2")
            peer.reply(m, Json{{"tools", Json::array({tool_entry("b")})}});
        else
            peer.reply(m, Json{{"tools", Json::array({tool_entry("a")})}, {"nextCursor", "2"}});
        return;
    }
    if (m.method != "tools/call")
        return;

    const std::string name = m.params->value("name", "");
    if (name == "ok")
        peer.reply(m, text_result("ok"));
    else if (name == "boom")
        peer.push(JsonRpcMessage::error_response(m.id, -32000, "boom", Json{{"detail", 1}}));
    else if (name == "notify")
    {
        peer.push(JsonRpcMessage::notification("notifications/message", Json{{"data", "hi"}}));
        peer.reply(m, text_result("notified"));
    }
    else if (name == "garbage")
        peer.push_garbage();
    else if (name == "first")
        peer.held = m;
    else if (name == "second")
    {
        peer.reply(m, text_result("second"));
        peer.reply(*peer.held, text_result("first"));
    }
    // "sleep" never answers
}

struct Harness
{
    explicit Harness(Peer::Handler handler = serve, SessionOptions options = {},
                     std::size_t capacity = 16)
        : inbound(std::make_shared<Channel<Frame>>(16)),
          outbound(std::make_shared<Channel<JsonRpcMessage>>(capacity)), peer(inbound, outbound)
    {
        peer.start(std::move(handler));
        session = std::make_unique<Session>(inbound, outbound,
                                            std::make_shared<mcphub::util::ResourceGroup>(),
                                            options, "test");
        session->start();
    }

    std::shared_ptr<Channel<Frame>> inbound;
    std::shared_ptr<Channel<JsonRpcMessage>> outbound;
    Peer peer;
    std::unique_ptr<Session> session;
};

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
    std::cout << "Test: handshake moves the session to Ready...\n";
    {
        Harness h;
        assert(h.session->state() == SessionState::Unconnected);
        auto info = h.session->initialize(2000ms);
        assert(info.serverInfo.name == "peer");
        assert(h.session->is_ready());
        assert(h.session->server_info()->protocolVersion == "2024-11-05");
        assert(wait_until([&] { return h.peer.saw_method("notifications/initialized"); }));

        auto init = h.peer.find([](const JsonRpcMessage& m) { return m.method == "initialize"; });
        assert((*init->params)["clientInfo"]["name"] == "mcphub");
        std::cout << "  [PASS] initialize + initialized\n";
    }

    std::cout << "Test: requests before the handshake are refused...\n";
    {
        Harness h;
        assert(throws<mcphub::NotConnectedError>([&] { h.session->list_tools(); }));
        std::cout << "  [PASS] NotConnectedError while Unconnected\n";
    }

    std::cout << "Test: list_tools follows nextCursor...\n";
    {
        Harness h;
        h.session->initialize(2000ms);
        auto tools = h.session->list_tools();
        assert(tools.size() == 2);
        assert(tools[0].name == "a" && tools[1].name == "b");
        std::cout << "  [PASS] two pages merged\n";
    }

    std::cout << "Test: responses are matched by id, not by arrival order...\n";
    {
        Harness h;
        h.session->initialize(2000ms);
        std::string first_text;
        std::thread first([&] { first_text = h.session->call_tool("first", Json::object()).text(); });
        assert(wait_until([&] {
            return h.peer.find([](const JsonRpcMessage& m)
                               { return m.method == "tools/call" && (*m.params)["name"] == "first"; })
                .has_value();
        }));
        auto second = h.session->call_tool("second", Json::object());
        first.join();
        assert(second.text() == "second");
        assert(first_text == "first");
        assert(h.session->pending_count() == 0);
        std::cout << "  [PASS] out-of-order responses routed\n";
    }

    std::cout << "Test: JSON-RPC errors surface as RemoteError...\n";
    {
        Harness h;
        h.session->initialize(2000ms);
        bool caught = false;
        try
        {
            h.session->call_tool("boom", Json::object());
        }
        catch (const mcphub::RemoteError& e)
        {
            caught = true;
            assert(e.code() == -32000);
            assert(std::string(e.what()).find("boom") != std::string::npos);
            assert(e.data()["detail"] == 1);
        }
        assert(caught);
        assert(h.session->is_ready());
        assert(h.session->call_tool("ok", Json::object()).text() == "ok");
        std::cout << "  [PASS] remote error leaves the session usable\n";
    }

    std::cout << "Test: a request timeout sends notifications/cancelled...\n";
    {
        Harness h;
        h.session->initialize(2000ms);
        CallToolOptions options;
        options.timeout = 200ms;
        auto start = std::chrono::steady_clock::now();
        assert(throws<mcphub::TimeoutError>([&] { h.session->call_tool("sleep", {}, options); }));
        assert(std::chrono::steady_clock::now() - start < 2s);
        assert(h.session->pending_count() == 0);
        assert(wait_until([&] { return h.peer.saw_method("notifications/cancelled"); }));
        assert(h.session->is_ready());
        std::cout << "  [PASS] timeout cleans up its slot\n";
    }

    std::cout << "Test: a cancellation token aborts only its call...\n";
    {
        Harness h;
        h.session->initialize(2000ms);
        mcphub::util::CancellationSource source;
        CallToolOptions options;
        options.cancel = source.token();
        std::thread canceller(
            [&]()
            {
                std::this_thread::sleep_for(100ms);
                source.cancel();
            });
        assert(throws<mcphub::CancelledError>([&] { h.session->call_tool("sleep", {}, options); }));
        canceller.join();
        assert(h.session->call_tool("ok", Json::object()).text() == "ok");
        std::cout << "  [PASS] CancelledError, session still Ready\n";
    }

    std::cout << "Test: notifications reach the sink...\n";
    {
        Harness h;
        std::mutex mutex;
        std::vector<std::string> methods;
        h.session->set_notification_sink(
            [&](const JsonRpcMessage& m)
            {
                std::lock_guard<std::mutex> lock(mutex);
                methods.push_back(m.method);
            });
        h.session->initialize(2000ms);
        assert(h.session->call_tool("notify", Json::object()).text() == "notified");
        std::lock_guard<std::mutex> lock(mutex);
        assert(methods.size() == 1 && methods[0] == "notifications/message");
        std::cout << "  [PASS] notification delivered before the response\n";
    }

    std::cout << "Test: server-initiated requests are answered...\n";
    {
        Harness h;
        h.session->initialize(2000ms);
        h.peer.push(JsonRpcMessage::request("srv-1", "ping"));
        h.peer.push(JsonRpcMessage::request("srv-2", "sampling/createMessage", Json::object()));

        assert(wait_until([&] {
            return h.peer.find([](const JsonRpcMessage& m) { return m.id == "srv-2"; }).has_value();
        }));
        auto pong = h.peer.find([](const JsonRpcMessage& m) { return m.id == "srv-1"; });
        assert(pong && pong->kind == mcphub::transport::MessageKind::Response);
        auto unhandled = h.peer.find([](const JsonRpcMessage& m) { return m.id == "srv-2"; });
        assert(unhandled->kind == mcphub::transport::MessageKind::Error);
        assert(unhandled->error->code == mcphub::transport::error_code::MethodNotFound);
        std::cout << "  [PASS] ping answered, unknown method refused\n";
    }

    std::cout << "Test: a malformed frame fails pending requests with TransportError...\n";
    {
        Harness h;
        h.session->initialize(2000ms);
        assert(throws<mcphub::TransportError>([&] { h.session->call_tool("garbage", {}); }));
        assert(h.session->state() == SessionState::Closed);
        assert(h.session->failure().has_value());
        assert(throws<mcphub::TransportError>([&] { h.session->ping(); }));
        std::cout << "  [PASS] session closed with a recorded failure\n";
    }

    std::cout << "Test: close() fails outstanding requests with CancelledError...\n";
    {
        Harness h;
        h.session->initialize(2000ms);
        bool cancelled = false;
        std::thread caller(
            [&]()
            {
                cancelled = throws<mcphub::CancelledError>(
                    [&] { h.session->call_tool("sleep", Json::object()); });
            });
        assert(wait_until([&] { return h.session->pending_count() == 1; }));
        h.session->close();
        caller.join();
        assert(cancelled);
        assert(h.session->state() == SessionState::Closed);
        h.session->close();
        std::cout << "  [PASS] pending call released, close idempotent\n";
    }

    std::cout << "Test: a malformed initialize result closes the session...\n";
    {
        Harness h([](Peer& peer, const JsonRpcMessage& m)
                  {
                      if (m.method == "initialize")
                          peer.reply(m, Json{{"capabilities", Json::object()}});
                  });
        assert(throws<mcphub::TransportError>([&] { h.session->initialize(2000ms); }));
        assert(h.session->state() == SessionState::Closed);
        std::cout << "  [PASS] TransportError, no Ready state\n";
    }

    std::cout << "Test: handshake timeout...\n";
    {
        Harness h([](Peer&, const JsonRpcMessage&) {});
        assert(throws<mcphub::TimeoutError>([&] { h.session->initialize(200ms); }));
        assert(!h.session->is_ready());
        std::cout << "  [PASS] TimeoutError from initialize\n";
    }

    std::cout << "Test: a stalled peer cannot stretch the handshake past its timeout...\n";
    {
        SessionOptions options;
        options.request_timeout = 30000ms;
        Harness h(
            [](Peer& peer, const JsonRpcMessage& m)
            {
                if (m.method != "initialize")
                    return;
                peer.fill_outbound();
                peer.reply(m, Json{{"protocolVersion", "2024-11-05"},
                                   {"capabilities", Json::object()},
                                   {"serverInfo", {{"name", "peer"}, {"version", "0.0.1"}}}});
                std::this_thread::sleep_for(1500ms);
            },
            options, 1);
        auto start = std::chrono::steady_clock::now();
        assert(throws<mcphub::TimeoutError>([&] { h.session->initialize(500ms); }));
        assert(std::chrono::steady_clock::now() - start < 1200ms);
        assert(!h.session->is_ready());
        std::cout << "  [PASS] initialized notification bounded by the handshake timeout\n";
    }

    std::cout << "\n[OK] session tests passed\n";
    return 0;
}
