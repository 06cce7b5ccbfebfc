#pragma once
/// @file client/session.hpp
/// @brief MCP client session over a pair of message channels

#include "mcphub/client/types.hpp"
#include "mcphub/transport/channel.hpp"
#include "mcphub/transport/frame_codec.hpp"
#include "mcphub/util/cancellation.hpp"
#include "mcphub/util/resource_group.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mcphub::client
{

enum class SessionState
{
    Unconnected,
    Initializing,
    Ready,
    Closed
};

std::string to_string(SessionState state);

struct SessionOptions
{
    std::string protocol_version{"2024-11-05"};
    std::string client_name{"mcphub"};
    std::string client_version{"0.1.0"};
    /// Default bound for list_tools/call_tool/ping
    std::chrono::milliseconds request_timeout{30000};
};

/// Options for a single tools/call
struct CallToolOptions
{
    /// Timeout for the call (0 = session default)
    std::chrono::milliseconds timeout{0};
    /// Cancels only this call
    util::CancellationToken cancel;
    std::optional<Json> meta;
};

/**
 * Request/response layer on top of the inbound and outbound channels of one connection.
 *
 * A single dispatch thread owns the inbound channel. Responses resolve the pending request
 * with the same id, notifications go to the notification sink, and server-initiated
 * requests are answered. A parse error or end of stream closes the session and fails
 * every outstanding request with TransportError.
 *
 * close() must not be called from the notification sink or request handler.
 */
class Session
{
  public:
    using NotificationSink = std::function<void(const transport::JsonRpcMessage&)>;
    /// Answers a server-initiated request; the returned value becomes the result
    using RequestHandler = std::function<Json(const std::string& method, const Json& params)>;

    Session(std::shared_ptr<transport::Channel<transport::Frame>> inbound,
            std::shared_ptr<transport::Channel<transport::JsonRpcMessage>> outbound,
            std::shared_ptr<util::ResourceGroup> resources, SessionOptions options = {},
            std::string label = "session");
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void set_notification_sink(NotificationSink sink);
    void set_request_handler(RequestHandler handler);

    /// Launch the dispatch thread; its shutdown is registered with the resource group
    void start();

    /// Handshake. Ready on success; Closed and rethrows on timeout, error or bad response.
    InitializeResult initialize(std::chrono::milliseconds timeout,
                                const util::CancellationToken& cancel = {});

    std::vector<ToolInfo> list_tools(const util::CancellationToken& cancel = {});
    CallToolResult call_tool(const std::string& name, const Json& arguments,
                             const CallToolOptions& options = {});
    void ping(const util::CancellationToken& cancel = {});

    /// Send a request and return its raw result; RemoteError for JSON-RPC errors
    Json request(const std::string& method, std::optional<Json> params,
                 std::chrono::milliseconds timeout, const util::CancellationToken& cancel = {});

    void notify(const std::string& method, std::optional<Json> params = std::nullopt);

    /// Fail pending requests with CancelledError, then release the resource group. Idempotent.
    void close();

    SessionState state() const
    {
        return state_.load(std::memory_order_acquire);
    }
    bool is_ready() const
    {
        return state() == SessionState::Ready;
    }

    /// Why the session closed on its own (transport failure), if it did
    std::optional<std::string> failure() const;

    const std::optional<InitializeResult>& server_info() const
    {
        return init_result_;
    }

    std::size_t pending_count() const;

  private:
    void dispatch_loop();
    void stop_dispatch();
    void handle_message(transport::JsonRpcMessage message);
    void answer_server_request(const transport::JsonRpcMessage& message);
    void send_notification(const std::string& method, std::optional<Json> params,
                           std::chrono::milliseconds timeout);
    void fail_transport(const std::string& reason);
    void fail_pending(std::exception_ptr error);
    void require_ready() const;

    std::shared_ptr<transport::Channel<transport::Frame>> inbound_;
    std::shared_ptr<transport::Channel<transport::JsonRpcMessage>> outbound_;
    std::shared_ptr<util::ResourceGroup> resources_;
    SessionOptions options_;
    std::string label_;

    std::atomic<SessionState> state_{SessionState::Unconnected};
    std::atomic<std::int64_t> next_id_{1};
    std::optional<InitializeResult> init_result_;

    mutable std::mutex pending_mutex_;
    std::unordered_map<std::int64_t, std::promise<transport::JsonRpcMessage>> pending_;
    std::optional<std::string> failure_;

    std::mutex handler_mutex_;
    NotificationSink notification_sink_;
    RequestHandler request_handler_;

    std::once_flag close_once_;
    std::thread dispatch_thread_;
};

} // namespace mcphub::client
