#include "mcphub/client/session.hpp"

#include "mcphub/exceptions.hpp"
#include "mcphub/util/log.hpp"

#include <algorithm>

namespace mcphub::client
{

using transport::ChannelStatus;
using transport::JsonRpcMessage;

namespace
{
// Wait slice for cancellation checks
constexpr std::chrono::milliseconds kSlice{50};

// Serialization failures (e.g. invalid UTF-8) must reach the caller, not the writer thread
void ensure_encodable(const JsonRpcMessage& message)
{
    try
    {
        (void)transport::encode_frame(message);
    }
    catch (const Json::exception& e)
    {
        throw ValidationError("Cannot encode " + message.method + " message: " + e.what());
    }
}
} // namespace

std::string to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Unconnected:
        return "unconnected";
    case SessionState::Initializing:
        return "initializing";
    case SessionState::Ready:
        return "ready";
    case SessionState::Closed:
        return "closed";
    }
    return "unknown";
}

Session::Session(std::shared_ptr<transport::Channel<transport::Frame>> inbound,
                 std::shared_ptr<transport::Channel<JsonRpcMessage>> outbound,
                 std::shared_ptr<util::ResourceGroup> resources, SessionOptions options,
                 std::string label)
    : inbound_(std::move(inbound)), outbound_(std::move(outbound)),
      resources_(std::move(resources)), options_(std::move(options)), label_(std::move(label))
{
}

Session::~Session()
{
    close();
    stop_dispatch();
}

void Session::set_notification_sink(NotificationSink sink)
{
    std::lock_guard<std::mutex> lock(handler_mutex_);
    notification_sink_ = std::move(sink);
}

void Session::set_request_handler(RequestHandler handler)
{
    std::lock_guard<std::mutex> lock(handler_mutex_);
    request_handler_ = std::move(handler);
}

void Session::start()
{
    if (dispatch_thread_.joinable())
        return;
    dispatch_thread_ = std::thread([this]() { dispatch_loop(); });
    if (resources_)
        resources_->acquire(label_ + " dispatch loop", [this]() { stop_dispatch(); });
}

// ============================================================================
// Requests
// ============================================================================

Json Session::request(const std::string& method, std::optional<Json> params,
                      std::chrono::milliseconds timeout, const util::CancellationToken& cancel)
{
    const std::int64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
    const JsonRpcMessage message = JsonRpcMessage::request(id, method, std::move(params));
    ensure_encodable(message);

    std::future<JsonRpcMessage> response_future;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (state() == SessionState::Closed)
            throw TransportError(failure_ ? *failure_ : "Session '" + label_ + "' is closed");
        std::promise<JsonRpcMessage> promise;
        response_future = promise.get_future();
        pending_.emplace(id, std::move(promise));
    }

    auto forget = [this, id]()
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(id);
    };
    // Drop the slot and tell the server we no longer care
    auto abandon = [this, id, &forget](const std::string& reason)
    {
        forget();
        if (state() != SessionState::Closed)
            (void)outbound_->try_send(JsonRpcMessage::notification(
                "notifications/cancelled", Json{{"requestId", id}, {"reason", reason}}));
    };

    const auto deadline = deadline_after(timeout);

    while (true)
    {
        auto status = outbound_->send_for(message, std::min(kSlice, remaining_until(deadline)));
        if (status == ChannelStatus::Ok)
            break;
        if (status == ChannelStatus::Closed)
        {
            forget();
            throw TransportError("Session '" + label_ + "' outbound channel is closed");
        }
        if (cancel.is_cancelled())
        {
            forget();
            throw CancelledError(method + " cancelled");
        }
        if (Clock::now() >= deadline)
        {
            forget();
            throw TimeoutError(method + " timed out after " + std::to_string(timeout.count()) +
                               " ms");
        }
    }

    while (response_future.wait_for(std::min(kSlice, remaining_until(deadline))) !=
           std::future_status::ready)
    {
        if (cancel.is_cancelled())
        {
            abandon("cancelled by caller");
            throw CancelledError(method + " cancelled");
        }
        if (Clock::now() >= deadline)
        {
            abandon("timeout");
            throw TimeoutError(method + " timed out after " + std::to_string(timeout.count()) +
                               " ms");
        }
    }

    JsonRpcMessage response = response_future.get();
    if (response.kind == transport::MessageKind::Error)
    {
        const auto& err = *response.error;
        throw RemoteError(err.code, err.message, err.data ? *err.data : Json());
    }
    return response.result ? *response.result : Json::object();
}

void Session::notify(const std::string& method, std::optional<Json> params)
{
    send_notification(method, std::move(params), options_.request_timeout);
}

void Session::send_notification(const std::string& method, std::optional<Json> params,
                                std::chrono::milliseconds timeout)
{
    const JsonRpcMessage message = JsonRpcMessage::notification(method, std::move(params));
    ensure_encodable(message);
    auto status = outbound_->send_for(message, timeout);
    if (status == ChannelStatus::Timeout)
        throw TimeoutError("Session '" + label_ + "' timed out sending " + method);
    if (status == ChannelStatus::Closed)
        throw TransportError("Session '" + label_ + "' could not send " + method);
}

InitializeResult Session::initialize(std::chrono::milliseconds timeout,
                                     const util::CancellationToken& cancel)
{
    SessionState expected = SessionState::Unconnected;
    if (!state_.compare_exchange_strong(expected, SessionState::Initializing))
        throw TransportError("Cannot initialize session '" + label_ + "' in state " +
                             to_string(expected));

    const auto deadline = deadline_after(timeout);
    try
    {
        Json params = {{"protocolVersion", options_.protocol_version},
                       {"capabilities", Json::object()},
                       {"clientInfo",
                        {{"name", options_.client_name}, {"version", options_.client_version}}}};
        Json result = request("initialize", std::move(params), timeout, cancel);

        InitializeResult parsed;
        try
        {
            parsed = result.get<InitializeResult>();
        }
        catch (const ValidationError& e)
        {
            throw TransportError(std::string("Malformed initialize response: ") + e.what());
        }
        catch (const Json::exception& e)
        {
            throw TransportError(std::string("Malformed initialize response: ") + e.what());
        }
        init_result_ = parsed;

        // Shares the handshake budget so a child that stops reading cannot stretch connect
        send_notification("notifications/initialized", std::nullopt, remaining_until(deadline));

        expected = SessionState::Initializing;
        if (!state_.compare_exchange_strong(expected, SessionState::Ready))
            throw TransportError(failure() ? *failure()
                                           : "Session '" + label_ + "' closed during initialize");

        log::debug("[" + label_ + "] initialized: " + parsed.serverInfo.name + " " +
                   parsed.serverInfo.version + " (protocol " + parsed.protocolVersion + ")");
        return parsed;
    }
    catch (...)
    {
        state_.store(SessionState::Closed, std::memory_order_release);
        throw;
    }
}

void Session::require_ready() const
{
    auto current = state();
    if (current == SessionState::Ready)
        return;
    if (current == SessionState::Closed)
    {
        if (auto why = failure())
            throw TransportError(*why);
    }
    throw NotConnectedError("Session '" + label_ + "' is " + to_string(current));
}

std::vector<ToolInfo> Session::list_tools(const util::CancellationToken& cancel)
{
    require_ready();

    std::vector<ToolInfo> tools;
    std::optional<std::string> cursor;
    while (true)
    {
        std::optional<Json> params;
        if (cursor)
            params = Json{{"cursor", *cursor}};
        Json page = request("tools/list", std::move(params), options_.request_timeout, cancel);

        try
        {
            for (const auto& entry : page.value("tools", Json::array()))
                tools.push_back(entry.get<ToolInfo>());
        }
        catch (const Json::exception& e)
        {
            throw ValidationError(std::string("Malformed tools/list result: ") + e.what());
        }

        if (!page.contains("nextCursor") || !page["nextCursor"].is_string())
            break;
        auto next = page["nextCursor"].get<std::string>();
        if (next.empty() || next == cursor)
            break;
        cursor = next;
    }
    return tools;
}

CallToolResult Session::call_tool(const std::string& name, const Json& arguments,
                                  const CallToolOptions& options)
{
    require_ready();

    Json params = {{"name", name},
                   {"arguments", arguments.is_null() ? Json::object() : arguments}};
    if (options.meta)
        params["_meta"] = *options.meta;
    auto timeout = options.timeout.count() > 0 ? options.timeout : options_.request_timeout;

    Json result = request("tools/call", std::move(params), timeout, options.cancel);
    try
    {
        return result.get<CallToolResult>();
    }
    catch (const Json::exception& e)
    {
        throw ValidationError(std::string("Malformed tools/call result: ") + e.what());
    }
}

void Session::ping(const util::CancellationToken& cancel)
{
    require_ready();
    (void)request("ping", std::nullopt, options_.request_timeout, cancel);
}

// ============================================================================
// Dispatch
// ============================================================================

void Session::dispatch_loop()
{
    while (true)
    {
        auto frame = inbound_->receive();
        if (!frame)
        {
            if (state() != SessionState::Closed)
                fail_transport("Server '" + label_ + "' closed the connection");
            break;
        }
        if (!frame->ok())
        {
            fail_transport("Malformed message from server '" + label_ + "': " + frame->error);
            break;
        }
        handle_message(std::move(*frame->message));
    }
}

void Session::handle_message(JsonRpcMessage message)
{
    if (message.is_response())
    {
        std::optional<std::promise<JsonRpcMessage>> slot;
        if (auto id = message.numeric_id())
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(*id);
            if (it != pending_.end())
            {
                slot = std::move(it->second);
                pending_.erase(it);
            }
        }
        if (slot)
            slot->set_value(std::move(message));
        else
            log::warn("[" + label_ + "] Dropping response with unknown id " + message.id.dump());
        return;
    }

    if (message.is_request())
    {
        answer_server_request(message);
        return;
    }

    NotificationSink sink;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        sink = notification_sink_;
    }
    if (!sink)
    {
        log::debug("[" + label_ + "] notification " + message.method);
        return;
    }
    try
    {
        sink(message);
    }
    catch (const std::exception& e)
    {
        log::warn("[" + label_ + "] Notification sink failed for " + message.method + ": " +
                  e.what());
    }
}

void Session::answer_server_request(const JsonRpcMessage& message)
{
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = request_handler_;
    }

    JsonRpcMessage reply;
    if (message.method == "ping")
    {
        reply = JsonRpcMessage::response(message.id, Json::object());
    }
    else if (!handler)
    {
        reply = JsonRpcMessage::error_response(message.id, transport::error_code::MethodNotFound,
                                               "Method not handled: " + message.method);
    }
    else
    {
        try
        {
            reply = JsonRpcMessage::response(
                message.id, handler(message.method, message.params.value_or(Json::object())));
        }
        catch (const RemoteError& e)
        {
            reply = JsonRpcMessage::error_response(message.id, e.code(), e.what());
        }
        catch (const std::exception& e)
        {
            reply = JsonRpcMessage::error_response(message.id, transport::error_code::InternalError,
                                                   e.what());
        }
    }

    try
    {
        ensure_encodable(reply);
    }
    catch (const ValidationError& e)
    {
        reply = JsonRpcMessage::error_response(message.id, transport::error_code::InternalError,
                                               e.what());
    }

    if (outbound_->try_send(std::move(reply)) != ChannelStatus::Ok)
        log::warn("[" + label_ + "] Could not answer server request " + message.method);
}

void Session::fail_transport(const std::string& reason)
{
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!failure_)
            failure_ = reason;
    }
    state_.store(SessionState::Closed, std::memory_order_release);
    log::error("[" + label_ + "] " + reason);

    fail_pending(std::make_exception_ptr(TransportError(reason)));
    inbound_->close();
    outbound_->close();
}

void Session::fail_pending(std::exception_ptr error)
{
    std::unordered_map<std::int64_t, std::promise<JsonRpcMessage>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& [id, promise] : pending)
        promise.set_exception(error);
}

// ============================================================================
// Teardown
// ============================================================================

void Session::close()
{
    std::call_once(close_once_,
                   [this]()
                   {
                       {
                           // Under the lock so no request can register after the sweep
                           std::lock_guard<std::mutex> lock(pending_mutex_);
                           state_.store(SessionState::Closed, std::memory_order_release);
                       }
                       fail_pending(std::make_exception_ptr(
                           CancelledError("Session '" + label_ + "' closed")));
                       if (resources_)
                           resources_->release_all();
                   });
}

void Session::stop_dispatch()
{
    inbound_->close();
    if (!dispatch_thread_.joinable())
        return;
    if (dispatch_thread_.get_id() == std::this_thread::get_id())
    {
        log::error("[" + label_ + "] dispatch loop cannot stop itself");
        return;
    }
    dispatch_thread_.join();
}

std::optional<std::string> Session::failure() const
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return failure_;
}

std::size_t Session::pending_count() const
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

} // namespace mcphub::client
