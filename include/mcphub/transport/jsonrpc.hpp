#pragma once
/// @file transport/jsonrpc.hpp
/// @brief JSON-RPC 2.0 message model used on the stdio wire

#include "mcphub/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mcphub::transport
{

/// Standard JSON-RPC error codes
namespace error_code
{
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int InternalError = -32603;
} // namespace error_code

enum class MessageKind
{
    Request,
    Notification,
    Response,
    Error
};

struct JsonRpcError
{
    int code{0};
    std::string message;
    std::optional<Json> data;

    bool operator==(const JsonRpcError& other) const
    {
        return code == other.code && message == other.message && data == other.data;
    }
};

/**
 * One JSON-RPC message. Which fields are meaningful depends on kind:
 * - Request: id, method, params (optional)
 * - Notification: method, params (optional)
 * - Response: id, result
 * - Error: id (may be null), error
 */
struct JsonRpcMessage
{
    MessageKind kind{MessageKind::Notification};
    Json id;                   ///< integer or string; null when absent
    std::string method;
    std::optional<Json> params;
    std::optional<Json> result;
    std::optional<JsonRpcError> error;

    static JsonRpcMessage request(Json id, std::string method,
                                  std::optional<Json> params = std::nullopt);
    static JsonRpcMessage notification(std::string method,
                                       std::optional<Json> params = std::nullopt);
    static JsonRpcMessage response(Json id, Json result);
    static JsonRpcMessage error_response(Json id, int code, std::string message,
                                         std::optional<Json> data = std::nullopt);

    bool is_request() const
    {
        return kind == MessageKind::Request;
    }
    bool is_notification() const
    {
        return kind == MessageKind::Notification;
    }
    /// True for both successful and error responses
    bool is_response() const
    {
        return kind == MessageKind::Response || kind == MessageKind::Error;
    }

    /// Integer form of id, if it is an integer or a decimal string
    std::optional<std::int64_t> numeric_id() const;

    bool operator==(const JsonRpcMessage& other) const
    {
        return kind == other.kind && id == other.id && method == other.method &&
               params == other.params && result == other.result && error == other.error;
    }
    bool operator!=(const JsonRpcMessage& other) const
    {
        return !(*this == other);
    }
};

void to_json(Json& j, const JsonRpcError& e);
void from_json(const Json& j, JsonRpcError& e);

/// Absent optionals are omitted, never written as null
void to_json(Json& j, const JsonRpcMessage& m);

/// Throws mcphub::ValidationError when @p j is not a valid JSON-RPC 2.0 message
void from_json(const Json& j, JsonRpcMessage& m);

} // namespace mcphub::transport
