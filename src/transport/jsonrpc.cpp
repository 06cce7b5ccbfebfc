#include "mcphub/transport/jsonrpc.hpp"

#include "mcphub/exceptions.hpp"

namespace mcphub::transport
{

namespace
{
bool is_valid_id(const Json& id)
{
    return id.is_string() || id.is_number_integer();
}
} // namespace

JsonRpcMessage JsonRpcMessage::request(Json id, std::string method, std::optional<Json> params)
{
    JsonRpcMessage m;
    m.kind = MessageKind::Request;
    m.id = std::move(id);
    m.method = std::move(method);
    m.params = std::move(params);
    return m;
}

JsonRpcMessage JsonRpcMessage::notification(std::string method, std::optional<Json> params)
{
    JsonRpcMessage m;
    m.kind = MessageKind::Notification;
    m.method = std::move(method);
    m.params = std::move(params);
    return m;
}

JsonRpcMessage JsonRpcMessage::response(Json id, Json result)
{
    JsonRpcMessage m;
    m.kind = MessageKind::Response;
    m.id = std::move(id);
    m.result = std::move(result);
    return m;
}

JsonRpcMessage JsonRpcMessage::error_response(Json id, int code, std::string message,
                                              std::optional<Json> data)
{
    JsonRpcMessage m;
    m.kind = MessageKind::Error;
    m.id = std::move(id);
    m.error = JsonRpcError{code, std::move(message), std::move(data)};
    return m;
}

std::optional<std::int64_t> JsonRpcMessage::numeric_id() const
{
    if (id.is_number_integer())
        return id.get<std::int64_t>();
    if (id.is_string())
    {
        const auto& s = id.get_ref<const std::string&>();
        if (s.empty())
            return std::nullopt;
        std::size_t pos = 0;
        try
        {
            auto value = std::stoll(s, &pos);
            if (pos == s.size())
                return value;
        }
        catch (const std::exception&)
        {
        }
    }
    return std::nullopt;
}

void to_json(Json& j, const JsonRpcError& e)
{
    j = Json{{"code", e.code}, {"message", e.message}};
    if (e.data)
        j["data"] = *e.data;
}

void from_json(const Json& j, JsonRpcError& e)
{
    if (!j.is_object())
        throw ValidationError("JSON-RPC error must be an object");
    if (!j.contains("code") || !j["code"].is_number_integer())
        throw ValidationError("JSON-RPC error is missing an integer 'code'");
    if (!j.contains("message") || !j["message"].is_string())
        throw ValidationError("JSON-RPC error is missing a string 'message'");
    e.code = j["code"].get<int>();
    e.message = j["message"].get<std::string>();
    if (j.contains("data"))
        e.data = j["data"];
    else
        e.data.reset();
}

void to_json(Json& j, const JsonRpcMessage& m)
{
    j = Json{{"jsonrpc", "2.0"}};
    switch (m.kind)
    {
    case MessageKind::Request:
        j["id"] = m.id;
        j["method"] = m.method;
        if (m.params)
            j["params"] = *m.params;
        break;
    case MessageKind::Notification:
        j["method"] = m.method;
        if (m.params)
            j["params"] = *m.params;
        break;
    case MessageKind::Response:
        j["id"] = m.id;
        j["result"] = m.result ? *m.result : Json::object();
        break;
    case MessageKind::Error:
        j["id"] = m.id;
        j["error"] = m.error ? *m.error : JsonRpcError{error_code::InternalError, "Unknown error"};
        break;
    }
}

void from_json(const Json& j, JsonRpcMessage& m)
{
    if (!j.is_object())
        throw ValidationError("JSON-RPC message must be an object");
    if (!j.contains("jsonrpc") || j["jsonrpc"] != "2.0")
        throw ValidationError("JSON-RPC message must carry jsonrpc: \"2.0\"");

    m = JsonRpcMessage{};
    const bool has_id = j.contains("id");
    if (has_id && !j["id"].is_null() && !is_valid_id(j["id"]))
        throw ValidationError("JSON-RPC id must be a string or an integer");

    if (j.contains("method"))
    {
        if (!j["method"].is_string())
            throw ValidationError("JSON-RPC method must be a string");
        if (j.contains("result") || j.contains("error"))
            throw ValidationError("JSON-RPC message mixes method with result/error");
        m.method = j["method"].get<std::string>();
        if (j.contains("params"))
        {
            if (!j["params"].is_object() && !j["params"].is_array())
                throw ValidationError("JSON-RPC params must be an object or an array");
            m.params = j["params"];
        }
        if (has_id)
        {
            if (j["id"].is_null())
                throw ValidationError("JSON-RPC request id must not be null");
            m.kind = MessageKind::Request;
            m.id = j["id"];
        }
        else
        {
            m.kind = MessageKind::Notification;
        }
        return;
    }

    if (!has_id)
        throw ValidationError("JSON-RPC response is missing 'id'");
    const bool has_result = j.contains("result");
    const bool has_error = j.contains("error");
    if (has_result == has_error)
        throw ValidationError("JSON-RPC response must carry exactly one of result or error");

    m.id = j["id"];
    if (has_result)
    {
        if (m.id.is_null())
            throw ValidationError("JSON-RPC result response must carry an id");
        m.kind = MessageKind::Response;
        m.result = j["result"];
    }
    else
    {
        m.kind = MessageKind::Error;
        m.error = j["error"].get<JsonRpcError>();
    }
}

} // namespace mcphub::transport
