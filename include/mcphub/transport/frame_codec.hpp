#pragma once
/// @file transport/frame_codec.hpp
/// @brief Newline-delimited JSON-RPC framing for the stdio wire

#include "mcphub/transport/jsonrpc.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mcphub::transport
{

/// One line from the wire: either a decoded message or a parse error with the raw text
struct Frame
{
    std::optional<JsonRpcMessage> message;
    std::string error;
    std::string raw;

    bool ok() const
    {
        return message.has_value();
    }

    static Frame decoded(JsonRpcMessage m)
    {
        Frame f;
        f.message = std::move(m);
        return f;
    }

    static Frame parse_error(std::string error, std::string raw)
    {
        Frame f;
        f.error = std::move(error);
        f.raw = std::move(raw);
        return f;
    }
};

/// Decode one complete line (without its delimiter)
Frame decode_line(const std::string& line);

/// Compact JSON text followed by exactly one '\n'
std::string encode_frame(const JsonRpcMessage& message);

/**
 * Incremental splitter for a byte stream of newline-delimited messages.
 *
 * feed() keeps the unterminated tail of each chunk and prepends it to the next one.
 * Blank lines are skipped and a trailing '\r' is stripped.
 */
class FrameDecoder
{
  public:
    std::vector<Frame> feed(const char* data, std::size_t size);
    std::vector<Frame> feed(const std::string& chunk)
    {
        return feed(chunk.data(), chunk.size());
    }

    /// Bytes received after the last newline
    const std::string& pending() const
    {
        return buffer_;
    }

    /// End of stream: returns and clears the unterminated tail, if any
    std::optional<std::string> finish();

  private:
    std::string buffer_;
};

} // namespace mcphub::transport
