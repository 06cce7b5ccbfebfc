#include "mcphub/transport/frame_codec.hpp"

#include "mcphub/exceptions.hpp"
#include "mcphub/util/json.hpp"

namespace mcphub::transport
{

Frame decode_line(const std::string& line)
{
    std::string parse_error;
    auto parsed = util::json::try_parse(line, parse_error);
    if (!parsed)
        return Frame::parse_error("Invalid JSON: " + parse_error, line);

    try
    {
        return Frame::decoded(parsed->get<JsonRpcMessage>());
    }
    catch (const ValidationError& e)
    {
        return Frame::parse_error(std::string("Invalid JSON-RPC message: ") + e.what(), line);
    }
    catch (const Json::exception& e)
    {
        return Frame::parse_error(std::string("Invalid JSON-RPC message: ") + e.what(), line);
    }
}

std::string encode_frame(const JsonRpcMessage& message)
{
    Json j = message;
    return util::json::dump(j) + "\n";
}

std::vector<Frame> FrameDecoder::feed(const char* data, std::size_t size)
{
    std::vector<Frame> frames;
    buffer_.append(data, size);

    std::size_t start = 0;
    std::size_t nl;
    while ((nl = buffer_.find('\n', start)) != std::string::npos)
    {
        std::string line = buffer_.substr(start, nl - start);
        start = nl + 1;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos)
            continue;
        frames.push_back(decode_line(line));
    }

    if (start > 0)
        buffer_.erase(0, start);
    return frames;
}

std::optional<std::string> FrameDecoder::finish()
{
    if (buffer_.empty())
        return std::nullopt;
    std::string tail;
    tail.swap(buffer_);
    return tail;
}

} // namespace mcphub::transport
