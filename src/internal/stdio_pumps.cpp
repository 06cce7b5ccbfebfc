#include "stdio_pumps.hpp"

#include "mcphub/util/log.hpp"

#include <chrono>

namespace mcphub::transport
{

namespace
{
// Poll slice; bounds how long stop() waits for a pump to notice
constexpr int kPollMs = 50;
} // namespace

// =============================================================================
// ReaderPump
// =============================================================================

ReaderPump::ReaderPump(std::shared_ptr<process::Process> process,
                       std::shared_ptr<InboundChannel> inbound, std::string label)
    : process_(std::move(process)), inbound_(std::move(inbound)), label_(std::move(label))
{
}

ReaderPump::~ReaderPump()
{
    stop();
}

void ReaderPump::start()
{
    if (thread_.joinable())
        return;
    stop_requested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this]() { run(); });
}

void ReaderPump::stop()
{
    stop_requested_.store(true, std::memory_order_release);
    // Unblocks a send into a full channel
    if (inbound_)
        inbound_->close();
    if (thread_.joinable())
        thread_.join();
}

void ReaderPump::run()
{
    FrameDecoder decoder;
    char buffer[4096];

    try
    {
        auto& pipe = process_->stdout_pipe();
        while (!stop_requested_.load(std::memory_order_acquire))
        {
            if (!pipe.has_data(kPollMs))
                continue;
            if (stop_requested_.load(std::memory_order_acquire))
                break;

            size_t n = pipe.read(buffer, sizeof(buffer));
            if (n == 0)
            {
                log::debug("[" + label_ + "] stdout reached end of stream");
                break;
            }

            bool delivered = true;
            for (auto& frame : decoder.feed(buffer, n))
            {
                if (!frame.ok())
                    log::warn("[" + label_ + "] Error parsing JSON-RPC message: " + frame.error);
                if (!inbound_->send(std::move(frame)))
                {
                    delivered = false;
                    break;
                }
            }
            if (!delivered)
                break;
        }
    }
    catch (const process::ProcessError& e)
    {
        if (!stop_requested_.load(std::memory_order_acquire))
            log::error("[" + label_ + "] Error in stdout reader: " + e.what());
    }

    if (auto tail = decoder.finish())
        log::debug("[" + label_ + "] Discarding " + std::to_string(tail->size()) +
                   " bytes of unterminated output");

    inbound_->close();
    running_.store(false, std::memory_order_release);
}

// =============================================================================
// WriterPump
// =============================================================================

WriterPump::WriterPump(std::shared_ptr<process::Process> process,
                       std::shared_ptr<OutboundChannel> outbound, std::string label)
    : process_(std::move(process)), outbound_(std::move(outbound)), label_(std::move(label))
{
}

WriterPump::~WriterPump()
{
    stop();
}

void WriterPump::start()
{
    if (thread_.joinable())
        return;
    stop_requested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this]() { run(); });
}

void WriterPump::stop()
{
    stop_requested_.store(true, std::memory_order_release);
    if (thread_.joinable())
        thread_.join();
}

void WriterPump::run()
{
    try
    {
        auto& pipe = process_->stdin_pipe();
        while (!stop_requested_.load(std::memory_order_acquire))
        {
            JsonRpcMessage message;
            auto status = outbound_->receive_for(message, std::chrono::milliseconds(kPollMs));
            if (status == ChannelStatus::Timeout)
                continue;
            if (status == ChannelStatus::Closed)
                break;

            std::string line;
            try
            {
                line = encode_frame(message);
            }
            catch (const Json::exception& e)
            {
                log::error("[" + label_ + "] Dropping unencodable " +
                           (message.method.empty() ? std::string("response") : message.method) +
                           ": " + e.what());
                continue;
            }
            pipe.write(line, &stop_requested_);
        }
    }
    catch (const process::ProcessError& e)
    {
        log::error("[" + label_ + "] Error in stdin writer: " + e.what());
        // Producers fail fast instead of filling a channel nobody drains
        outbound_->close();
    }

    running_.store(false, std::memory_order_release);
}

} // namespace mcphub::transport
