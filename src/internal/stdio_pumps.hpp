#pragma once
/// Threads that move framed messages between a child's stdio and the connection channels

#include "mcphub/transport/channel.hpp"
#include "mcphub/transport/frame_codec.hpp"
#include "process.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace mcphub::transport
{

using InboundChannel = Channel<Frame>;
using OutboundChannel = Channel<JsonRpcMessage>;

/**
 * Reads the child's stdout, splits it into frames and sends them to the inbound channel.
 *
 * End of stream or a read failure closes the inbound channel. stop() returns without
 * issuing another read.
 */
class ReaderPump
{
  public:
    ReaderPump(std::shared_ptr<process::Process> process, std::shared_ptr<InboundChannel> inbound,
               std::string label);
    ~ReaderPump();

    ReaderPump(const ReaderPump&) = delete;
    ReaderPump& operator=(const ReaderPump&) = delete;

    void start();
    void stop();

    bool running() const
    {
        return running_.load(std::memory_order_acquire);
    }

  private:
    void run();

    std::shared_ptr<process::Process> process_;
    std::shared_ptr<InboundChannel> inbound_;
    std::string label_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

/**
 * Takes messages off the outbound channel in order and writes them to the child's stdin.
 *
 * Exits on a closed outbound channel or a write failure.
 */
class WriterPump
{
  public:
    WriterPump(std::shared_ptr<process::Process> process, std::shared_ptr<OutboundChannel> outbound,
               std::string label);
    ~WriterPump();

    WriterPump(const WriterPump&) = delete;
    WriterPump& operator=(const WriterPump&) = delete;

    void start();
    void stop();

    bool running() const
    {
        return running_.load(std::memory_order_acquire);
    }

  private:
    void run();

    std::shared_ptr<process::Process> process_;
    std::shared_ptr<OutboundChannel> outbound_;
    std::string label_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace mcphub::transport
