#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace mcphub::transport
{

enum class ChannelStatus
{
    Ok,
    Timeout,
    Closed
};

/**
 * Bounded FIFO channel between threads.
 *
 * close() wakes every waiter. After close, send fails and receive keeps returning
 * buffered items until the queue is empty, then reports Closed. A capacity of zero
 * means unbounded.
 */
template <typename T>
class Channel
{
  public:
    explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Blocks while full. Returns false once closed.
    bool send(T value)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || !full(); });
        if (closed_)
            return false;
        queue_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    ChannelStatus send_for(T value, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_full_.wait_for(lock, timeout, [this] { return closed_ || !full(); }))
            return ChannelStatus::Timeout;
        if (closed_)
            return ChannelStatus::Closed;
        queue_.push_back(std::move(value));
        not_empty_.notify_one();
        return ChannelStatus::Ok;
    }

    /// Never blocks; Timeout means the channel is full
    ChannelStatus try_send(T value)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return ChannelStatus::Closed;
        if (full())
            return ChannelStatus::Timeout;
        queue_.push_back(std::move(value));
        not_empty_.notify_one();
        return ChannelStatus::Ok;
    }

    /// Blocks until an item arrives or the channel is closed and drained
    std::optional<T> receive()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty())
            return std::nullopt;
        return pop_locked();
    }

    ChannelStatus receive_for(T& out, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); }))
            return ChannelStatus::Timeout;
        if (queue_.empty())
            return ChannelStatus::Closed;
        out = pop_locked();
        return ChannelStatus::Ok;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

  private:
    bool full() const
    {
        return capacity_ != 0 && queue_.size() >= capacity_;
    }

    T pop_locked()
    {
        T value = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return value;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    bool closed_{false};
};

} // namespace mcphub::transport
