#pragma once
#include <atomic>
#include <memory>

namespace mcphub::util
{

/// Read side of a cancellation flag. A default-constructed token is never cancelled.
class CancellationToken
{
  public:
    CancellationToken() = default;

    bool is_cancelled() const
    {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

  private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

/// Owner of a cancellation flag; cancel() is observed by every token it handed out
class CancellationSource
{
  public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel()
    {
        flag_->store(true, std::memory_order_release);
    }

    bool is_cancelled() const
    {
        return flag_->load(std::memory_order_acquire);
    }

    CancellationToken token() const
    {
        return CancellationToken(flag_);
    }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace mcphub::util
