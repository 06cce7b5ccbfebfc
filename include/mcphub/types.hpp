#pragma once
#include <nlohmann/json.hpp>

#include <chrono>

namespace mcphub
{

using Json = nlohmann::json;

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

inline Deadline deadline_after(std::chrono::milliseconds timeout)
{
    return Clock::now() + timeout;
}

/// Milliseconds left until @p deadline (zero once it has passed)
inline std::chrono::milliseconds remaining_until(Deadline deadline)
{
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

} // namespace mcphub
