#pragma once
#include "mcphub/types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace mcphub
{

struct Settings
{
    std::string log_level{"INFO"};

    /// Bound on spawn + pump start + initialize handshake
    std::chrono::milliseconds connect_timeout{10000};
    /// Bound on a single request (tools/list page, tools/call, ping)
    std::chrono::milliseconds request_timeout{30000};
    /// Overall bound on Registry::cleanup_all
    std::chrono::milliseconds cleanup_timeout{5000};
    /// Bound on tearing down a stale entry before reconnecting
    std::chrono::milliseconds close_timeout{500};
    /// SIGTERM to SIGKILL grace period
    std::chrono::milliseconds terminate_grace{1000};

    std::size_t channel_capacity{64};

    std::string protocol_version{"2024-11-05"};
    std::string client_name{"mcphub"};
    std::string client_version{"0.1.0"};

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace mcphub
