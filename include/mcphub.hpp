#pragma once

/// @file mcphub.hpp
/// @brief Main header for mcphub - includes the public API
///
/// Usage:
/// @code
/// #include <mcphub.hpp>
///
/// int main() {
///     mcphub::client::Registry registry(mcphub::config::load_descriptors("servers.json"),
///                                       mcphub::Settings::from_env());
///     auto report = registry.connect_all();
///     for (const auto& tool : registry.list_all_tools())
///         std::cout << tool.qualified_name() << "\n";
/// }
/// @endcode

// Core types and exceptions
#include "mcphub/types.hpp"
#include "mcphub/exceptions.hpp"
#include "mcphub/settings.hpp"
#include "mcphub/config.hpp"

// Wire
#include "mcphub/transport/jsonrpc.hpp"
#include "mcphub/transport/frame_codec.hpp"
#include "mcphub/transport/channel.hpp"

// Client
#include "mcphub/client/types.hpp"
#include "mcphub/client/session.hpp"
#include "mcphub/client/command_resolver.hpp"
#include "mcphub/client/connection.hpp"
#include "mcphub/client/registry.hpp"
