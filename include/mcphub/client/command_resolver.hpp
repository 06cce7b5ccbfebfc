#pragma once
/// @file client/command_resolver.hpp
/// @brief Host-specific rewriting of launcher commands before spawn

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcphub::client
{

enum class HostPlatform
{
    Posix,
    Windows
};

/// Platform of the running binary
HostPlatform current_platform();

struct LaunchCommand
{
    std::string command;
    std::vector<std::string> args;

    bool operator==(const LaunchCommand& other) const
    {
        return command == other.command && args == other.args;
    }
};

/**
 * Rewrites a generic launcher invocation into what the host can actually run.
 *
 * On Windows hosts:
 * - `npx [-y] pkg ...` becomes `<npm> exec [--yes] pkg ...` when npm is found
 * - `node ...` uses the absolute node path when found
 * - legacy `cmd.exe /c run_<server>.bat` launchers become `<npm> exec` of the package
 * POSIX invocations are returned unchanged.
 */
class CommandResolver
{
  public:
    /// Returns the absolute path of an executable name, or nullopt
    using ExecutableLocator = std::function<std::optional<std::string>(const std::string&)>;

    CommandResolver(HostPlatform platform, ExecutableLocator locator);

    /// Resolver for this host backed by the PATH search
    static CommandResolver for_host();

    LaunchCommand resolve(const LaunchCommand& input) const;

    HostPlatform platform() const
    {
        return platform_;
    }

  private:
    std::optional<LaunchCommand> resolve_legacy_batch(const LaunchCommand& input) const;

    HostPlatform platform_;
    ExecutableLocator locator_;
};

} // namespace mcphub::client
