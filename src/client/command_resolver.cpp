#include "mcphub/client/command_resolver.hpp"

#include "internal/process.hpp"
#include "mcphub/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace mcphub::client
{

namespace
{
struct LegacyLauncher
{
    const char* batch_marker;
    const char* package;
    bool assume_yes;
};

// Batch files older deployments used to wrap npx on Windows
const LegacyLauncher kLegacyLaunchers[] = {
    {"brave_search", "@modelcontextprotocol/server-brave-search", true},
    {"github", "@modelcontextprotocol/server-github", true},
    {"puppeteer", "@modelcontextprotocol/server-puppeteer", true},
    {"memory", "@modelcontextprotocol/server-memory", true},
    {"gmail", "@gongrzhe/server-gmail-autoauth-mcp", false},
};

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

HostPlatform current_platform()
{
#ifdef _WIN32
    return HostPlatform::Windows;
#else
    return HostPlatform::Posix;
#endif
}

CommandResolver::CommandResolver(HostPlatform platform, ExecutableLocator locator)
    : platform_(platform), locator_(std::move(locator))
{
}

CommandResolver CommandResolver::for_host()
{
    return CommandResolver(current_platform(), &process::find_executable);
}

LaunchCommand CommandResolver::resolve(const LaunchCommand& input) const
{
    if (platform_ != HostPlatform::Windows || !locator_)
        return input;

    if (input.command == "npx")
    {
        auto npm = locator_("npm");
        if (!npm)
            return input;

        LaunchCommand out;
        out.command = *npm;
        out.args.push_back("exec");
        std::vector<std::string> rest = input.args;
        auto yes = std::find(rest.begin(), rest.end(), "-y");
        if (yes != rest.end())
        {
            rest.erase(yes);
            out.args.push_back("--yes");
        }
        out.args.insert(out.args.end(), rest.begin(), rest.end());
        log::info("Using npm exec instead of npx: " + out.command);
        return out;
    }

    if (input.command == "node")
    {
        if (auto node = locator_("node"))
            return LaunchCommand{*node, input.args};
        return input;
    }

    if (auto legacy = resolve_legacy_batch(input))
        return *legacy;

    return input;
}

std::optional<LaunchCommand> CommandResolver::resolve_legacy_batch(const LaunchCommand& input) const
{
    if (lower(input.command) != "cmd.exe" || input.args.size() < 2 || lower(input.args[0]) != "/c")
        return std::nullopt;

    const std::string& batch = input.args[1];
    for (const auto& launcher : kLegacyLaunchers)
    {
        if (batch.find(std::string("run_") + launcher.batch_marker + ".bat") == std::string::npos)
            continue;
        auto npm = locator_("npm");
        if (!npm)
            return std::nullopt;

        LaunchCommand out;
        out.command = *npm;
        out.args.push_back("exec");
        if (launcher.assume_yes)
            out.args.push_back("--yes");
        out.args.push_back(launcher.package);
        log::info("Legacy batch launcher " + batch + " replaced with npm exec " +
                  launcher.package);
        return out;
    }
    return std::nullopt;
}

} // namespace mcphub::client
