#include "mcphub/client/registry.hpp"
#include "mcphub/config.hpp"
#include "mcphub/exceptions.hpp"
#include "mcphub/settings.hpp"
#include "mcphub/util/json.hpp"
#include "mcphub/util/log.hpp"
#include "mcphub/version.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "mcphub " << mcphub::VERSION_STRING << "\n";
    std::cout << "Usage:\n";
    std::cout << "  mcphub [options] servers\n";
    std::cout << "  mcphub [options] connect <name>\n";
    std::cout << "  mcphub [options] connect-all\n";
    std::cout << "  mcphub [options] tools <name>\n";
    std::cout << "  mcphub [options] tools-all\n";
    std::cout << "  mcphub [options] call <name> <tool> [json-args]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>       Server configuration (default: config.json)\n";
    std::cout << "  --timeout-ms <n>      Connect timeout in milliseconds\n";
    std::cout << "  --log-level <level>   DEBUG, INFO, WARNING, ERROR or OFF\n";
    std::cout << "  --pretty              Pretty-print JSON output\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  MCPHUB_LOG_LEVEL, MCPHUB_CONNECT_TIMEOUT_MS, MCPHUB_REQUEST_TIMEOUT_MS,\n";
    std::cout << "  MCPHUB_CLEANUP_TIMEOUT_MS\n";
    return exit_code;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end())
        return false;
    args.erase(it);
    return true;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || std::next(it) == args.end())
        return std::nullopt;
    std::string value = *std::next(it);
    args.erase(it, std::next(it, 2));
    return value;
}

static bool is_flag(const std::string& s)
{
    return !s.empty() && s[0] == '-';
}

static int parse_int(const std::string& s, int defv)
{
    try
    {
        return std::stoi(s);
    }
    catch (const std::exception&)
    {
        return defv;
    }
}

static int run(const std::string& cmd, std::vector<std::string> rest,
               mcphub::client::Registry& registry, bool pretty)
{
    using mcphub::Json;

    auto dump_json = [pretty](const Json& j)
    { std::cout << (pretty ? j.dump(2) : j.dump()) << "\n"; };

    if (cmd == "servers")
    {
        Json out = Json::array();
        for (const auto& d : registry.list_descriptors())
        {
            Json entry = d;
            entry["status"] = d.enabled ? "Available" : "Disabled";
            out.push_back(entry);
        }
        dump_json(out);
        return 0;
    }

    if (cmd == "connect-all")
    {
        auto report = registry.connect_all();
        dump_json(Json{{"connected", report.connected}, {"failures", report.failures}});
        return report.failures.empty() ? 0 : 1;
    }

    if (cmd == "tools-all")
    {
        registry.connect_all();
        Json out = Json::array();
        for (const auto& tool : registry.list_all_tools())
            out.push_back(Json(tool));
        dump_json(out);
        return 0;
    }

    if (rest.empty())
    {
        std::cerr << "Missing server name. See: mcphub --help\n";
        return 2;
    }
    std::string name = rest.front();
    rest.erase(rest.begin());

    if (cmd == "connect")
    {
        auto status = registry.connect(name);
        dump_json(Json{{"server", name}, {"status", mcphub::client::to_string(status)}});
        return 0;
    }

    if (cmd == "tools")
    {
        registry.connect(name);
        Json out = Json::array();
        for (const auto& tool : registry.list_tools(name))
            out.push_back(Json(tool));
        dump_json(out);
        return 0;
    }

    if (cmd == "call")
    {
        if (rest.empty())
        {
            std::cerr << "Missing tool name\n";
            return 2;
        }
        std::string tool = rest.front();
        rest.erase(rest.begin());
        Json args = Json::object();
        if (!rest.empty())
        {
            std::string error;
            auto parsed = mcphub::util::json::try_parse(rest.front(), error);
            if (!parsed || !parsed->is_object())
            {
                std::cerr << "Tool arguments must be a JSON object\n";
                return 2;
            }
            args = *parsed;
        }
        registry.connect(name);
        Json out = registry.call_tool(name, tool, args);
        dump_json(out);
        return 0;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return 2;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty())
        return usage();
    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);

    try
    {
        auto settings = mcphub::Settings::from_env();
        bool pretty = consume_flag(args, "--pretty");
        std::string config_path = consume_flag_value(args, "--config").value_or("config.json");
        if (auto t = consume_flag_value(args, "--timeout-ms"))
            settings.connect_timeout = std::chrono::milliseconds(
                parse_int(*t, static_cast<int>(settings.connect_timeout.count())));
        if (auto lvl = consume_flag_value(args, "--log-level"))
            settings.log_level = *lvl;
        mcphub::log::set_level(mcphub::log::level_from_string(settings.log_level));

        for (const auto& a : args)
        {
            if (is_flag(a))
            {
                std::cerr << "Unknown option: " << a << "\n";
                return 2;
            }
        }
        if (args.empty())
            return usage();

        std::string cmd = args.front();
        args.erase(args.begin());

        mcphub::client::Registry registry(mcphub::config::load_descriptors(config_path),
                                          settings);
        int rc = run(cmd, std::move(args), registry, pretty);
        registry.cleanup_all();
        return rc;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error [" << mcphub::to_string(mcphub::error_kind(e)) << "]: " << e.what()
                  << "\n";
        return 1;
    }
}
