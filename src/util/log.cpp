#include "mcphub/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace mcphub::log
{

namespace
{
std::atomic<Level> g_level{Level::Info};
std::mutex g_mutex;
std::ostream* g_sink = nullptr;

std::string to_iso8601_now()
{
    using clock = std::chrono::system_clock;
    auto now = clock::now();
    std::time_t t = clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm;
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << ms.count() << 'Z';
    return oss.str();
}
} // namespace

Level level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return Level::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return Level::Warning;
    if (upper == "ERROR")
        return Level::Error;
    if (upper == "OFF" || upper == "NONE")
        return Level::Off;
    return Level::Info;
}

std::string to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF";
    }
    return "INFO";
}

void set_level(Level level)
{
    g_level.store(level, std::memory_order_relaxed);
}

Level level()
{
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl)
{
    Level current = level();
    return current != Level::Off && lvl != Level::Off &&
           static_cast<int>(lvl) >= static_cast<int>(current);
}

void set_sink(std::ostream* sink)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    g_sink = sink;
}

void write(Level lvl, const std::string& message)
{
    if (!enabled(lvl))
        return;
    std::string line = to_iso8601_now() + " - mcphub - " + to_string(lvl) + " - " + message;
    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << line << std::endl;
}

} // namespace mcphub::log
