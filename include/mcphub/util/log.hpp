#pragma once
#include <ostream>
#include <string>

namespace mcphub::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

/// Parses DEBUG/INFO/WARNING/WARN/ERROR/OFF (case-insensitive); unknown names map to Info
Level level_from_string(const std::string& name);
std::string to_string(Level level);

void set_level(Level level);
Level level();
bool enabled(Level level);

/// Redirect output (defaults to std::cerr). Pass nullptr to restore.
void set_sink(std::ostream* sink);

void write(Level level, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    write(Level::Info, message);
}
inline void warn(const std::string& message)
{
    write(Level::Warning, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace mcphub::log
