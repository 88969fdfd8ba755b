#pragma once
#include <ostream>
#include <string>

namespace mcpdiff::log
{

enum class Level
{
    Debug,
    Info,
    Warn,
    Error
};

/// Accepts DEBUG/INFO/WARN/WARNING/ERROR in any case; anything else is Info
Level parse_level(const std::string& name);

void set_level(Level level);
Level level();

/// Redirect diagnostics (defaults to std::cerr). Caller keeps ownership.
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
    write(Level::Warn, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace mcpdiff::log
