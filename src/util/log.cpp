#include "mcpdiff/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace mcpdiff::log
{

namespace
{
std::atomic<Level> g_level{Level::Info};
std::ostream* g_sink = nullptr;
std::mutex g_mutex;

const char* tag(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}
} // namespace

Level parse_level(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return Level::Debug;
    if (upper == "WARN" || upper == "WARNING")
        return Level::Warn;
    if (upper == "ERROR")
        return Level::Error;
    return Level::Info;
}

void set_level(Level level)
{
    g_level = level;
}

Level level()
{
    return g_level;
}

void set_sink(std::ostream* sink)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    g_sink = sink;
}

void write(Level lvl, const std::string& message)
{
    if (static_cast<int>(lvl) < static_cast<int>(g_level.load()))
        return;
    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << "[mcpdiff] " << tag(lvl) << ": " << message << std::endl;
}

} // namespace mcpdiff::log
