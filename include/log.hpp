#ifndef UPNP_SCOUT_LOG_HPP
#define UPNP_SCOUT_LOG_HPP

#include <string_view>
#include <utility>

#include "fmt/format.h"

namespace logging
{

enum class level
{
    debug = 0,
    info,
    warn,
    error,
    off
};

void set_level(level lvl);

bool enabled(level lvl);

// Writes one complete line to stderr, serialized against concurrent writers
void write(level lvl, std::string_view message);

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::debug))
        write(level::debug, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::info))
        write(level::info, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::warn))
        write(level::warn, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args)
{
    if(enabled(level::error))
        write(level::error, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace logging

#endif
