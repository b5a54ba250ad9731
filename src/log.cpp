#include "log.hpp"

#include <atomic>
#include <mutex>
#include <cstdio>

namespace logging
{

static std::atomic<level> min_level {level::warn};
static std::mutex output_mutex;

static const char* level_tag(level lvl)
{
    switch(lvl)
    {
        case level::debug:
            return "DEBUG";
        case level::info:
            return "INFO";
        case level::warn:
            return "WARN";
        case level::error:
            return "ERROR";
        default:
            return "";
    }
}

void set_level(level lvl)
{
    min_level.store(lvl);
}

bool enabled(level lvl)
{
    return lvl != level::off && lvl >= min_level.load();
}

void write(level lvl, std::string_view message)
{
    std::lock_guard<std::mutex> lock {output_mutex};
    fmt::print(stderr, "[{}] {}\n", level_tag(lvl), message);
}

} // namespace logging
