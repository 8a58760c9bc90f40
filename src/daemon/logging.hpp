#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace logging {

enum class Level { Error = 0, Warn, Info, Debug, Trace };

void set_level(Level level);
Level level();
bool enabled(Level level);

// Writes one "[activity-watcher] LEVEL message" line to stderr.
void write(Level level, std::string_view msg);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Error)) write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Warn)) write(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Trace)) write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging
