#include "logging.hpp"

#include <atomic>
#include <mutex>
#include <print>

namespace logging {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_write_mutex;

constexpr std::string_view level_name(Level level) {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn: return "WARN";
        case Level::Info: return "INFO";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?";
}

} // namespace

void set_level(Level level) {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl) {
    return static_cast<int>(lvl) <= static_cast<int>(level());
}

void write(Level lvl, std::string_view msg) {
    std::lock_guard lock(g_write_mutex);
    std::println(stderr, "[activity-watcher] {:<5} {}", level_name(lvl), msg);
}

} // namespace logging
