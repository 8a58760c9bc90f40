#pragma once

#include <chrono>
#include <expected>
#include <string>

using Timestamp = std::chrono::system_clock::time_point;

// Sink for heartbeats. Implementations must be safe to call from several
// watcher threads at once.
class ReportClient {
public:
    virtual ~ReportClient() = default;

    virtual std::expected<void, std::string>
        send_active_window(const std::string& app_id, const std::string& title) = 0;

    virtual std::expected<void, std::string>
        ping(bool was_idle, Timestamp timestamp, std::chrono::milliseconds duration) = 0;
};
