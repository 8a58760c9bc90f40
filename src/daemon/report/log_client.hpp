#pragma once

#include "report_client.hpp"

// Prints heartbeats instead of sending them. Never fails.
class LogClient : public ReportClient {
public:
    std::expected<void, std::string>
        send_active_window(const std::string& app_id, const std::string& title) override;

    std::expected<void, std::string>
        ping(bool was_idle, Timestamp timestamp, std::chrono::milliseconds duration) override;
};
