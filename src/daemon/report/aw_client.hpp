#pragma once

#include "config.hpp"
#include "report_client.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace aw {

constexpr std::string_view CLIENT_NAME = "activity-watcher";
constexpr std::string_view WINDOW_BUCKET_PREFIX = "aw-watcher-window";
constexpr std::string_view IDLE_BUCKET_PREFIX = "aw-watcher-afk";
constexpr std::string_view WINDOW_BUCKET_TYPE = "currentwindow";
constexpr std::string_view IDLE_BUCKET_TYPE = "afkstatus";

// "2024-03-01T10:15:00.250Z"
std::string format_timestamp(Timestamp ts);

std::string bucket_id(std::string_view prefix, std::string_view hostname);

nlohmann::json bucket_body(std::string_view type, std::string_view hostname);

nlohmann::json heartbeat_body(Timestamp ts, std::chrono::milliseconds duration,
                              nlohmann::json data);

std::string heartbeat_url(std::string_view base_url, std::string_view bucket,
                          std::chrono::duration<double> pulsetime);

} // namespace aw

// ActivityWatch REST client. One curl easy handle per request, so concurrent
// calls from both watchers need no locking.
class AwClient : public ReportClient {
public:
    AwClient(const Config& config, std::string hostname);
    ~AwClient() override;

    AwClient(const AwClient&) = delete;
    AwClient& operator=(const AwClient&) = delete;

    // Creates the window and idle buckets. An existing bucket is not an error.
    std::expected<void, std::string> create_buckets();

    std::expected<void, std::string>
        send_active_window(const std::string& app_id, const std::string& title) override;

    std::expected<void, std::string>
        ping(bool was_idle, Timestamp timestamp, std::chrono::milliseconds duration) override;

    const std::string& window_bucket() const { return window_bucket_; }
    const std::string& idle_bucket() const { return idle_bucket_; }

private:
    std::expected<void, std::string> post(const std::string& url, const nlohmann::json& body);

    std::string base_url_;
    std::string hostname_;
    std::string window_bucket_;
    std::string idle_bucket_;
    std::chrono::seconds poll_time_window_;
    std::chrono::seconds poll_time_idle_;
    std::chrono::seconds idle_timeout_;
    std::vector<WindowFilter> filters_;
};
