#include "log_client.hpp"

#include "aw_client.hpp"
#include "logging.hpp"

std::expected<void, std::string>
LogClient::send_active_window(const std::string& app_id, const std::string& title) {
    logging::info("Active window: app_id=\"{}\" title=\"{}\"", app_id, title);
    return {};
}

std::expected<void, std::string>
LogClient::ping(bool was_idle, Timestamp timestamp, std::chrono::milliseconds duration) {
    logging::info("Ping: {} at {} for {:.3f}s", was_idle ? "afk" : "not-afk",
                  aw::format_timestamp(timestamp),
                  std::chrono::duration<double>(duration).count());
    return {};
}
