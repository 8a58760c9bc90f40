#include "toplevel_watcher.hpp"

#include "logging.hpp"
#include "platform/linux/wlr_toplevel_source.hpp"

#include <thread>

std::expected<std::unique_ptr<ToplevelWatcher>, WatchError>
ToplevelWatcher::create(const Config& config) {
    auto source = WlrToplevelSource::connect();
    if (!source) return std::unexpected(source.error());
    return std::make_unique<ToplevelWatcher>(std::move(*source), config);
}

ToplevelWatcher::ToplevelWatcher(std::unique_ptr<ToplevelSource> source, const Config& config)
    : source_(std::move(source)), poll_time_(config.watchers.poll_time_window) {}

std::expected<void, WatchError> ToplevelWatcher::dispatch() {
    auto events = source_->roundtrip();
    if (!events) return std::unexpected(events.error());

    for (const auto& event : *events) {
        auto res = registry_.apply(event);
        if (res) continue;
        if (res.error().fatal()) return res;
        logging::error("Toplevel event dropped: {}", res.error().message);
    }
    return {};
}

std::expected<void, WatchError> ToplevelWatcher::send_active_window(ReportClient& client) const {
    auto window = registry_.active_window();
    if (!window) return std::unexpected(window.error());

    auto res = client.send_active_window(window->app_id, window->title);
    if (!res) {
        return std::unexpected(WatchError{WatchError::Kind::ReportFailure,
                                          "failed to send heartbeat for active window: " +
                                              res.error()});
    }
    return {};
}

std::expected<void, WatchError> ToplevelWatcher::tick(ReportClient& client) {
    if (auto res = dispatch(); !res) return res;

    auto res = send_active_window(client);
    if (!res) {
        if (res.error().kind == WatchError::Kind::NoActiveWindow) {
            logging::debug("Skipping window report: {}", res.error().message);
        } else {
            logging::error("Error on window iteration: {}", res.error().message);
        }
    }
    return {};
}

WatchError ToplevelWatcher::run(ReportClient& client) {
    // Initial window list and focus state before the first report.
    if (auto res = dispatch(); !res) return res.error();

    logging::info("Starting wlr foreign toplevel watcher ({} windows, poll {}s)",
                  registry_.size(), poll_time_.count());
    while (true) {
        if (auto res = tick(client); !res) return res.error();
        std::this_thread::sleep_for(poll_time_);
    }
}
