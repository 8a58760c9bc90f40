#include "idle_watcher.hpp"

#include "logging.hpp"
#include "platform/linux/x11_idle_counter.hpp"

#include <thread>

IdleWatcher::IdleWatcher(std::unique_ptr<IdleCounter> counter, const Config& config)
    : counter_(std::move(counter)), idle_timeout_(config.watchers.idle_timeout),
      poll_time_(config.watchers.poll_time_idle) {}

std::expected<std::unique_ptr<IdleWatcher>, WatchError> IdleWatcher::create(const Config& config) {
    auto counter = X11IdleCounter::open();
    if (!counter) return std::unexpected(counter.error());
    return create(std::move(*counter), config);
}

std::expected<std::unique_ptr<IdleWatcher>, WatchError>
IdleWatcher::create(std::unique_ptr<IdleCounter> counter, const Config& config) {
    auto probe = counter->seconds_since_last_input();
    if (!probe) {
        return std::unexpected(
            WatchError{WatchError::Kind::IdleCounterUnsupported, probe.error().message});
    }
    return std::unique_ptr<IdleWatcher>(new IdleWatcher(std::move(counter), config));
}

std::expected<bool, WatchError> IdleWatcher::tick(bool is_idle, ReportClient& client,
                                                  Timestamp now) {
    auto seconds = counter_->seconds_since_last_input();
    if (!seconds) return std::unexpected(seconds.error());

    auto next = next_idle_state(is_idle, IdleSample{*seconds, now}, idle_timeout_);

    for (const auto& ping : next.pings) {
        auto res = client.ping(ping.was_idle, ping.timestamp, ping.duration);
        if (!res) {
            return std::unexpected(WatchError{WatchError::Kind::ReportFailure, res.error()});
        }
    }

    return next.is_idle;
}

WatchError IdleWatcher::run(ReportClient& client) {
    logging::info("Starting idle watcher (timeout {}s, poll {}s)", idle_timeout_.count(),
                  poll_time_.count());

    bool is_idle = false;
    while (true) {
        auto next = tick(is_idle, client, std::chrono::system_clock::now());
        if (next) {
            is_idle = *next;
        } else {
            logging::error("Error on idle iteration: {}: {}", to_string(next.error().kind),
                           next.error().message);
        }

        std::this_thread::sleep_for(poll_time_);
    }
}
