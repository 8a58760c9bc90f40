#pragma once

#include "config.hpp"
#include "idle_transition.hpp"
#include "platform/idle_counter.hpp"
#include "watcher.hpp"

#include <chrono>
#include <expected>
#include <memory>

class IdleWatcher : public Watcher {
public:
    // Uses the X11 screensaver counter.
    static std::expected<std::unique_ptr<IdleWatcher>, WatchError> create(const Config& config);

    // Fails with IdleCounterUnsupported unless a trial read succeeds.
    static std::expected<std::unique_ptr<IdleWatcher>, WatchError>
        create(std::unique_ptr<IdleCounter> counter, const Config& config);

    std::string_view name() const override { return "idle"; }
    WatchError run(ReportClient& client) override;

    // Samples once and sends the resulting pings. On success returns the new
    // idle state; on failure the caller keeps the old one.
    std::expected<bool, WatchError> tick(bool is_idle, ReportClient& client, Timestamp now);

private:
    IdleWatcher(std::unique_ptr<IdleCounter> counter, const Config& config);

    std::unique_ptr<IdleCounter> counter_;
    std::chrono::seconds idle_timeout_;
    std::chrono::seconds poll_time_;
};
