#pragma once

#include "config.hpp"
#include "platform/toplevel_source.hpp"
#include "toplevel_registry.hpp"
#include "watcher.hpp"

#include <chrono>
#include <expected>
#include <memory>

// Reports the focused window from the wlr foreign toplevel protocol.
class ToplevelWatcher : public Watcher {
public:
    static std::expected<std::unique_ptr<ToplevelWatcher>, WatchError>
        create(const Config& config);

    ToplevelWatcher(std::unique_ptr<ToplevelSource> source, const Config& config);

    std::string_view name() const override { return "toplevel"; }
    WatchError run(ReportClient& client) override;

    // Drains pending protocol messages into the registry. Bad events are
    // logged and skipped; only fatal errors are returned.
    std::expected<void, WatchError> dispatch();

    std::expected<void, WatchError> send_active_window(ReportClient& client) const;

    // dispatch() then send_active_window(). Only fatal errors are returned.
    std::expected<void, WatchError> tick(ReportClient& client);

    const ToplevelRegistry& registry() const { return registry_; }

private:
    std::unique_ptr<ToplevelSource> source_;
    ToplevelRegistry registry_;
    std::chrono::seconds poll_time_;
};
