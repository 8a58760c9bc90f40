#pragma once

#include "platform/toplevel_source.hpp"
#include "watch_error.hpp"

#include <expected>
#include <optional>
#include <string>
#include <unordered_map>

struct WindowRecord {
    std::string app_id = "unknown";
    std::string title = "unknown";
};

// Open windows and the last one seen focused. current_window_id() may name a
// window that has since closed; that lasts until the next activation.
class ToplevelRegistry {
public:
    // Folds one protocol event into the registry. Events for unknown ids are
    // dropped and reported as UnknownWindowReference; ManagerFinished yields
    // ProtocolTerminated. Closing an unknown id only logs a warning.
    std::expected<void, WatchError> apply(const ToplevelEvent& event);

    // The focused window, or NoActiveWindow / DanglingWindowReference.
    std::expected<WindowRecord, WatchError> active_window() const;

    const std::optional<std::string>& current_window_id() const { return current_window_id_; }
    const WindowRecord* find(const std::string& id) const;
    size_t size() const { return windows_.size(); }

private:
    std::unordered_map<std::string, WindowRecord> windows_;
    std::optional<std::string> current_window_id_;
};
