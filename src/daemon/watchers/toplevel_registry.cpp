#include "toplevel_registry.hpp"

#include "logging.hpp"

std::expected<void, WatchError> ToplevelRegistry::apply(const ToplevelEvent& event) {
    using Kind = ToplevelEvent::Kind;

    switch (event.kind) {
        case Kind::Created:
            logging::debug("Toplevel handle is received {}", event.id);
            windows_.insert_or_assign(event.id, WindowRecord{});
            return {};

        case Kind::ManagerFinished:
            return std::unexpected(WatchError{WatchError::Kind::ProtocolTerminated,
                                              "toplevel manager is finished"});

        case Kind::Closed:
            logging::trace("Window is closed: {}", event.id);
            if (windows_.erase(event.id) == 0) {
                logging::warn("Window is already removed: {}", event.id);
            }
            return {};

        default:
            break;
    }

    auto it = windows_.find(event.id);
    if (it == windows_.end()) {
        return std::unexpected(WatchError{WatchError::Kind::UnknownWindowReference,
                                          "window is not found: " + event.id});
    }
    WindowRecord& window = it->second;

    switch (event.kind) {
        case Kind::Title:
            logging::trace("Title is changed for {}: {}", event.id, event.value);
            window.title = event.value;
            break;
        case Kind::AppId:
            logging::trace("App ID is changed for {}: {}", event.id, event.value);
            window.app_id = event.value;
            break;
        case Kind::State:
            if (event.has_state(ToplevelState::Activated)) {
                logging::trace("Window is activated: {}", event.id);
                current_window_id_ = event.id;
            }
            break;
        case Kind::Done:
            logging::trace("Done: {}", event.id);
            break;
        default:
            break;
    }
    return {};
}

std::expected<WindowRecord, WatchError> ToplevelRegistry::active_window() const {
    if (!current_window_id_) {
        return std::unexpected(
            WatchError{WatchError::Kind::NoActiveWindow, "current window is unknown"});
    }

    const WindowRecord* window = find(*current_window_id_);
    if (!window) {
        return std::unexpected(WatchError{WatchError::Kind::DanglingWindowReference,
                                          "current window is not found by ID " +
                                              *current_window_id_});
    }
    return *window;
}

const WindowRecord* ToplevelRegistry::find(const std::string& id) const {
    auto it = windows_.find(id);
    return it == windows_.end() ? nullptr : &it->second;
}
