#pragma once

#include "platform/idle_counter.hpp"

#include <memory>

// Xlib types, kept out of the header so X11's macros (None, Status, ...) do
// not leak into the rest of the daemon.
struct _XDisplay;

// Idle time from the MIT-SCREEN-SAVER extension. Not thread-safe; the idle
// watcher is its only user.
class X11IdleCounter : public IdleCounter {
public:
    // Opens $DISPLAY and checks for the screensaver extension.
    static std::expected<std::unique_ptr<X11IdleCounter>, WatchError> open();

    ~X11IdleCounter() override;

    X11IdleCounter(const X11IdleCounter&) = delete;
    X11IdleCounter& operator=(const X11IdleCounter&) = delete;

    std::expected<uint32_t, WatchError> seconds_since_last_input() override;

private:
    X11IdleCounter() = default;

    _XDisplay* display_ = nullptr;
};
