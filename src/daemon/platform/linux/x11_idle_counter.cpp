#include "platform/linux/x11_idle_counter.hpp"

#include <X11/Xlib.h>
#include <X11/extensions/scrnsaver.h>

std::expected<std::unique_ptr<X11IdleCounter>, WatchError> X11IdleCounter::open() {
    std::unique_ptr<X11IdleCounter> counter(new X11IdleCounter());

    counter->display_ = XOpenDisplay(nullptr);
    if (!counter->display_) {
        return std::unexpected(
            WatchError{WatchError::Kind::SessionUnavailable, "cannot open X display"});
    }

    int event_base = 0;
    int error_base = 0;
    if (!XScreenSaverQueryExtension(counter->display_, &event_base, &error_base)) {
        return std::unexpected(WatchError{WatchError::Kind::IdleCounterUnsupported,
                                          "XScreenSaver extension unavailable"});
    }

    return counter;
}

X11IdleCounter::~X11IdleCounter() {
    if (display_) XCloseDisplay(display_);
}

std::expected<uint32_t, WatchError> X11IdleCounter::seconds_since_last_input() {
    XScreenSaverInfo* info = XScreenSaverAllocInfo();
    if (!info) {
        return std::unexpected(WatchError{WatchError::Kind::IdleCounterFailure,
                                          "could not allocate XScreenSaverInfo"});
    }

    Status ok = XScreenSaverQueryInfo(display_, DefaultRootWindow(display_), info);
    if (!ok) {
        XFree(info);
        return std::unexpected(
            WatchError{WatchError::Kind::IdleCounterFailure, "XScreenSaverQueryInfo failed"});
    }

    unsigned long idle_ms = info->idle;
    XFree(info);
    return static_cast<uint32_t>(idle_ms / 1000);
}
