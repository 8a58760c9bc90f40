#pragma once

#include <string>
#include <string_view>

struct WatchError {
    enum class Kind {
        SessionUnavailable,      // fatal, construction
        ProtocolTerminated,      // fatal, compositor sent `finished`
        ConnectionLost,          // fatal, display connection broke
        UnknownWindowReference,
        NoActiveWindow,
        DanglingWindowReference,
        ReportFailure,
        IdleCounterUnsupported,  // fatal, construction
        IdleCounterFailure,
    };

    Kind kind;
    std::string message;

    // Fatal errors end a watcher's run loop; everything else skips one tick.
    bool fatal() const {
        return kind == Kind::SessionUnavailable || kind == Kind::ProtocolTerminated ||
               kind == Kind::ConnectionLost || kind == Kind::IdleCounterUnsupported;
    }
};

constexpr std::string_view to_string(WatchError::Kind kind) {
    switch (kind) {
        case WatchError::Kind::SessionUnavailable: return "session unavailable";
        case WatchError::Kind::ProtocolTerminated: return "protocol terminated";
        case WatchError::Kind::ConnectionLost: return "connection lost";
        case WatchError::Kind::UnknownWindowReference: return "unknown window";
        case WatchError::Kind::NoActiveWindow: return "no active window";
        case WatchError::Kind::DanglingWindowReference: return "dangling window reference";
        case WatchError::Kind::ReportFailure: return "report failed";
        case WatchError::Kind::IdleCounterUnsupported: return "idle counter unsupported";
        case WatchError::Kind::IdleCounterFailure: return "idle counter failed";
    }
    return "unknown error";
}
