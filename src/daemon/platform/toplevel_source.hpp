#pragma once

#include "watch_error.hpp"

#include <algorithm>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

// Values of zwlr_foreign_toplevel_handle_v1.state.
enum class ToplevelState : uint32_t {
    Maximized = 0,
    Minimized = 1,
    Activated = 2,
    Fullscreen = 3,
};

struct ToplevelEvent {
    enum class Kind { Created, Title, AppId, State, Done, Closed, ManagerFinished };

    Kind kind;
    std::string id;
    std::string value;            // Title / AppId
    std::vector<uint32_t> states; // State

    bool has_state(ToplevelState s) const {
        return std::ranges::find(states, static_cast<uint32_t>(s)) != states.end();
    }
};

class ToplevelSource {
public:
    virtual ~ToplevelSource() = default;

    // Blocks until the compositor has processed every request sent so far and
    // returns the window events received in the meantime, in order.
    virtual std::expected<std::vector<ToplevelEvent>, WatchError> roundtrip() = 0;
};
