#pragma once

#include "report/report_client.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

// Gap between the heartbeat closing the old state and the one opening the new
// state. The server keeps one event per timestamp, so both would otherwise
// collapse into a single event.
constexpr std::chrono::milliseconds STATE_CHANGE_OFFSET{1};

struct IdleSample {
    uint32_t seconds_since_input = 0;
    Timestamp now;

    Timestamp last_input() const { return now - std::chrono::seconds(seconds_since_input); }
};

struct Ping {
    bool was_idle = false;
    Timestamp timestamp;
    std::chrono::milliseconds duration{0};

    bool operator==(const Ping&) const = default;
};

struct IdleTransition {
    bool is_idle = false;
    std::vector<Ping> pings;
};

// One tick of the afk state machine. Idle once seconds_since_input reaches the
// timeout, active again as soon as it drops below it. A state change emits
// two pings, one at the last input and one STATE_CHANGE_OFFSET after it;
// otherwise a single ping carrying the current state.
IdleTransition next_idle_state(bool is_idle, const IdleSample& sample,
                               std::chrono::seconds idle_timeout);
