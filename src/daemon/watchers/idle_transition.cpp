#include "idle_transition.hpp"

#include "logging.hpp"

IdleTransition next_idle_state(bool is_idle, const IdleSample& sample,
                               std::chrono::seconds idle_timeout) {
    constexpr std::chrono::milliseconds zero{0};

    const auto since_input = std::chrono::seconds(sample.seconds_since_input);
    const auto last_input = sample.last_input();
    const bool past_timeout = since_input >= idle_timeout;

    IdleTransition next{.is_idle = is_idle};

    if (is_idle && !past_timeout) {
        logging::debug("No longer idle");
        next.pings.push_back({true, last_input, zero});
        next.pings.push_back({true, last_input + STATE_CHANGE_OFFSET, zero});
        next.is_idle = false;
    } else if (!is_idle && past_timeout) {
        logging::debug("Idle again");
        next.pings.push_back({false, last_input, zero});
        next.pings.push_back({false, last_input + STATE_CHANGE_OFFSET, since_input});
        next.is_idle = true;
    } else if (is_idle) {
        logging::trace("Reporting as idle");
        next.pings.push_back({true, last_input, since_input});
    } else {
        logging::trace("Reporting as not idle");
        next.pings.push_back({false, last_input, zero});
    }

    return next;
}
