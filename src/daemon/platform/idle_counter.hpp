#pragma once

#include "watch_error.hpp"

#include <cstdint>
#include <expected>

class IdleCounter {
public:
    virtual ~IdleCounter() = default;
    virtual std::expected<uint32_t, WatchError> seconds_since_last_input() = 0;
};
