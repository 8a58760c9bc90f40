#pragma once

#include "report/report_client.hpp"
#include "watch_error.hpp"

#include <string_view>

class Watcher {
public:
    virtual ~Watcher() = default;

    virtual std::string_view name() const = 0;

    // Polls and reports forever. Returns only with the fatal error that made
    // continuing impossible.
    virtual WatchError run(ReportClient& client) = 0;
};
