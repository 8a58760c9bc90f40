#pragma once

#include "report/window_filter.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Server {
        std::string host = "localhost";
        uint16_t port = 5600;

        std::string base_url() const { return "http://" + host + ":" + std::to_string(port); }
    } server;

    struct Watchers {
        std::chrono::seconds idle_timeout{180};
        std::chrono::seconds poll_time_idle{4};
        std::chrono::seconds poll_time_window{1};
        std::vector<WindowFilter> filters;
    } watchers;

    // Log heartbeats instead of sending them.
    bool no_server = false;

    static Config load(const std::string& path);
    static Config load_default();
};
