#include "config.hpp"
#include "logging.hpp"
#include "report/aw_client.hpp"
#include "report/log_client.hpp"
#include "watchers/idle_watcher.hpp"
#include "watchers/toplevel_watcher.hpp"

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

void usage(const char* prog) {
    std::println("Usage: {} [options]", prog);
    std::println("Options:");
    std::println("  -c, --config PATH          Config file path");
    std::println("      --host HOST            ActivityWatch server host");
    std::println("      --port PORT            ActivityWatch server port");
    std::println("      --idle-timeout SEC     Seconds without input before going idle");
    std::println("      --poll-time-idle SEC   Seconds between idle polls");
    std::println("      --poll-time-window SEC Seconds between window reports");
    std::println("      --no-server            Log heartbeats instead of sending them");
    std::println("  -v, --verbose              Debug logging (-vv for trace)");
    std::println("  -h, --help                 Show this help");
}

std::optional<long> parse_positive(const std::string& flag, const char* value) {
    char* end = nullptr;
    long n = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || n <= 0) {
        std::println(stderr, "{}: expected a positive integer, got '{}'", flag, value);
        return std::nullopt;
    }
    return n;
}

std::string hostname() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (::gethostname(buf, sizeof(buf)) != 0) return "unknown";
    return buf;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::optional<std::string> host;
    std::optional<long> port;
    std::optional<long> idle_timeout;
    std::optional<long> poll_time_idle;
    std::optional<long> poll_time_window;
    bool no_server = false;
    int verbosity = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--config" || arg == "-c") {
            if (has_value) config_path = argv[++i];
        } else if (arg == "--host") {
            if (has_value) host = argv[++i];
        } else if (arg == "--port" && has_value) {
            if (!(port = parse_positive(arg, argv[++i]))) return 1;
            if (*port > 65535) {
                std::println(stderr, "--port: {} is out of range", *port);
                return 1;
            }
        } else if (arg == "--idle-timeout" && has_value) {
            if (!(idle_timeout = parse_positive(arg, argv[++i]))) return 1;
        } else if (arg == "--poll-time-idle" && has_value) {
            if (!(poll_time_idle = parse_positive(arg, argv[++i]))) return 1;
        } else if (arg == "--poll-time-window" && has_value) {
            if (!(poll_time_window = parse_positive(arg, argv[++i]))) return 1;
        } else if (arg == "--no-server") {
            no_server = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbosity = std::max(verbosity, 1);
        } else if (arg == "-vv") {
            verbosity = 2;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    if (verbosity == 1) logging::set_level(logging::Level::Debug);
    if (verbosity >= 2) logging::set_level(logging::Level::Trace);

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (host) config.server.host = *host;
    if (port) config.server.port = static_cast<uint16_t>(*port);
    if (idle_timeout) config.watchers.idle_timeout = std::chrono::seconds(*idle_timeout);
    if (poll_time_idle) config.watchers.poll_time_idle = std::chrono::seconds(*poll_time_idle);
    if (poll_time_window) config.watchers.poll_time_window = std::chrono::seconds(*poll_time_window);
    if (no_server) config.no_server = true;

    std::unique_ptr<ReportClient> client;
    if (config.no_server) {
        client = std::make_unique<LogClient>();
    } else {
        auto aw = std::make_unique<AwClient>(config, hostname());
        if (auto res = aw->create_buckets(); !res) {
            logging::error("Cannot create buckets: {}", res.error());
            return 1;
        }
        client = std::move(aw);
    }

    std::vector<std::unique_ptr<Watcher>> watchers;

    if (auto w = ToplevelWatcher::create(config)) {
        watchers.push_back(std::move(*w));
    } else {
        logging::warn("Window watcher unavailable: {}", w.error().message);
    }

    if (auto w = IdleWatcher::create(config)) {
        watchers.push_back(std::move(*w));
    } else {
        logging::warn("Idle watcher unavailable: {}", w.error().message);
    }

    if (watchers.empty()) {
        logging::error("No supported watchers, exiting");
        return 1;
    }

    {
        std::vector<std::jthread> threads;
        for (auto& watcher : watchers) {
            threads.emplace_back([&watcher, &client] {
                WatchError err = watcher->run(*client);
                logging::error("Watcher {} stopped: {}: {}", watcher->name(),
                               to_string(err.kind), err.message);
            });
        }
    }

    // Every watcher stopped on a fatal error.
    return 1;
}
