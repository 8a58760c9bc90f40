#include "config.hpp"

#include "logging.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void load_seconds(const json& j, const char* key, std::chrono::seconds& out) {
    if (!j.contains(key)) return;
    auto value = j[key].get<int64_t>();
    if (value <= 0) {
        logging::error("config: {} must be positive, got {}, keeping {}s", key, value,
                       out.count());
        return;
    }
    out = std::chrono::seconds(value);
}

void load_port(const json& j, uint16_t& out) {
    if (!j.contains("port")) return;
    auto value = j["port"].get<int64_t>();
    if (value <= 0 || value > 65535) {
        logging::error("config: port must be in 1..65535, got {}, keeping {}", value, out);
        return;
    }
    out = static_cast<uint16_t>(value);
}

std::optional<std::regex> load_regex(const json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    return std::regex(j[key].get<std::string>(), std::regex::ECMAScript);
}

std::optional<std::string> load_string(const json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    return j[key].get<std::string>();
}

std::vector<WindowFilter> load_filters(const json& arr) {
    std::vector<WindowFilter> filters;
    for (size_t i = 0; i < arr.size(); i++) {
        const auto& f = arr[i];
        try {
            WindowFilter filter;
            filter.match_app_id = load_regex(f, "match_app_id");
            filter.match_title = load_regex(f, "match_title");
            filter.replace_app_id = load_string(f, "replace_app_id");
            filter.replace_title = load_string(f, "replace_title");
            filters.push_back(std::move(filter));
        } catch (const std::regex_error& e) {
            logging::error("config: filter #{} dropped, invalid regex: {}", i, e.what());
        }
    }
    return filters;
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        logging::warn("config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("host")) cfg.server.host = s["host"].get<std::string>();
            load_port(s, cfg.server.port);
        }

        if (j.contains("no_server")) cfg.no_server = j["no_server"].get<bool>();

        if (j.contains("watchers")) {
            auto& w = j["watchers"];
            load_seconds(w, "idle_timeout_seconds", cfg.watchers.idle_timeout);
            load_seconds(w, "poll_time_idle_seconds", cfg.watchers.poll_time_idle);
            load_seconds(w, "poll_time_window_seconds", cfg.watchers.poll_time_window);
            if (w.contains("filters")) cfg.watchers.filters = load_filters(w["filters"]);
        }

    } catch (const json::exception& e) {
        logging::error("config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
