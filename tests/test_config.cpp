#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace std::chrono_literals;

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "aw_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.server.host == "localhost");
        REQUIRE(cfg.server.port == 5600);
        REQUIRE(cfg.server.base_url() == "http://localhost:5600");
        REQUIRE(cfg.watchers.idle_timeout == 180s);
        REQUIRE(cfg.watchers.poll_time_idle == 4s);
        REQUIRE(cfg.watchers.poll_time_window == 1s);
        REQUIRE(cfg.watchers.filters.empty());
        REQUIRE_FALSE(cfg.no_server);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "server": { "host": "10.0.0.1", "port": 5666 },
            "no_server": true,
            "watchers": {
                "idle_timeout_seconds": 300,
                "poll_time_idle_seconds": 10,
                "poll_time_window_seconds": 2,
                "filters": [
                    { "match_app_id": "firefox", "replace_title": "Browser" },
                    { "match_title": ".*secret.*", "replace_app_id": "hidden" }
                ]
            }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.host == "10.0.0.1");
        REQUIRE(cfg.server.port == 5666);
        REQUIRE(cfg.server.base_url() == "http://10.0.0.1:5666");
        REQUIRE(cfg.no_server);
        REQUIRE(cfg.watchers.idle_timeout == 300s);
        REQUIRE(cfg.watchers.poll_time_idle == 10s);
        REQUIRE(cfg.watchers.poll_time_window == 2s);
        REQUIRE(cfg.watchers.filters.size() == 2);
        REQUIRE(cfg.watchers.filters[0].match_app_id.has_value());
        REQUIRE_FALSE(cfg.watchers.filters[0].match_title.has_value());
        REQUIRE(cfg.watchers.filters[0].replace_title == "Browser");
        REQUIRE(cfg.watchers.filters[1].replace_app_id == "hidden");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "watchers": { "idle_timeout_seconds": 60 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.watchers.idle_timeout == 60s);
        // Other fields retain defaults
        REQUIRE(cfg.watchers.poll_time_idle == 4s);
        REQUIRE(cfg.watchers.poll_time_window == 1s);
        REQUIRE(cfg.server.host == "localhost");
        REQUIRE(cfg.server.port == 5600);
    }

    SECTION("NonPositiveDurationsKeepDefaults") {
        TmpFile f(R"({ "watchers": { "idle_timeout_seconds": 0, "poll_time_idle_seconds": -5 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.watchers.idle_timeout == 180s);
        REQUIRE(cfg.watchers.poll_time_idle == 4s);
    }

    SECTION("OutOfRangePortKeepsDefault") {
        TmpFile high(R"({ "server": { "port": 70000 } })");
        REQUIRE(Config::load(high.path).server.port == 5600);

        TmpFile zero(R"({ "server": { "port": 0, "host": "example.org" } })");
        auto cfg = Config::load(zero.path);
        REQUIRE(cfg.server.port == 5600);
        REQUIRE(cfg.server.host == "example.org");
    }

    SECTION("InvalidFilterRegexIsDropped") {
        TmpFile f(R"({ "watchers": { "filters": [
            { "match_app_id": "([unclosed", "replace_app_id": "x" },
            { "match_app_id": "kitty", "replace_app_id": "terminal" }
        ] } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.watchers.filters.size() == 1);
        REQUIRE(cfg.watchers.filters[0].replace_app_id == "terminal");
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.server.port == 5600);
        REQUIRE(cfg.watchers.idle_timeout == 180s);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/aw_test_nonexistent_config_file.json");
        REQUIRE(cfg.server.host == "localhost");
        REQUIRE(cfg.watchers.poll_time_window == 1s);
    }
}
