#include <catch2/catch_test_macros.hpp>

#include "report/aw_client.hpp"
#include "report/log_client.hpp"

using namespace std::chrono_literals;

TEST_CASE("ActivityWatch payloads", "[report]") {
    const Timestamp ts = std::chrono::sys_days{std::chrono::year{2024} / 3 / 1} + 10h + 15min +
                         250ms + 999us;

    SECTION("TimestampIsUtcWithMilliseconds") {
        REQUIRE(aw::format_timestamp(ts) == "2024-03-01T10:15:00.250Z");

        const Timestamp whole = std::chrono::sys_days{std::chrono::year{2023} / 12 / 31};
        REQUIRE(aw::format_timestamp(whole) == "2023-12-31T00:00:00.000Z");
    }

    SECTION("BucketIds") {
        REQUIRE(aw::bucket_id(aw::WINDOW_BUCKET_PREFIX, "laptop") == "aw-watcher-window_laptop");
        REQUIRE(aw::bucket_id(aw::IDLE_BUCKET_PREFIX, "laptop") == "aw-watcher-afk_laptop");
    }

    SECTION("BucketBody") {
        auto body = aw::bucket_body(aw::IDLE_BUCKET_TYPE, "laptop");
        REQUIRE(body["client"].get<std::string>() == "activity-watcher");
        REQUIRE(body["type"].get<std::string>() == "afkstatus");
        REQUIRE(body["hostname"].get<std::string>() == "laptop");
    }

    SECTION("HeartbeatBody") {
        auto body = aw::heartbeat_body(ts, 1500ms, {{"status", "afk"}});
        REQUIRE(body["timestamp"].get<std::string>() == "2024-03-01T10:15:00.250Z");
        REQUIRE(body["duration"].get<double>() == 1.5);
        REQUIRE(body["data"]["status"].get<std::string>() == "afk");
    }

    SECTION("HeartbeatUrl") {
        REQUIRE(aw::heartbeat_url("http://localhost:5600", "aw-watcher-afk_laptop", 184s) ==
                "http://localhost:5600/api/0/buckets/aw-watcher-afk_laptop/heartbeat?pulsetime=184");
        REQUIRE(aw::heartbeat_url("http://h:1", "b", std::chrono::duration<double>(2.5)) ==
                "http://h:1/api/0/buckets/b/heartbeat?pulsetime=2.5");
    }

    SECTION("BucketNamesFromConfig") {
        Config cfg;
        AwClient client(cfg, "desk");
        REQUIRE(client.window_bucket() == "aw-watcher-window_desk");
        REQUIRE(client.idle_bucket() == "aw-watcher-afk_desk");
    }

    SECTION("UnreachableServerIsAnError") {
        Config cfg;
        cfg.server.host = "127.0.0.1";
        cfg.server.port = 1; // nothing listens here
        AwClient client(cfg, "desk");

        auto res = client.ping(false, ts, 0ms);
        REQUIRE_FALSE(res);
        REQUIRE_FALSE(res.error().empty());
    }

    SECTION("LogClientAlwaysSucceeds") {
        LogClient client;
        REQUIRE(client.send_active_window("kitty", "vim"));
        REQUIRE(client.ping(true, ts, 30s));
    }
}
