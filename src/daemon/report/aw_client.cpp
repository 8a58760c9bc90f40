#include "aw_client.hpp"

#include "logging.hpp"

#include <curl/curl.h>
#include <format>

using json = nlohmann::json;

namespace aw {

std::string format_timestamp(Timestamp ts) {
    auto ms = std::chrono::floor<std::chrono::milliseconds>(ts);
    return std::format("{:%FT%T}Z", ms);
}

std::string bucket_id(std::string_view prefix, std::string_view hostname) {
    return std::format("{}_{}", prefix, hostname);
}

json bucket_body(std::string_view type, std::string_view hostname) {
    return {
        {"client", std::string(CLIENT_NAME)},
        {"type", std::string(type)},
        {"hostname", std::string(hostname)},
    };
}

json heartbeat_body(Timestamp ts, std::chrono::milliseconds duration, json data) {
    return {
        {"timestamp", format_timestamp(ts)},
        {"duration", std::chrono::duration<double>(duration).count()},
        {"data", std::move(data)},
    };
}

std::string heartbeat_url(std::string_view base_url, std::string_view bucket,
                          std::chrono::duration<double> pulsetime) {
    return std::format("{}/api/0/buckets/{}/heartbeat?pulsetime={}", base_url, bucket,
                       pulsetime.count());
}

} // namespace aw

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

AwClient::AwClient(const Config& config, std::string hostname)
    : base_url_(config.server.base_url()), hostname_(std::move(hostname)),
      window_bucket_(aw::bucket_id(aw::WINDOW_BUCKET_PREFIX, hostname_)),
      idle_bucket_(aw::bucket_id(aw::IDLE_BUCKET_PREFIX, hostname_)),
      poll_time_window_(config.watchers.poll_time_window),
      poll_time_idle_(config.watchers.poll_time_idle),
      idle_timeout_(config.watchers.idle_timeout),
      filters_(config.watchers.filters) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

AwClient::~AwClient() {
    curl_global_cleanup();
}

std::expected<void, std::string> AwClient::create_buckets() {
    auto res = post(std::format("{}/api/0/buckets/{}", base_url_, window_bucket_),
                    aw::bucket_body(aw::WINDOW_BUCKET_TYPE, hostname_));
    if (!res) return std::unexpected("bucket " + window_bucket_ + ": " + res.error());

    res = post(std::format("{}/api/0/buckets/{}", base_url_, idle_bucket_),
               aw::bucket_body(aw::IDLE_BUCKET_TYPE, hostname_));
    if (!res) return std::unexpected("bucket " + idle_bucket_ + ": " + res.error());

    logging::info("Reporting to {} (buckets {}, {})", base_url_, window_bucket_, idle_bucket_);
    return {};
}

std::expected<void, std::string>
AwClient::send_active_window(const std::string& app_id, const std::string& title) {
    std::string app = app_id;
    std::string window_title = title;
    apply_filters(filters_, app, window_title);

    auto body = aw::heartbeat_body(std::chrono::system_clock::now(), std::chrono::milliseconds(0),
                                   {{"app", app}, {"title", window_title}});
    auto pulsetime = poll_time_window_ + std::chrono::seconds(1);
    return post(aw::heartbeat_url(base_url_, window_bucket_, pulsetime), body);
}

std::expected<void, std::string>
AwClient::ping(bool was_idle, Timestamp timestamp, std::chrono::milliseconds duration) {
    auto body = aw::heartbeat_body(timestamp, duration,
                                   {{"status", was_idle ? "afk" : "not-afk"}});
    auto pulsetime = idle_timeout_ + poll_time_idle_;
    return post(aw::heartbeat_url(base_url_, idle_bucket_, pulsetime), body);
}

std::expected<void, std::string> AwClient::post(const std::string& url, const json& body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string payload = body.dump();
    std::string response_body;

    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    // 304 is what the server answers for a bucket that already exists.
    if (status >= 400) {
        return std::unexpected(std::format("HTTP {} from {}: {}", status, url, response_body));
    }

    logging::trace("POST {} -> {}", url, status);
    return {};
}
