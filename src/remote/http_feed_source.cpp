#include "remote/http_feed_source.hpp"
#include "errors.hpp"
#include <thread>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace feed_sync {

using json = nlohmann::json;

namespace {

bool is_retryable(const cpr::Response& r) {
    return r.status_code == 429 || r.status_code == 503 || r.status_code == 0;
}

template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, int max_retries, std::chrono::milliseconds base) {
    if (max_retries < 1) max_retries = 1;
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if (is_retryable(r) && i + 1 < max_retries) {
            spdlog::warn("⚠️ Feed API {} ({}). Cooling down (Attempt {}/{})...",
                         r.status_code,
                         r.status_code == 0 ? r.error.message : (r.status_code == 429 ? "Quota" : "Overload"),
                         i + 1, max_retries);
            // Linear backoff: base, 2x base, 3x base...
            std::this_thread::sleep_for(base * (i + 1));
            continue;
        }
        break;
    }
    return r;
}

} // namespace

HttpFeedSource::HttpFeedSource(RemoteConfig config, std::chrono::milliseconds retry_base)
    : config_(std::move(config)), retry_base_(retry_base) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') config_.base_url.pop_back();
}

std::string HttpFeedSource::page_url(const SourceDescriptor& source) const {
    return config_.base_url + "/v1/feeds/" + source.collection + "/pages";
}

FeedPage HttpFeedSource::fetch_page(const SourceDescriptor& source,
                                    const std::optional<PageCursor>& cursor,
                                    int page_size) {
    cpr::Parameters params{{"source", source.id}, {"limit", std::to_string(page_size)}};
    if (!source.order_by.empty()) {
        params.Add({"order_by", source.order_by});
        params.Add({"direction", source.descending ? "desc" : "asc"});
    }
    if (cursor) params.Add({"after", cursor->serialize()});

    cpr::Header headers{{"Accept", "application/json"}};
    if (!config_.api_key.empty()) headers["X-Api-Key"] = config_.api_key;

    const std::string url = page_url(source);
    auto r = perform_request_with_retry([&]() {
        return cpr::Get(cpr::Url{url}, params, headers, cpr::Timeout{config_.timeout_ms});
    }, config_.max_retries, retry_base_);

    if (r.status_code != 200) {
        std::string reason = r.status_code == 0 ? r.error.message : r.text;
        spdlog::error("❌ Feed API error [{}] for {}: {}", r.status_code, source.id, reason);
        throw RemoteFetchError("fetch failed for " + source.id + " (status " + std::to_string(r.status_code) + ")");
    }

    auto page = parse_page(r.text, source.id);
    spdlog::debug("📥 {}: {} items, has_more={}", source.id, page.items.size(), page.has_more);
    return page;
}

FeedPage HttpFeedSource::parse_page(const std::string& body, const std::string& source_id) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw RemoteFetchError("malformed page response for " + source_id);
    }

    FeedPage page;
    try {
        for (const auto& raw : j.value("items", json::array())) {
            FeedItem item;
            item.id = raw.at("id").get<std::string>();
            item.payload = raw.value("fields", json::object());
            item.source_id = source_id;
            page.items.push_back(std::move(item));
        }
        if (j.contains("next_cursor") && j["next_cursor"].is_object()) {
            const auto& c = j["next_cursor"];
            page.next_cursor = PageCursor{c.value("order_value", json(nullptr)), c.at("doc_id").get<std::string>()};
        }
        page.has_more = j.value("has_more", false);
    } catch (const json::exception& e) {
        throw RemoteFetchError("malformed page response for " + source_id + ": " + e.what());
    }
    return page;
}

} // namespace feed_sync
