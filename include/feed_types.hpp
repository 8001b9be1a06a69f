#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace feed_sync {

struct FeedItem {
    std::string id;
    nlohmann::json payload = nlohmann::json::object();
    std::string source_id; // diagnostics only, never persisted as ordering data

    nlohmann::json to_json() const;
    static FeedItem from_json(const nlohmann::json& j);
};

struct LocalFeedRecord {
    std::string item_id;
    int64_t feed_index = 0;
    nlohmann::json payload = nlohmann::json::object();
    std::optional<int64_t> viewed_at;
    std::optional<int64_t> saved_at;
    std::optional<int64_t> shared_at;
    int64_t updated_at = 0;

    nlohmann::json to_json() const;
};

// Resume point issued by a remote source. Only the issuing source looks inside.
struct PageCursor {
    nlohmann::json order_value; // number, string or timestamp string
    std::string doc_id;

    std::string serialize() const;
    static std::optional<PageCursor> deserialize(const std::string& raw);

    bool operator==(const PageCursor& other) const {
        return order_value == other.order_value && doc_id == other.doc_id;
    }
    bool operator!=(const PageCursor& other) const { return !(*this == other); }
};

struct FeedPage {
    std::vector<FeedItem> items;
    std::optional<PageCursor> next_cursor;
    bool has_more = false;
};

} // namespace feed_sync
