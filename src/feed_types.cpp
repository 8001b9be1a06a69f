#include "feed_types.hpp"

namespace feed_sync {

using json = nlohmann::json;

json FeedItem::to_json() const {
    json j = {{"id", id}, {"payload", payload}};
    if (!source_id.empty()) j["source_id"] = source_id;
    return j;
}

FeedItem FeedItem::from_json(const json& j) {
    FeedItem item;
    item.id = j.at("id").get<std::string>();
    item.payload = j.value("payload", json::object());
    item.source_id = j.value("source_id", "");
    return item;
}

json LocalFeedRecord::to_json() const {
    auto opt = [](const std::optional<int64_t>& v) { return v ? json(*v) : json(nullptr); };
    return {
        {"item_id", item_id},
        {"feed_index", feed_index},
        {"payload", payload},
        {"viewed_at", opt(viewed_at)},
        {"saved_at", opt(saved_at)},
        {"shared_at", opt(shared_at)},
        {"updated_at", updated_at}
    };
}

std::string PageCursor::serialize() const {
    return json{{"o", order_value}, {"d", doc_id}}.dump();
}

std::optional<PageCursor> PageCursor::deserialize(const std::string& raw) {
    auto j = json::parse(raw, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    if (!j.contains("d") || !j["d"].is_string()) return std::nullopt;
    return PageCursor{j.value("o", json(nullptr)), j["d"].get<std::string>()};
}

} // namespace feed_sync
