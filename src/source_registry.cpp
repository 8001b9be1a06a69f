#include "source_registry.hpp"
#include "errors.hpp"
#include <algorithm>
#include <set>

namespace feed_sync {

using json = nlohmann::json;

bool SourceDescriptor::is_in_window(int64_t total_jokes_loaded) const {
    bool in_range = !min_index || *min_index <= total_jokes_loaded;
    bool not_exceeded = !max_index || *max_index > total_jokes_loaded;
    return in_range && not_exceeded;
}

json SourceDescriptor::to_json() const {
    json j = {
        {"id", id},
        {"collection", collection},
        {"order_by", order_by},
        {"descending", descending},
        {"min_index", min_index ? json(*min_index) : json(nullptr)},
        {"max_index", max_index ? json(*max_index) : json(nullptr)}
    };
    return j;
}

SourceDescriptor SourceDescriptor::from_json(const json& j, SourceTier tier) {
    SourceDescriptor d;
    d.id = j.at("id").get<std::string>();
    d.tier = tier;
    d.collection = j.value("collection", "jokes");
    d.order_by = j.value("order_by", "");
    d.descending = j.value("descending", false);
    if (j.contains("min_index") && !j["min_index"].is_null()) d.min_index = j["min_index"].get<int64_t>();
    if (j.contains("max_index") && !j["max_index"].is_null()) d.max_index = j["max_index"].get<int64_t>();
    return d;
}

SourceRegistry::SourceRegistry(std::vector<SourceDescriptor> priority, std::vector<SourceDescriptor> ordinary)
    : priority_(std::move(priority)), ordinary_(std::move(ordinary)) {
    std::set<std::string> seen;
    std::set<int64_t> bounds;

    auto admit = [&](SourceDescriptor& d, SourceTier tier) {
        if (d.id.empty()) throw ConfigError("source id must not be empty");
        if (!seen.insert(d.id).second) throw ConfigError("duplicate source id: " + d.id);
        d.tier = tier;
        if (d.min_index && *d.min_index > 0) bounds.insert(*d.min_index);
        if (d.max_index && *d.max_index > 0) bounds.insert(*d.max_index);
    };

    for (auto& d : priority_) admit(d, SourceTier::Priority);
    for (auto& d : ordinary_) admit(d, SourceTier::Ordinary);
    boundaries_.assign(bounds.begin(), bounds.end());
}

SourceRegistry SourceRegistry::defaults() {
    std::vector<SourceDescriptor> priority = {
        {"priority_today_joke", SourceTier::Priority, "daily_jokes", "date", true, 5, std::nullopt},
    };
    std::vector<SourceDescriptor> ordinary = {
        {"best_jokes", SourceTier::Ordinary, "jokes", "saved_fraction", true, 0, 200},
        {"all_jokes_random", SourceTier::Ordinary, "jokes", "random_id", false, 10, 500},
        {"all_jokes_public_timestamp", SourceTier::Ordinary, "jokes", "public_timestamp", false, 200, std::nullopt},
    };
    return SourceRegistry(std::move(priority), std::move(ordinary));
}

const std::vector<SourceDescriptor>& SourceRegistry::sources(SourceTier tier) const {
    return tier == SourceTier::Priority ? priority_ : ordinary_;
}

const SourceDescriptor* SourceRegistry::find(const std::string& source_id) const {
    for (const auto* list : {&priority_, &ordinary_}) {
        auto it = std::find_if(list->begin(), list->end(),
                               [&](const SourceDescriptor& d) { return d.id == source_id; });
        if (it != list->end()) return &*it;
    }
    return nullptr;
}

int SourceRegistry::effective_limit(int64_t total_jokes_loaded, int limit) const {
    if (limit <= 0) return 0;
    for (int64_t b : boundaries_) {
        if (b > total_jokes_loaded && b <= total_jokes_loaded + limit) {
            return static_cast<int>(b - total_jokes_loaded);
        }
    }
    return limit;
}

} // namespace feed_sync
