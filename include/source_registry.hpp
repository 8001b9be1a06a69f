#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "composite_cursor.hpp"

namespace feed_sync {

struct SourceDescriptor {
    std::string id;
    SourceTier tier = SourceTier::Ordinary;
    std::string collection;   // remote collection backing this source
    std::string order_by;     // remote ordering field, empty = document id
    bool descending = false;
    // Active while min_index <= total_jokes_loaded < max_index
    std::optional<int64_t> min_index;
    std::optional<int64_t> max_index;

    bool is_in_window(int64_t total_jokes_loaded) const;

    nlohmann::json to_json() const;
    static SourceDescriptor from_json(const nlohmann::json& j, SourceTier tier);
};

/**
 * Closed set of known feed sources with their fixed query order.
 * Priority sources are always consulted before ordinary ones.
 */
class SourceRegistry {
public:
    SourceRegistry() = default;
    // Throws ConfigError on duplicate or empty ids.
    SourceRegistry(std::vector<SourceDescriptor> priority, std::vector<SourceDescriptor> ordinary);

    // The production joke feed layout.
    static SourceRegistry defaults();

    const std::vector<SourceDescriptor>& priority_sources() const { return priority_; }
    const std::vector<SourceDescriptor>& ordinary_sources() const { return ordinary_; }
    const std::vector<SourceDescriptor>& sources(SourceTier tier) const;

    const SourceDescriptor* find(const std::string& source_id) const;
    bool empty() const { return priority_.empty() && ordinary_.empty(); }

    // Clips a page limit so a page never crosses the next activation boundary.
    int effective_limit(int64_t total_jokes_loaded, int limit) const;

private:
    std::vector<SourceDescriptor> priority_;
    std::vector<SourceDescriptor> ordinary_;
    std::vector<int64_t> boundaries_;
};

} // namespace feed_sync
