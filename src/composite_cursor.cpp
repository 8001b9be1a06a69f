#include "composite_cursor.hpp"
#include <cmath>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace feed_sync {

using json = nlohmann::json;

namespace {

const char* kTotalJokesLoadedKey = "totalJokesLoaded";
const char* kSubSourceCursorsKey = "subSourceCursors";
const char* kPrioritySourceCursorsKey = "prioritySourceCursors";

json encode_map(const CompositeCursor::CursorMap& cursors) {
    json out = json::object();
    for (const auto& [id, cursor] : cursors) {
        if (cursor.is_exhausted()) {
            out[id] = {{"exhausted", true}};
        } else {
            out[id] = {{"token", *cursor.token()}};
        }
    }
    return out;
}

// Throws json exceptions on shape errors; decode() turns those into a fresh cursor.
CompositeCursor::CursorMap decode_map(const json& j) {
    CompositeCursor::CursorMap out;
    if (j.is_null()) return out;
    if (!j.is_object()) throw std::invalid_argument("cursor map is not an object");

    for (const auto& [id, value] : j.items()) {
        if (value.is_string()) {
            // Older string-map encoding.
            auto raw = value.get<std::string>();
            out.insert_or_assign(id, raw == kLegacyDoneSentinel ? SourceCursor::exhausted()
                                                                : SourceCursor::active(raw));
        } else if (value.is_object() && value.value("exhausted", false)) {
            out.insert_or_assign(id, SourceCursor::exhausted());
        } else if (value.is_object() && value.contains("token")) {
            out.insert_or_assign(id, SourceCursor::active(value.at("token").get<std::string>()));
        } else {
            throw std::invalid_argument("unrecognized cursor entry for " + id);
        }
    }
    return out;
}

} // namespace

const char* to_string(SourceTier tier) {
    return tier == SourceTier::Priority ? "priority" : "ordinary";
}

// --- SOURCE CURSOR ---

SourceCursor SourceCursor::active(std::string token) {
    return SourceCursor(Active{std::move(token)});
}

SourceCursor SourceCursor::exhausted() {
    return SourceCursor(Exhausted{});
}

const std::string* SourceCursor::token() const {
    if (auto* a = std::get_if<Active>(&state_)) return &a->token;
    return nullptr;
}

// --- COMPOSITE CURSOR ---

CompositeCursor::CompositeCursor(int64_t total_jokes_loaded, CursorMap sub_source_cursors, CursorMap priority_source_cursors)
    : total_jokes_loaded_(total_jokes_loaded),
      sub_source_cursors_(std::move(sub_source_cursors)),
      priority_source_cursors_(std::move(priority_source_cursors)) {}

const CompositeCursor::CursorMap& CompositeCursor::cursors(SourceTier tier) const {
    return tier == SourceTier::Priority ? priority_source_cursors_ : sub_source_cursors_;
}

CompositeCursor::CursorMap& CompositeCursor::mutable_cursors(SourceTier tier) {
    return tier == SourceTier::Priority ? priority_source_cursors_ : sub_source_cursors_;
}

std::optional<SourceCursor> CompositeCursor::find(const std::string& source_id, SourceTier tier) const {
    const auto& map = cursors(tier);
    auto it = map.find(source_id);
    if (it == map.end()) return std::nullopt;
    return it->second;
}

bool CompositeCursor::is_empty() const {
    return total_jokes_loaded_ == 0 && sub_source_cursors_.empty() && priority_source_cursors_.empty();
}

std::string CompositeCursor::encode() const {
    // nlohmann objects are key-sorted, so the output is deterministic.
    json j = {
        {kTotalJokesLoadedKey, total_jokes_loaded_},
        {kSubSourceCursorsKey, encode_map(sub_source_cursors_)},
        {kPrioritySourceCursorsKey, encode_map(priority_source_cursors_)}
    };
    return j.dump();
}

CompositeCursor CompositeCursor::decode(const std::optional<std::string>& raw) {
    if (!raw || raw->empty()) return {};

    auto j = json::parse(*raw, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("CURSOR: Discarding unparseable composite cursor ({} bytes)", raw->size());
        return {};
    }

    try {
        int64_t total = 0;
        if (j.contains(kTotalJokesLoadedKey) && !j[kTotalJokesLoadedKey].is_null()) {
            const auto& t = j[kTotalJokesLoadedKey];
            if (!t.is_number()) throw std::invalid_argument("totalJokesLoaded is not a number");
            if (t.is_number_float()) {
                const double d = t.get<double>();
                if (!std::isfinite(d) || d < 0.0 || d >= 9.2e18) {
                    throw std::invalid_argument("totalJokesLoaded out of range");
                }
                total = static_cast<int64_t>(d);
            } else {
                total = t.get<int64_t>();
            }
            if (total < 0) throw std::invalid_argument("negative totalJokesLoaded");
        }
        auto sub = decode_map(j.value(kSubSourceCursorsKey, json(nullptr)));
        auto priority = decode_map(j.value(kPrioritySourceCursorsKey, json(nullptr)));
        return CompositeCursor(total, std::move(sub), std::move(priority));
    } catch (const std::exception& e) {
        spdlog::warn("CURSOR: Discarding malformed composite cursor: {}", e.what());
        return {};
    }
}

CompositeCursor CompositeCursor::with_sub_source_cursor(const std::string& source_id, const std::string& token) const {
    return with_cursor(source_id, token, SourceTier::Ordinary);
}

CompositeCursor CompositeCursor::with_priority_cursor(const std::string& source_id, const std::string& token) const {
    return with_cursor(source_id, token, SourceTier::Priority);
}

CompositeCursor CompositeCursor::with_cursor(const std::string& source_id, const std::string& token, SourceTier tier) const {
    CompositeCursor next = *this;
    next.mutable_cursors(tier).insert_or_assign(source_id, SourceCursor::active(token));
    return next;
}

CompositeCursor CompositeCursor::mark_done(const std::string& source_id, bool priority) const {
    CompositeCursor next = *this;
    auto tier = priority ? SourceTier::Priority : SourceTier::Ordinary;
    next.mutable_cursors(tier).insert_or_assign(source_id, SourceCursor::exhausted());
    return next;
}

CompositeCursor CompositeCursor::clear_source(const std::string& source_id, bool priority) const {
    CompositeCursor next = *this;
    next.mutable_cursors(priority ? SourceTier::Priority : SourceTier::Ordinary).erase(source_id);
    return next;
}

CompositeCursor CompositeCursor::with_items_loaded(int64_t count) const {
    CompositeCursor next = *this;
    if (count > 0) next.total_jokes_loaded_ += count;
    return next;
}

bool CompositeCursor::operator==(const CompositeCursor& other) const {
    return total_jokes_loaded_ == other.total_jokes_loaded_ &&
           sub_source_cursors_ == other.sub_source_cursors_ &&
           priority_source_cursors_ == other.priority_source_cursors_;
}

} // namespace feed_sync
