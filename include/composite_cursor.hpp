#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace feed_sync {

// Settings key holding the encoded composite cursor.
inline constexpr const char* kCompositeCursorKey = "composite_joke_cursor";

// Value older builds wrote into a string map to mark a drained source.
// Only read, never written.
inline constexpr const char* kLegacyDoneSentinel = "__DONE__";

enum class SourceTier { Priority, Ordinary };

const char* to_string(SourceTier tier);

// Per-source progress: either a resume token or "drained".
class SourceCursor {
public:
    static SourceCursor active(std::string token);
    static SourceCursor exhausted();

    bool is_exhausted() const { return std::holds_alternative<Exhausted>(state_); }

    // nullptr when exhausted
    const std::string* token() const;

    bool operator==(const SourceCursor& other) const { return state_ == other.state_; }
    bool operator!=(const SourceCursor& other) const { return !(*this == other); }

private:
    struct Active {
        std::string token;
        bool operator==(const Active& o) const { return token == o.token; }
    };
    struct Exhausted {
        bool operator==(const Exhausted&) const { return true; }
    };

    explicit SourceCursor(std::variant<Active, Exhausted> state) : state_(std::move(state)) {}

    std::variant<Active, Exhausted> state_;
};

/**
 * Durable synchronization checkpoint across every registered source.
 *
 * Immutable: every mutator returns an updated copy. A source without an
 * entry starts from its first page.
 */
class CompositeCursor {
public:
    using CursorMap = std::map<std::string, SourceCursor>;

    CompositeCursor() = default;
    CompositeCursor(int64_t total_jokes_loaded, CursorMap sub_source_cursors, CursorMap priority_source_cursors);

    int64_t total_jokes_loaded() const { return total_jokes_loaded_; }
    const CursorMap& sub_source_cursors() const { return sub_source_cursors_; }
    const CursorMap& priority_source_cursors() const { return priority_source_cursors_; }
    const CursorMap& cursors(SourceTier tier) const;

    std::optional<SourceCursor> find(const std::string& source_id, SourceTier tier) const;

    // No progress recorded at all.
    bool is_empty() const;

    std::string encode() const;

    // Missing or corrupt input yields a default cursor; never throws.
    static CompositeCursor decode(const std::optional<std::string>& raw);

    CompositeCursor with_sub_source_cursor(const std::string& source_id, const std::string& token) const;
    CompositeCursor with_priority_cursor(const std::string& source_id, const std::string& token) const;
    CompositeCursor with_cursor(const std::string& source_id, const std::string& token, SourceTier tier) const;
    CompositeCursor mark_done(const std::string& source_id, bool priority) const;
    CompositeCursor clear_source(const std::string& source_id, bool priority) const;
    CompositeCursor with_items_loaded(int64_t count) const;

    bool operator==(const CompositeCursor& other) const;
    bool operator!=(const CompositeCursor& other) const { return !(*this == other); }

private:
    CursorMap& mutable_cursors(SourceTier tier);

    int64_t total_jokes_loaded_ = 0;
    CursorMap sub_source_cursors_;
    CursorMap priority_source_cursors_;
};

} // namespace feed_sync
