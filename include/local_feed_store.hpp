#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "feed_types.hpp"
#include "subscription.hpp"

struct sqlite3;

namespace feed_sync {

/**
 * Durable, append-ordered cache of feed items (SQLite).
 *
 * Every item that enters the feed receives the next feed_index, starting
 * at 0; the index never changes afterwards. All writes go through one
 * connection guarded by a mutex, which makes index assignment the single
 * writer path. Head watchers are notified after commit only.
 */
class LocalFeedStore {
public:
    using HeadObserver = std::function<void(const std::vector<LocalFeedRecord>&)>;

    explicit LocalFeedStore(std::string db_path);
    ~LocalFeedStore();

    LocalFeedStore(const LocalFeedStore&) = delete;
    LocalFeedStore& operator=(const LocalFeedStore&) = delete;

    // Opens the database and applies the schema. Safe to call twice.
    void open();
    bool is_open() const;
    const std::string& path() const { return db_path_; }

    // Returns how many items received a new feed_index. All or nothing:
    // throws StoreWriteError after rolling the whole batch back.
    int upsert_many(const std::vector<FeedItem>& items);

    // Items that hold a feed_index.
    int64_t count() const;

    std::vector<LocalFeedRecord> head(int limit) const;

    // Observer fires right away with the current window, then after each commit.
    ScopedSubscription watch_head(int limit, HeadObserver observer);

    std::optional<LocalFeedRecord> get(const std::string& item_id) const;

    // Drops every row, feed and interactions alike.
    void clear();

    // --- Interactions ---
    void set_viewed(const std::string& item_id);
    void set_saved(const std::string& item_id);
    void set_unsaved(const std::string& item_id);
    void set_shared(const std::string& item_id);

    int64_t count_viewed() const;
    int64_t count_saved() const;
    int64_t count_shared() const;
    std::vector<LocalFeedRecord> saved_items() const;

private:
    struct Watcher {
        int limit;
        HeadObserver observer;
    };
    struct WatcherSet {
        std::mutex mtx;
        uint64_t next_id = 1;
        std::map<uint64_t, Watcher> watchers;
    };

    void require_open() const;
    void touch_interaction(const std::string& item_id, const char* column, bool clear_value);
    int64_t count_where(const char* sql) const;
    std::vector<LocalFeedRecord> head_locked(int limit) const;
    void notify_watchers();

    std::string db_path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex db_mtx_;
    std::shared_ptr<WatcherSet> watchers_;
};

} // namespace feed_sync
