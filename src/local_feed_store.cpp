#include "local_feed_store.hpp"
#include "errors.hpp"
#include <chrono>
#include <unordered_set>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace feed_sync {

using json = nlohmann::json;

namespace {

constexpr const char* kSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS feed_items (
        item_id     TEXT PRIMARY KEY NOT NULL,
        feed_index  INTEGER UNIQUE,
        payload     TEXT NOT NULL DEFAULT '{}',
        viewed_at   INTEGER,
        saved_at    INTEGER,
        shared_at   INTEGER,
        updated_at  INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_updated_at ON feed_items(updated_at);
)";

constexpr const char* kRecordColumns =
    "item_id, feed_index, payload, viewed_at, saved_at, shared_at, updated_at";

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw FeedSyncError("sqlite: " + msg);
    }
}

// Prepared statement, finalized on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw FeedSyncError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, const std::string& v) { sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT); }
    void bind(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }

    // true while rows are available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw FeedSyncError(std::string("sqlite step: ") + sqlite3_errmsg(db_));
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    int64_t int64_at(int col) const { return sqlite3_column_int64(stmt_, col); }
    std::optional<int64_t> opt_int64_at(int col) const {
        if (is_null(col)) return std::nullopt;
        return int64_at(col);
    }
    std::string text_at(int col) const {
        auto* raw = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return raw ? std::string(raw) : std::string();
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

LocalFeedRecord read_record(const Statement& s) {
    LocalFeedRecord r;
    r.item_id = s.text_at(0);
    r.feed_index = s.is_null(1) ? -1 : s.int64_at(1);
    auto payload = json::parse(s.text_at(2), nullptr, false);
    r.payload = payload.is_discarded() ? json::object() : payload;
    r.viewed_at = s.opt_int64_at(3);
    r.saved_at = s.opt_int64_at(4);
    r.shared_at = s.opt_int64_at(5);
    r.updated_at = s.int64_at(6);
    return r;
}

} // namespace

LocalFeedStore::LocalFeedStore(std::string db_path)
    : db_path_(std::move(db_path)), watchers_(std::make_shared<WatcherSet>()) {}

LocalFeedStore::~LocalFeedStore() {
    std::lock_guard<std::mutex> lock(db_mtx_);
    if (db_) sqlite3_close(db_);
}

void LocalFeedStore::open() {
    std::lock_guard<std::mutex> lock(db_mtx_);
    if (db_) return;

    sqlite3* db = nullptr;
    if (sqlite3_open(db_path_.c_str(), &db) != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw FeedSyncError("cannot open feed database " + db_path_ + ": " + msg);
    }
    sqlite3_busy_timeout(db, 2000);

    try {
        exec(db, "PRAGMA journal_mode=WAL;");
        exec(db, kSchemaSql);
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
    db_ = db;
    spdlog::info("FEED_STORE: Opened {}", db_path_);
}

bool LocalFeedStore::is_open() const {
    std::lock_guard<std::mutex> lock(db_mtx_);
    return db_ != nullptr;
}

void LocalFeedStore::require_open() const {
    if (!db_) throw FeedSyncError("feed store is not open");
}

int LocalFeedStore::upsert_many(const std::vector<FeedItem>& items) {
    if (items.empty()) return 0;

    int inserted = 0;
    {
        std::lock_guard<std::mutex> lock(db_mtx_);
        require_open();

        try {
            exec(db_, "BEGIN IMMEDIATE;");
        } catch (const FeedSyncError& e) {
            throw StoreWriteError(e.what());
        }

        try {
            int64_t next_index = 0;
            {
                Statement max_stmt(db_, "SELECT COALESCE(MAX(feed_index), -1) + 1 FROM feed_items");
                if (max_stmt.step()) next_index = max_stmt.int64_at(0);
            }

            Statement lookup(db_, "SELECT feed_index FROM feed_items WHERE item_id = ?1");
            Statement insert(db_,
                "INSERT INTO feed_items (item_id, feed_index, payload, updated_at) VALUES (?1, ?2, ?3, ?4)");
            Statement assign(db_,
                "UPDATE feed_items SET feed_index = ?2, payload = ?3, updated_at = ?4 WHERE item_id = ?1");
            Statement refresh(db_,
                "UPDATE feed_items SET payload = ?2, updated_at = ?3 WHERE item_id = ?1");

            const int64_t now = now_ms();
            for (const auto& item : items) {
                const std::string payload = item.payload.dump();

                lookup.reset();
                lookup.bind(1, item.id);
                bool exists = lookup.step();
                bool indexed = exists && !lookup.is_null(0);
                lookup.reset();

                if (indexed) {
                    refresh.reset();
                    refresh.bind(1, item.id);
                    refresh.bind(2, payload);
                    refresh.bind(3, now);
                    refresh.step();
                    continue;
                }

                // Absent, or only known through interactions so far.
                Statement& stmt = exists ? assign : insert;
                stmt.reset();
                stmt.bind(1, item.id);
                stmt.bind(2, next_index);
                stmt.bind(3, payload);
                stmt.bind(4, now);
                stmt.step();
                ++next_index;
                ++inserted;
            }

            exec(db_, "COMMIT;");
        } catch (const std::exception& e) {
            char* err = nullptr;
            if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
                spdlog::error("FEED_STORE: Rollback failed: {}", err ? err : "unknown");
                sqlite3_free(err);
            }
            spdlog::error("FEED_STORE: Batch of {} items rolled back: {}", items.size(), e.what());
            throw StoreWriteError(e.what());
        }
    }

    spdlog::debug("FEED_STORE: Upserted {} items ({} new)", items.size(), inserted);
    notify_watchers();
    return inserted;
}

int64_t LocalFeedStore::count_where(const char* sql) const {
    std::lock_guard<std::mutex> lock(db_mtx_);
    require_open();
    Statement stmt(db_, sql);
    return stmt.step() ? stmt.int64_at(0) : 0;
}

int64_t LocalFeedStore::count() const {
    return count_where("SELECT COUNT(*) FROM feed_items WHERE feed_index IS NOT NULL");
}

std::vector<LocalFeedRecord> LocalFeedStore::head_locked(int limit) const {
    require_open();
    std::vector<LocalFeedRecord> out;
    if (limit <= 0) return out;

    Statement stmt(db_, std::string("SELECT ") + kRecordColumns +
                        " FROM feed_items WHERE feed_index IS NOT NULL ORDER BY feed_index DESC LIMIT ?1");
    stmt.bind(1, static_cast<int64_t>(limit));
    while (stmt.step()) out.push_back(read_record(stmt));
    return out;
}

std::vector<LocalFeedRecord> LocalFeedStore::head(int limit) const {
    std::lock_guard<std::mutex> lock(db_mtx_);
    return head_locked(limit);
}

ScopedSubscription LocalFeedStore::watch_head(int limit, HeadObserver observer) {
    if (!observer) return ScopedSubscription();

    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(watchers_->mtx);
        id = watchers_->next_id++;
        watchers_->watchers[id] = Watcher{limit, observer};
    }

    observer(head(limit));

    std::weak_ptr<WatcherSet> weak = watchers_;
    return ScopedSubscription([weak, id]() {
        if (auto set = weak.lock()) {
            std::lock_guard<std::mutex> lock(set->mtx);
            set->watchers.erase(id);
        }
    });
}

void LocalFeedStore::notify_watchers() {
    std::vector<std::pair<uint64_t, Watcher>> snapshot;
    {
        std::lock_guard<std::mutex> lock(watchers_->mtx);
        snapshot.assign(watchers_->watchers.begin(), watchers_->watchers.end());
    }

    for (const auto& [id, watcher] : snapshot) {
        {
            // Skip watchers that unsubscribed since the snapshot.
            std::lock_guard<std::mutex> lock(watchers_->mtx);
            if (!watchers_->watchers.count(id)) continue;
        }
        try {
            watcher.observer(head(watcher.limit));
        } catch (const std::exception& e) {
            spdlog::error("FEED_STORE: Head watcher #{} failed: {}", id, e.what());
        }
    }
}

std::optional<LocalFeedRecord> LocalFeedStore::get(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(db_mtx_);
    require_open();
    Statement stmt(db_, std::string("SELECT ") + kRecordColumns + " FROM feed_items WHERE item_id = ?1");
    stmt.bind(1, item_id);
    if (!stmt.step()) return std::nullopt;
    return read_record(stmt);
}

void LocalFeedStore::clear() {
    {
        std::lock_guard<std::mutex> lock(db_mtx_);
        require_open();
        try {
            exec(db_, "DELETE FROM feed_items;");
        } catch (const FeedSyncError& e) {
            throw StoreWriteError(e.what());
        }
    }
    spdlog::info("FEED_STORE: Cleared all rows");
    notify_watchers();
}

// --- INTERACTIONS ---

void LocalFeedStore::touch_interaction(const std::string& item_id, const char* column, bool clear_value) {
    {
        std::lock_guard<std::mutex> lock(db_mtx_);
        require_open();

        const int64_t now = now_ms();
        std::string sql = std::string("INSERT INTO feed_items (item_id, ") + column + ", updated_at) VALUES (?1, ?2, ?3) "
                          "ON CONFLICT(item_id) DO UPDATE SET " + column + " = excluded." + column +
                          ", updated_at = excluded.updated_at";
        try {
            Statement stmt(db_, sql);
            stmt.bind(1, item_id);
            if (!clear_value) stmt.bind(2, now); // unbound parameters are NULL
            stmt.bind(3, now);
            stmt.step();
        } catch (const FeedSyncError& e) {
            throw StoreWriteError(e.what());
        }
    }
    notify_watchers();
}

void LocalFeedStore::set_viewed(const std::string& item_id) { touch_interaction(item_id, "viewed_at", false); }
void LocalFeedStore::set_saved(const std::string& item_id) { touch_interaction(item_id, "saved_at", false); }
void LocalFeedStore::set_unsaved(const std::string& item_id) { touch_interaction(item_id, "saved_at", true); }
void LocalFeedStore::set_shared(const std::string& item_id) { touch_interaction(item_id, "shared_at", false); }

int64_t LocalFeedStore::count_viewed() const {
    return count_where("SELECT COUNT(*) FROM feed_items WHERE viewed_at IS NOT NULL");
}

int64_t LocalFeedStore::count_saved() const {
    return count_where("SELECT COUNT(*) FROM feed_items WHERE saved_at IS NOT NULL");
}

int64_t LocalFeedStore::count_shared() const {
    return count_where("SELECT COUNT(*) FROM feed_items WHERE shared_at IS NOT NULL");
}

std::vector<LocalFeedRecord> LocalFeedStore::saved_items() const {
    std::lock_guard<std::mutex> lock(db_mtx_);
    require_open();
    std::vector<LocalFeedRecord> out;
    Statement stmt(db_, std::string("SELECT ") + kRecordColumns +
                        " FROM feed_items WHERE saved_at IS NOT NULL ORDER BY saved_at DESC, item_id");
    while (stmt.step()) out.push_back(read_record(stmt));
    return out;
}

} // namespace feed_sync
