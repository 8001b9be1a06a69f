#include "feed_sync_service.hpp"
#include "LogManager.hpp"
#include "errors.hpp"
#include <algorithm>
#include <vector>
#include <spdlog/spdlog.h>

namespace feed_sync {

const char* to_string(SyncState state) {
    switch (state) {
        case SyncState::Idle: return "idle";
        case SyncState::LoadingCursor: return "loading_cursor";
        case SyncState::ColdStart: return "cold_start";
        case SyncState::FetchingPriority: return "fetching_priority";
        case SyncState::FetchingOrdinary: return "fetching_ordinary";
        case SyncState::Merging: return "merging";
        case SyncState::Persisting: return "persisting";
        case SyncState::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(SyncOutcome outcome) {
    switch (outcome) {
        case SyncOutcome::Completed: return "completed";
        case SyncOutcome::Skipped: return "skipped";
        case SyncOutcome::Failed: return "failed";
    }
    return "unknown";
}

// --- UTILITIES ---

namespace {

// Round-robin merge: a1, b1, c1, a2, b2, ...
std::vector<FeedItem> interleave(const std::vector<std::vector<FeedItem>>& pages) {
    std::vector<FeedItem> out;
    size_t longest = 0;
    for (const auto& p : pages) longest = std::max(longest, p.size());
    for (size_t i = 0; i < longest; ++i) {
        for (const auto& p : pages) {
            if (i < p.size()) out.push_back(p[i]);
        }
    }
    return out;
}

long long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

FeedSyncService::FeedSyncService(std::shared_ptr<IRemoteFeedSource> remote,
                                 std::shared_ptr<LocalFeedStore> store,
                                 std::shared_ptr<ISettingsStore> settings,
                                 SourceRegistry registry,
                                 SyncOptions options)
    : remote_(std::move(remote)),
      store_(std::move(store)),
      settings_(std::move(settings)),
      registry_(std::move(registry)),
      options_(options) {
    if (options_.page_size <= 0) options_.page_size = 20;
    if (options_.max_passes_per_trigger <= 0) options_.max_passes_per_trigger = 1;
}

FeedSyncService::~FeedSyncService() {
    shutting_down_ = true;
    stop_polling();
    std::lock_guard<std::mutex> lock(drain_mtx_);
    if (drain_thread_.joinable()) drain_thread_.join();
}

CompositeCursor FeedSyncService::load_cursor() const {
    return CompositeCursor::decode(settings_->get(kCompositeCursorKey));
}

CompositeCursor FeedSyncService::current_cursor() const {
    try {
        return load_cursor();
    } catch (const std::exception& e) {
        spdlog::error("FEED_SYNC: Could not read cursor: {}", e.what());
        return CompositeCursor();
    }
}

// --- SYNC PASS ---

bool FeedSyncService::fetch_source(const SourceDescriptor& src, CompositeCursor& cursor, FeedPage& page) {
    auto existing = cursor.find(src.id, src.tier);
    if (existing && existing->is_exhausted()) return false;
    if (!src.is_in_window(cursor.total_jokes_loaded())) return false;

    int limit = registry_.effective_limit(cursor.total_jokes_loaded(), options_.page_size);
    if (limit <= 0) return false;

    std::optional<PageCursor> after;
    if (existing && existing->token()) {
        after = PageCursor::deserialize(*existing->token());
        if (!after) spdlog::warn("FEED_SYNC: Unreadable token for {}, restarting source", src.id);
    }

    page = remote_->fetch_page(src, after, limit);

    const bool priority = src.tier == SourceTier::Priority;
    if (!page.has_more) {
        cursor = cursor.mark_done(src.id, priority);
    } else if (page.next_cursor) {
        cursor = cursor.with_cursor(src.id, page.next_cursor->serialize(), src.tier);
    } else {
        spdlog::warn("FEED_SYNC: {} reported more pages without a cursor; keeping previous token", src.id);
    }
    return true;
}

SyncReport FeedSyncService::run_sync_pass() {
    SyncReport report;
    if (in_flight_.exchange(true)) {
        spdlog::debug("FEED_SYNC: Skipping pass; another pass is in flight");
        report.outcome = SyncOutcome::Skipped;
        record(report, 0.0);
        return report;
    }

    auto start = std::chrono::steady_clock::now();
    std::string stage = "settings";

    try {
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(commit_mtx_);
            generation = reset_generation_;
        }

        state_ = SyncState::LoadingCursor;
        CompositeCursor cursor = load_cursor();

        stage = "store";
        if (store_->count() == 0 && !cursor.is_empty()) {
            state_ = SyncState::ColdStart;
            spdlog::info("FEED_SYNC: Cold start, local feed is empty but cursor holds progress; starting over");
            cursor = CompositeCursor();
            report.cold_start = true;
        }

        // Priority sources block ordinary growth until they are drained.
        state_ = SyncState::FetchingPriority;
        std::vector<FeedItem> batch;
        bool priority_pending = false;
        for (const auto& src : registry_.priority_sources()) {
            stage = src.id;
            FeedPage page;
            if (!fetch_source(src, cursor, page)) continue;
            report.pages_fetched++;
            if (page.has_more) priority_pending = true;
            batch.insert(batch.end(), page.items.begin(), page.items.end());
        }

        if (!priority_pending) {
            state_ = SyncState::FetchingOrdinary;
            std::vector<std::vector<FeedItem>> pages;
            for (const auto& src : registry_.ordinary_sources()) {
                stage = src.id;
                FeedPage page;
                if (!fetch_source(src, cursor, page)) continue;
                report.pages_fetched++;
                pages.push_back(std::move(page.items));
            }
            auto ordinary = interleave(pages);
            batch.insert(batch.end(), ordinary.begin(), ordinary.end());
        } else {
            spdlog::debug("FEED_SYNC: Priority sources still pending; ordinary sources wait");
        }

        // Merge and persist are one unit with respect to reset().
        std::lock_guard<std::mutex> commit_lock(commit_mtx_);
        if (generation != reset_generation_) {
            state_ = SyncState::Idle;
            spdlog::info("FEED_SYNC: Cursor was reset during the pass; dropping {} fetched items", batch.size());
        } else {
            state_ = SyncState::Merging;
            stage = "store";
            int added = batch.empty() ? 0 : store_->upsert_many(batch);
            cursor = cursor.with_items_loaded(added);

            state_ = SyncState::Persisting;
            stage = "settings";
            settings_->set(kCompositeCursorKey, cursor.encode());

            report.new_items = added;
            report.total_jokes_loaded = cursor.total_jokes_loaded();
            state_ = SyncState::Idle;
            spdlog::info("FEED_SYNC: Pass completed: {} pages, {} new items, total {}",
                         report.pages_fetched, added, cursor.total_jokes_loaded());
        }
    } catch (const std::exception& e) {
        state_ = SyncState::Failed;
        report.outcome = SyncOutcome::Failed;
        report.failed_source = stage;
        report.error = e.what();
        report.new_items = 0;
        spdlog::error("❌ FEED_SYNC: Pass failed at {}: {}", stage, e.what());
    }

    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    record(report, duration);
    in_flight_ = false;
    return report;
}

void FeedSyncService::record(const SyncReport& report, double duration_ms) {
    LogManager::instance().add_log({
        now_ms(),
        to_string(report.outcome),
        report.failed_source,
        report.new_items,
        report.pages_fetched,
        report.cold_start,
        static_cast<long long>(report.total_jokes_loaded),
        duration_ms
    });
}

// --- TRIGGERS ---

void FeedSyncService::drain() {
    for (int pass = 0; pass < options_.max_passes_per_trigger && !shutting_down_; ++pass) {
        auto report = run_sync_pass();
        if (report.outcome != SyncOutcome::Completed) break;
        if (report.pages_fetched == 0 || report.new_items == 0) break;
    }
    spdlog::info("FEED_SYNC: Background sync completed");
}

bool FeedSyncService::wait_for_window(int min_items, std::chrono::milliseconds timeout) {
    if (min_items <= 0) return true;

    struct WaitState {
        std::mutex mtx;
        std::condition_variable cv;
        bool ready = false;
    };
    auto ws = std::make_shared<WaitState>();

    // Observers can still fire after unsubscribe, so they only touch ws.
    auto subscription = store_->watch_head(std::max(100, min_items), [ws, min_items](const std::vector<LocalFeedRecord>& window) {
        if (static_cast<int>(window.size()) < min_items) return;
        std::lock_guard<std::mutex> lock(ws->mtx);
        ws->ready = true;
        ws->cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(ws->mtx);
    bool ready = ws->cv.wait_for(lock, timeout, [&] { return ws->ready; });
    if (ready) spdlog::info("FEED_SYNC: Reached threshold of {} items", min_items);
    else spdlog::warn("FEED_SYNC: Timed out waiting for {} items", min_items);
    return ready;
}

bool FeedSyncService::trigger_sync(bool force) {
    if (draining_.exchange(true)) {
        spdlog::debug("FEED_SYNC: Skipping; sync already in progress");
        return false;
    }

    int64_t existing = 0;
    try {
        existing = store_->count();
    } catch (const std::exception& e) {
        spdlog::error("FEED_SYNC: Could not count local feed: {}", e.what());
        draining_ = false;
        return false;
    }

    if (!force && existing > 0) {
        spdlog::debug("FEED_SYNC: Skipping non-forced sync; store has {} items", existing);
        draining_ = false;
        return false;
    }

    spdlog::info("FEED_SYNC: Starting sync (force={}, initial_count={})", force, existing);
    {
        std::lock_guard<std::mutex> lock(drain_mtx_);
        if (drain_thread_.joinable()) drain_thread_.join();
        drain_thread_ = std::thread([this]() {
            drain();
            draining_ = false;
        });
    }

    wait_for_window(options_.min_ready_items, options_.bootstrap_timeout);
    return true;
}

bool FeedSyncService::bootstrap() {
    int64_t existing = 0;
    try {
        existing = store_->count();
    } catch (const std::exception& e) {
        spdlog::error("FEED_SYNC: Bootstrap could not count local feed: {}", e.what());
        return false;
    }

    if (existing == 0 || existing < options_.min_ready_items) return trigger_sync(true);

    spdlog::info("FEED_SYNC: Bootstrap found {} items, no blocking sync needed", existing);
    return true;
}

void FeedSyncService::reset() {
    std::lock_guard<std::mutex> lock(commit_mtx_);
    ++reset_generation_;
    try {
        settings_->remove(kCompositeCursorKey);
        spdlog::info("FEED_SYNC: Cursor reset");
    } catch (const std::exception& e) {
        spdlog::error("FEED_SYNC: Cursor reset failed: {}", e.what());
    }
}

void FeedSyncService::wait_for_drain() {
    std::lock_guard<std::mutex> lock(drain_mtx_);
    if (drain_thread_.joinable()) drain_thread_.join();
}

// --- POLLING ---

bool FeedSyncService::start_polling() {
    if (options_.poll_interval.count() <= 0) return false;
    if (polling_.exchange(true)) return true;

    {
        std::lock_guard<std::mutex> lock(poll_mtx_);
        poll_stop_ = false;
    }
    poll_thread_ = std::thread(&FeedSyncService::poll_loop, this);
    spdlog::info("⏱️ FEED_SYNC: Polling every {}s", options_.poll_interval.count());
    return true;
}

void FeedSyncService::stop_polling() {
    if (!polling_.load()) return;
    {
        std::lock_guard<std::mutex> lock(poll_mtx_);
        poll_stop_ = true;
    }
    poll_cv_.notify_all();
    if (poll_thread_.joinable()) poll_thread_.join();
    polling_ = false;
}

void FeedSyncService::poll_loop() {
    std::unique_lock<std::mutex> lock(poll_mtx_);
    while (!poll_stop_) {
        if (poll_cv_.wait_for(lock, options_.poll_interval, [this] { return poll_stop_; })) break;
        lock.unlock();
        run_sync_pass();
        lock.lock();
    }
}

} // namespace feed_sync
