#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "composite_cursor.hpp"
#include "local_feed_store.hpp"
#include "settings_store.hpp"
#include "source_registry.hpp"
#include "remote/remote_feed_source.hpp"

namespace feed_sync {

enum class SyncState {
    Idle,
    LoadingCursor,
    ColdStart,
    FetchingPriority,
    FetchingOrdinary,
    Merging,
    Persisting,
    Failed
};

enum class SyncOutcome { Completed, Skipped, Failed };

const char* to_string(SyncState state);
const char* to_string(SyncOutcome outcome);

struct SyncReport {
    SyncOutcome outcome = SyncOutcome::Completed;
    std::string failed_source; // source id, "store" or "settings"
    std::string error;
    int new_items = 0;
    int pages_fetched = 0;
    bool cold_start = false;
    int64_t total_jokes_loaded = 0;

    bool ok() const { return outcome == SyncOutcome::Completed; }
};

struct SyncOptions {
    int page_size = 20;
    int min_ready_items = 50;
    std::chrono::milliseconds bootstrap_timeout{10000};
    int max_passes_per_trigger = 20;
    std::chrono::seconds poll_interval{0};
};

/**
 * Pulls pages from every registered source into the LocalFeedStore and
 * keeps the CompositeCursor in the settings store.
 *
 * A pass fetches everything first, merges in one batch, then persists the
 * cursor once. When anything fails the durable cursor is left untouched,
 * so the next pass replays the same pages. No public method throws.
 */
class FeedSyncService {
public:
    FeedSyncService(std::shared_ptr<IRemoteFeedSource> remote,
                    std::shared_ptr<LocalFeedStore> store,
                    std::shared_ptr<ISettingsStore> settings,
                    SourceRegistry registry,
                    SyncOptions options = {});
    ~FeedSyncService();

    FeedSyncService(const FeedSyncService&) = delete;
    FeedSyncService& operator=(const FeedSyncService&) = delete;

    // One synchronous pass. Returns Skipped if another pass is in flight.
    SyncReport run_sync_pass();

    // Starts a background drain and waits (bounded) for min_ready_items.
    // With force == false nothing happens while the store holds items.
    // True when a drain was started.
    bool trigger_sync(bool force);

    // Startup entry point.
    bool bootstrap();

    // Forgets all sync progress. A pass already in flight commits nothing.
    void reset();

    CompositeCursor current_cursor() const;
    SyncState state() const { return state_.load(); }
    bool is_syncing() const { return in_flight_.load() || draining_.load(); }

    // Blocks until the current background drain (if any) finished.
    void wait_for_drain();

    // Runs a pass every poll_interval until stopped. False when polling is off.
    bool start_polling();
    void stop_polling();
    bool is_polling() const { return polling_.load(); }

    const SourceRegistry& registry() const { return registry_; }
    const SyncOptions& options() const { return options_; }

private:
    // Fetches one page of src and advances cursor. False when the source was
    // skipped (exhausted, outside its window, or no room before a boundary).
    bool fetch_source(const SourceDescriptor& src, CompositeCursor& cursor, FeedPage& page);

    CompositeCursor load_cursor() const;
    bool wait_for_window(int min_items, std::chrono::milliseconds timeout);
    void drain();
    void poll_loop();
    void record(const SyncReport& report, double duration_ms);

    std::shared_ptr<IRemoteFeedSource> remote_;
    std::shared_ptr<LocalFeedStore> store_;
    std::shared_ptr<ISettingsStore> settings_;
    SourceRegistry registry_;
    SyncOptions options_;

    std::atomic<SyncState> state_{SyncState::Idle};
    std::atomic<bool> in_flight_{false};
    std::atomic<bool> draining_{false};
    std::atomic<bool> shutting_down_{false};

    std::mutex commit_mtx_;
    uint64_t reset_generation_ = 0; // guarded by commit_mtx_

    std::mutex drain_mtx_;
    std::thread drain_thread_;

    std::atomic<bool> polling_{false};
    std::mutex poll_mtx_;
    std::condition_variable poll_cv_;
    bool poll_stop_ = false;
    std::thread poll_thread_;
};

} // namespace feed_sync
