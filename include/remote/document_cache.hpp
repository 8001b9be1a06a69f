#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "feed_types.hpp"
#include "source_registry.hpp"
#include "subscription.hpp"

namespace feed_sync {

struct CachedDocument {
    std::string collection;
    std::string id;
    nlohmann::json fields = nlohmann::json::object(); // plain JSON, not typed wire values
};

enum class LoadBundleTaskState { Running, Success, Error };

const char* to_string(LoadBundleTaskState state);

struct LoadBundleTaskProgress {
    int documents_loaded = 0;
    int total_documents = 0;
    int64_t bytes_loaded = 0;
    int64_t total_bytes = 0;
    LoadBundleTaskState state = LoadBundleTaskState::Running;
    std::string error;

    bool is_terminal() const { return state != LoadBundleTaskState::Running; }
};

/**
 * Progress stream of one bundle ingestion. New subscribers get the latest
 * progress replayed, so a late subscriber still sees the terminal state.
 */
class LoadBundleTask : public std::enable_shared_from_this<LoadBundleTask> {
public:
    using ProgressObserver = std::function<void(const LoadBundleTaskProgress&)>;

    LoadBundleTask() = default;
    ~LoadBundleTask();

    LoadBundleTask(const LoadBundleTask&) = delete;
    LoadBundleTask& operator=(const LoadBundleTask&) = delete;

    // Unsubscribing after the task is gone is a no-op.
    ScopedSubscription subscribe(ProgressObserver observer);

    LoadBundleTaskProgress latest() const;
    LoadBundleTaskProgress wait() const;
    // nullopt on timeout
    std::optional<LoadBundleTaskProgress> wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class DocumentCache;

    void publish(const LoadBundleTaskProgress& progress);

    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    LoadBundleTaskProgress latest_;
    uint64_t next_observer_id_ = 1;
    std::map<uint64_t, ProgressObserver> observers_;
    std::future<void> worker_; // declared last: joined before the rest is torn down
};

/**
 * Local read cache of the remote document store.
 *
 * Filled by network reads and by bundle snapshots; serves ordered pages
 * when the network is unavailable. Must outlive any LoadBundleTask it
 * returned.
 */
class DocumentCache {
public:
    void put(CachedDocument doc);
    void put_items(const std::string& collection, const std::vector<FeedItem>& items);

    std::optional<CachedDocument> get(const std::string& collection, const std::string& id) const;
    size_t size() const;
    size_t size(const std::string& collection) const;
    bool has_collection(const std::string& collection) const { return size(collection) > 0; }

    // Pages ordered by (fields[order_by], id), honouring source.descending.
    FeedPage query_page(const SourceDescriptor& source, const std::optional<PageCursor>& after, int limit) const;

    // Parses a length-prefixed bundle on a worker thread. Documents are
    // applied all at once after the whole bundle parsed.
    std::shared_ptr<LoadBundleTask> load_bundle(std::string bytes);

    // Synchronous parse, exposed for tooling and tests. Throws BundleFormatError.
    static std::vector<CachedDocument> parse_bundle(const std::string& bytes,
                                                    const std::function<void(const LoadBundleTaskProgress&)>& on_progress = nullptr);

    // Firestore-style typed value ({"integerValue": "3"}) to plain JSON.
    static nlohmann::json decode_value(const nlohmann::json& typed);

private:
    void apply(std::vector<CachedDocument> docs);

    mutable std::shared_mutex mtx_;
    std::map<std::string, std::map<std::string, CachedDocument>> collections_;
};

} // namespace feed_sync
