#include <gtest/gtest.h>
#include <sqlite3.h>
#include <condition_variable>
#include <future>
#include <memory>
#include <thread>
#include "LogManager.hpp"
#include "feed_sync_service.hpp"
#include "test_support.hpp"

using namespace feed_sync;
using namespace feed_sync::test_support;

class FeedSyncServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        remote = std::make_shared<FakeFeedSource>();
        settings = std::make_shared<InMemorySettingsStore>();
        db_path = dir.file("feed.db");
        store = std::make_shared<LocalFeedStore>(db_path);
        store->open();
        LogManager::instance().clear();
    }

    std::unique_ptr<FeedSyncService> make_service(SourceRegistry registry, SyncOptions options = {}) {
        return std::make_unique<FeedSyncService>(remote, store, settings, std::move(registry), options);
    }

    static SyncOptions small_pages(int page_size) {
        SyncOptions options;
        options.page_size = page_size;
        options.min_ready_items = 0;
        options.bootstrap_timeout = std::chrono::milliseconds(2000);
        return options;
    }

    std::string stored_cursor() const {
        return settings->get(kCompositeCursorKey).value_or("");
    }

    TempDir dir;
    std::string db_path;
    std::shared_ptr<FakeFeedSource> remote;
    std::shared_ptr<InMemorySettingsStore> settings;
    std::shared_ptr<LocalFeedStore> store;
};

TEST_F(FeedSyncServiceTest, PriorityItemsComeFirstThenOrdinaryInterleaved) {
    remote->set_items("prio", {"p0", "p1"});
    remote->set_items("a", {"a0", "a1", "a2"});
    remote->set_items("b", {"b0", "b1"});
    auto service = make_service(
        SourceRegistry({source("prio", SourceTier::Priority)},
                       {source("a", SourceTier::Ordinary), source("b", SourceTier::Ordinary)}),
        small_pages(5));

    auto report = service->run_sync_pass();
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.new_items, 7);
    EXPECT_EQ(report.pages_fetched, 3);

    EXPECT_EQ(store->get("p0")->feed_index, 0);
    EXPECT_EQ(store->get("p1")->feed_index, 1);
    EXPECT_EQ(store->get("a0")->feed_index, 2);
    EXPECT_EQ(store->get("b0")->feed_index, 3);
    EXPECT_EQ(store->get("a1")->feed_index, 4);
    EXPECT_EQ(store->get("b1")->feed_index, 5);
    EXPECT_EQ(store->get("a2")->feed_index, 6);

    auto cursor = service->current_cursor();
    EXPECT_EQ(cursor.total_jokes_loaded(), 7);
    EXPECT_TRUE(cursor.find("prio", SourceTier::Priority)->is_exhausted());
    EXPECT_TRUE(cursor.find("a", SourceTier::Ordinary)->is_exhausted());
    EXPECT_TRUE(cursor.find("b", SourceTier::Ordinary)->is_exhausted());
    EXPECT_EQ(service->state(), SyncState::Idle);
}

TEST_F(FeedSyncServiceTest, PendingPrioritySourceHoldsBackOrdinary) {
    remote->set_items("prio", make_ids("p", 7));
    remote->set_items("a", make_ids("a", 3));
    auto service = make_service(
        SourceRegistry({source("prio", SourceTier::Priority)}, {source("a", SourceTier::Ordinary)}),
        small_pages(5));

    auto first = service->run_sync_pass();
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.new_items, 5);
    EXPECT_EQ(remote->calls("a"), 0);
    EXPECT_FALSE(service->current_cursor().find("prio", SourceTier::Priority)->is_exhausted());

    auto second = service->run_sync_pass();
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.new_items, 5);
    EXPECT_EQ(remote->calls("a"), 1);
    EXPECT_EQ(store->count(), 10);

    // Every priority item precedes every ordinary item.
    for (const auto& id : make_ids("p", 7)) {
        EXPECT_LT(store->get(id)->feed_index, store->get("a_0")->feed_index) << id;
    }
}

TEST_F(FeedSyncServiceTest, ResumesEachSourceFromItsToken) {
    remote->set_items("a", make_ids("a", 6));
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), small_pages(4));

    service->run_sync_pass();
    service->run_sync_pass();

    auto log = remote->call_log();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_FALSE(log[0].cursor.has_value());
    ASSERT_TRUE(log[1].cursor.has_value());
    EXPECT_EQ(log[1].cursor->doc_id, "a_3");
    EXPECT_EQ(store->count(), 6);
}

TEST_F(FeedSyncServiceTest, ExhaustedSourceIsNotQueriedAgain) {
    remote->set_items("a", make_ids("a", 2));
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), small_pages(5));

    ASSERT_TRUE(service->run_sync_pass().ok());
    std::string after_first = stored_cursor();

    auto report = service->run_sync_pass();
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.pages_fetched, 0);
    EXPECT_EQ(remote->calls("a"), 1);
    EXPECT_EQ(stored_cursor(), after_first);
}

TEST_F(FeedSyncServiceTest, ColdStartDiscardsCursorAndRefetches) {
    // Persisted progress says feed_a is drained, but the local cache is empty.
    settings->set(kCompositeCursorKey,
                  R"({"totalJokesLoaded":10,"subSourceCursors":{"feed_a":"__DONE__"},"prioritySourceCursors":{}})");
    remote->set_items("feed_a", make_ids("joke", 3));
    auto service = make_service(SourceRegistry({}, {source("feed_a", SourceTier::Ordinary)}), small_pages(5));

    auto report = service->run_sync_pass();
    ASSERT_TRUE(report.ok());
    EXPECT_TRUE(report.cold_start);
    EXPECT_EQ(remote->calls("feed_a"), 1);
    EXPECT_FALSE(remote->call_log()[0].cursor.has_value());
    EXPECT_EQ(store->count(), 3);
    EXPECT_EQ(service->current_cursor().total_jokes_loaded(), 3);
}

TEST_F(FeedSyncServiceTest, NonEmptyStoreKeepsExhaustedState) {
    store->upsert_many({FeedItem{"old", {}, "x"}});
    settings->set(kCompositeCursorKey,
                  R"({"totalJokesLoaded":1,"subSourceCursors":{"feed_a":"__DONE__"},"prioritySourceCursors":{}})");
    remote->set_items("feed_a", make_ids("joke", 3));
    auto service = make_service(SourceRegistry({}, {source("feed_a", SourceTier::Ordinary)}), small_pages(5));

    auto report = service->run_sync_pass();
    ASSERT_TRUE(report.ok());
    EXPECT_FALSE(report.cold_start);
    EXPECT_EQ(remote->calls("feed_a"), 0);
}

TEST_F(FeedSyncServiceTest, FetchFailureLeavesCursorByteForByte) {
    remote->set_items("a", make_ids("a", 10));
    remote->set_items("b", make_ids("b", 10));
    auto service = make_service(
        SourceRegistry({}, {source("a", SourceTier::Ordinary), source("b", SourceTier::Ordinary)}),
        small_pages(3));

    ASSERT_TRUE(service->run_sync_pass().ok());
    std::string before = stored_cursor();
    int64_t count_before = store->count();

    remote->set_failing("b");
    auto failed = service->run_sync_pass();
    EXPECT_EQ(failed.outcome, SyncOutcome::Failed);
    EXPECT_EQ(failed.failed_source, "b");
    EXPECT_EQ(service->state(), SyncState::Failed);
    EXPECT_EQ(stored_cursor(), before);
    EXPECT_EQ(store->count(), count_before);

    remote->set_failing("b", false);
    auto recovered = service->run_sync_pass();
    ASSERT_TRUE(recovered.ok());
    EXPECT_EQ(recovered.new_items, 6);
    EXPECT_EQ(store->count(), count_before + 6);
}

TEST_F(FeedSyncServiceTest, StoreFailureRollsBackAndKeepsCursor) {
    remote->set_items("a", {"a0", "poison", "a2"});
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), small_pages(5));

    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(db_path.c_str(), &db), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(db,
        "CREATE TRIGGER reject_poison BEFORE INSERT ON feed_items "
        "WHEN NEW.item_id = 'poison' BEGIN SELECT RAISE(ABORT, 'poisoned item'); END;",
        nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);

    auto report = service->run_sync_pass();
    EXPECT_EQ(report.outcome, SyncOutcome::Failed);
    EXPECT_EQ(report.failed_source, "store");
    EXPECT_EQ(store->count(), 0);
    EXPECT_FALSE(settings->get(kCompositeCursorKey).has_value());
}

TEST_F(FeedSyncServiceTest, SettingsFailureKeepsCursorAndReplayIsIdempotent) {
    remote->set_items("a", make_ids("a", 4));
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), small_pages(2));

    settings->fail_writes = true;
    auto failed = service->run_sync_pass();
    EXPECT_EQ(failed.outcome, SyncOutcome::Failed);
    EXPECT_EQ(failed.failed_source, "settings");
    EXPECT_FALSE(settings->get(kCompositeCursorKey).has_value());
    EXPECT_EQ(store->count(), 2);

    settings->fail_writes = false;
    auto replay = service->run_sync_pass();
    ASSERT_TRUE(replay.ok());
    EXPECT_EQ(replay.new_items, 0);
    EXPECT_EQ(store->count(), 2);
    EXPECT_EQ(store->get("a_0")->feed_index, 0);
}

TEST_F(FeedSyncServiceTest, MorePagesWithoutCursorKeepsPreviousToken) {
    class NoCursorSource : public IRemoteFeedSource {
    public:
        FeedPage fetch_page(const SourceDescriptor&, const std::optional<PageCursor>&, int) override {
            FeedPage page;
            page.items.push_back(FeedItem{"n" + std::to_string(calls++), {}, "n"});
            page.has_more = true;
            return page;
        }
        int calls = 0;
    };

    settings->set(kCompositeCursorKey,
                  CompositeCursor().with_sub_source_cursor("n", PageCursor{1, "keep"}.serialize()).encode());
    store->upsert_many({FeedItem{"seed", {}, "x"}});
    FeedSyncService service(std::make_shared<NoCursorSource>(), store, settings,
                            SourceRegistry({}, {source("n", SourceTier::Ordinary)}), small_pages(5));

    ASSERT_TRUE(service.run_sync_pass().ok());
    auto entry = service.current_cursor().find("n", SourceTier::Ordinary);
    ASSERT_TRUE(entry.has_value());
    ASSERT_NE(entry->token(), nullptr);
    EXPECT_EQ(PageCursor::deserialize(*entry->token())->doc_id, "keep");
}

TEST_F(FeedSyncServiceTest, ActivationWindowGatesSources) {
    remote->set_items("early", make_ids("e", 3));
    remote->set_items("late", make_ids("l", 3));
    auto service = make_service(
        SourceRegistry({}, {source("early", SourceTier::Ordinary, std::nullopt, 3),
                            source("late", SourceTier::Ordinary, 3, std::nullopt)}),
        small_pages(10));

    auto first = service->run_sync_pass();
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(remote->calls("late"), 0);
    EXPECT_EQ(service->current_cursor().total_jokes_loaded(), 3);

    auto second = service->run_sync_pass();
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(remote->calls("late"), 1);
    EXPECT_EQ(store->count(), 6);
}

TEST_F(FeedSyncServiceTest, PageLimitIsClippedAtWindowBoundary) {
    remote->set_items("a", make_ids("a", 20));
    auto service = make_service(
        SourceRegistry({}, {source("a", SourceTier::Ordinary), source("later", SourceTier::Ordinary, 4)}),
        small_pages(10));

    service->run_sync_pass();
    auto log = remote->call_log();
    ASSERT_FALSE(log.empty());
    EXPECT_EQ(log[0].source_id, "a");
    EXPECT_EQ(log[0].page_size, 4);
}

TEST_F(FeedSyncServiceTest, ConcurrentPassIsSkipped) {
    remote->set_items("a", make_ids("a", 3));
    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    std::atomic<bool> first{true};
    remote->set_before_fetch([&](const SourceDescriptor&) {
        if (first.exchange(false)) {
            entered.set_value();
            release_future.wait();
        }
    });

    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), small_pages(5));
    auto running = std::async(std::launch::async, [&] { return service->run_sync_pass(); });
    entered.get_future().wait();

    auto skipped = service->run_sync_pass();
    EXPECT_EQ(skipped.outcome, SyncOutcome::Skipped);

    release.set_value();
    EXPECT_TRUE(running.get().ok());
    EXPECT_EQ(store->count(), 3);
}

TEST_F(FeedSyncServiceTest, NonForcedTriggerDoesNothingWhenStoreHasItems) {
    store->upsert_many({FeedItem{"seed", {}, "x"}});
    remote->set_items("a", make_ids("a", 3));
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), small_pages(5));

    EXPECT_FALSE(service->trigger_sync(false));
    service->wait_for_drain();
    EXPECT_EQ(remote->calls("a"), 0);
}

TEST_F(FeedSyncServiceTest, TriggerWaitsForReadyWindowAndDrains) {
    remote->set_items("a", make_ids("a", 12));
    remote->set_items("b", make_ids("b", 12));
    auto options = small_pages(4);
    options.min_ready_items = 8;
    options.bootstrap_timeout = std::chrono::milliseconds(5000);
    auto service = make_service(
        SourceRegistry({}, {source("a", SourceTier::Ordinary), source("b", SourceTier::Ordinary)}), options);

    EXPECT_TRUE(service->trigger_sync(false));
    EXPECT_GE(store->count(), 8);

    service->wait_for_drain();
    EXPECT_EQ(store->count(), 24);
    EXPECT_FALSE(service->is_syncing());
    EXPECT_EQ(service->current_cursor().total_jokes_loaded(), 24);
}

TEST_F(FeedSyncServiceTest, DrainStopsAtPassLimit) {
    remote->set_items("a", make_ids("a", 100));
    auto options = small_pages(5);
    options.max_passes_per_trigger = 2;
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), options);

    EXPECT_TRUE(service->trigger_sync(true));
    service->wait_for_drain();
    EXPECT_EQ(store->count(), 10);
}

TEST_F(FeedSyncServiceTest, BootstrapSkipsBlockingSyncWhenEnoughItems) {
    store->upsert_many({FeedItem{"x1", {}, "x"}, FeedItem{"x2", {}, "x"}});
    remote->set_items("a", make_ids("a", 3));
    auto options = small_pages(5);
    options.min_ready_items = 2;
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), options);

    EXPECT_TRUE(service->bootstrap());
    EXPECT_EQ(remote->calls("a"), 0);
}

TEST_F(FeedSyncServiceTest, BootstrapSyncsEmptyStore) {
    remote->set_items("a", make_ids("a", 3));
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), small_pages(5));

    EXPECT_TRUE(service->bootstrap());
    service->wait_for_drain();
    EXPECT_EQ(store->count(), 3);
}

TEST_F(FeedSyncServiceTest, ResetForgetsProgress) {
    remote->set_items("a", make_ids("a", 3));
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), small_pages(5));
    service->run_sync_pass();
    ASSERT_FALSE(service->current_cursor().is_empty());

    service->reset();
    EXPECT_TRUE(service->current_cursor().is_empty());
    EXPECT_FALSE(settings->get(kCompositeCursorKey).has_value());
}

TEST_F(FeedSyncServiceTest, ResetDuringPassIsNotOverwritten) {
    remote->set_items("a", make_ids("a", 10));
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), small_pages(5));
    ASSERT_TRUE(service->run_sync_pass().ok());
    ASSERT_EQ(store->count(), 5);

    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    std::atomic<bool> first{true};
    remote->set_before_fetch([&](const SourceDescriptor&) {
        if (first.exchange(false)) {
            entered.set_value();
            release_future.wait();
        }
    });

    auto running = std::async(std::launch::async, [&] { return service->run_sync_pass(); });
    entered.get_future().wait();
    service->reset();
    release.set_value();

    auto report = running.get();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.new_items, 0);
    EXPECT_FALSE(settings->get(kCompositeCursorKey).has_value());
    EXPECT_EQ(store->count(), 5);
}

TEST_F(FeedSyncServiceTest, PassesAreRecordedInTelemetry) {
    remote->set_items("a", make_ids("a", 2));
    remote->set_failing("a");
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), small_pages(5));
    service->run_sync_pass();

    auto logs = LogManager::instance().get_logs_json();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0]["outcome"], "failed");
    EXPECT_EQ(logs[0]["failed_source"], "a");
}

TEST_F(FeedSyncServiceTest, PollingDisabledByDefault) {
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), small_pages(5));
    EXPECT_FALSE(service->start_polling());
    EXPECT_FALSE(service->is_polling());
}

TEST_F(FeedSyncServiceTest, PollingRunsPassesUntilStopped) {
    remote->set_items("a", make_ids("a", 3));
    auto options = small_pages(5);
    options.poll_interval = std::chrono::seconds(1);
    auto service = make_service(SourceRegistry({}, {source("a", SourceTier::Ordinary)}), options);

    ASSERT_TRUE(service->start_polling());
    for (int i = 0; i < 50 && store->count() < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    service->stop_polling();
    EXPECT_FALSE(service->is_polling());
    EXPECT_EQ(store->count(), 3);
}
