#include <gtest/gtest.h>
#include <algorithm>
#include <sqlite3.h>
#include <memory>
#include "errors.hpp"
#include "local_feed_store.hpp"
#include "test_support.hpp"

using namespace feed_sync;
using namespace feed_sync::test_support;

namespace {

std::vector<FeedItem> items_for(const std::vector<std::string>& ids) {
    std::vector<FeedItem> items;
    for (const auto& id : ids) items.push_back(FeedItem{id, {{"text", id}}, "test"});
    return items;
}

// Aborts any insert of item 'poison' through a second connection.
void install_poison_trigger(const std::string& db_path) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(db_path.c_str(), &db), SQLITE_OK);
    char* err = nullptr;
    int rc = sqlite3_exec(db,
        "CREATE TRIGGER reject_poison BEFORE INSERT ON feed_items "
        "WHEN NEW.item_id = 'poison' BEGIN SELECT RAISE(ABORT, 'poisoned item'); END;",
        nullptr, nullptr, &err);
    std::string message = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db);
    ASSERT_EQ(rc, SQLITE_OK) << message;
}

} // namespace

class LocalFeedStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path = dir.file("feed.db");
        store = std::make_unique<LocalFeedStore>(db_path);
        store->open();
    }

    TempDir dir;
    std::string db_path;
    std::unique_ptr<LocalFeedStore> store;
};

TEST_F(LocalFeedStoreTest, AssignsSequentialIndicesFromZero) {
    EXPECT_EQ(store->upsert_many(items_for({"a", "b", "c"})), 3);
    EXPECT_EQ(store->count(), 3);
    EXPECT_EQ(store->get("a")->feed_index, 0);
    EXPECT_EQ(store->get("b")->feed_index, 1);
    EXPECT_EQ(store->get("c")->feed_index, 2);

    EXPECT_EQ(store->upsert_many(items_for({"d"})), 1);
    EXPECT_EQ(store->get("d")->feed_index, 3);
}

TEST_F(LocalFeedStoreTest, ReUpsertKeepsIndexAndRefreshesPayload) {
    store->upsert_many(items_for({"a", "b"}));
    std::vector<FeedItem> update = {FeedItem{"a", {{"text", "changed"}}, "test"}};
    EXPECT_EQ(store->upsert_many(update), 0);

    auto a = store->get("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->feed_index, 0);
    EXPECT_EQ(a->payload["text"], "changed");
    EXPECT_EQ(store->count(), 2);
}

TEST_F(LocalFeedStoreTest, DuplicateIdsInOneBatchIndexedOnce) {
    EXPECT_EQ(store->upsert_many(items_for({"x", "y", "x"})), 2);
    EXPECT_EQ(store->count(), 2);
    EXPECT_EQ(store->get("x")->feed_index, 0);
    EXPECT_EQ(store->get("y")->feed_index, 1);
}

TEST_F(LocalFeedStoreTest, HeadReturnsNewestFirst) {
    store->upsert_many(items_for({"a", "b", "c", "d"}));
    auto head = store->head(2);
    ASSERT_EQ(head.size(), 2u);
    EXPECT_EQ(head[0].item_id, "d");
    EXPECT_EQ(head[1].item_id, "c");
    EXPECT_TRUE(store->head(0).empty());
}

TEST_F(LocalFeedStoreTest, InteractionOnlyRowGetsIndexWhenFetched) {
    store->set_saved("later");
    EXPECT_EQ(store->count(), 0);
    EXPECT_EQ(store->count_saved(), 1);
    EXPECT_EQ(store->get("later")->feed_index, -1);

    store->upsert_many(items_for({"first"}));
    EXPECT_EQ(store->upsert_many(items_for({"later"})), 1);
    auto later = store->get("later");
    ASSERT_TRUE(later.has_value());
    EXPECT_EQ(later->feed_index, 1);
    EXPECT_TRUE(later->saved_at.has_value());
}

TEST_F(LocalFeedStoreTest, InteractionsStampAndClear) {
    store->upsert_many(items_for({"a", "b"}));
    store->set_viewed("a");
    store->set_viewed("b");
    store->set_saved("a");
    store->set_shared("b");

    EXPECT_EQ(store->count_viewed(), 2);
    EXPECT_EQ(store->count_saved(), 1);
    EXPECT_EQ(store->count_shared(), 1);

    auto saved = store->saved_items();
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved[0].item_id, "a");

    store->set_unsaved("a");
    EXPECT_EQ(store->count_saved(), 0);
    EXPECT_FALSE(store->get("a")->saved_at.has_value());
    EXPECT_TRUE(store->get("a")->viewed_at.has_value());
}

TEST_F(LocalFeedStoreTest, FailedBatchRollsBackEntirely) {
    store->upsert_many(items_for({"a"}));
    install_poison_trigger(db_path);

    EXPECT_THROW(store->upsert_many(items_for({"b", "poison", "c"})), StoreWriteError);
    EXPECT_EQ(store->count(), 1);
    EXPECT_FALSE(store->get("b").has_value());
    EXPECT_FALSE(store->get("c").has_value());

    // The next batch continues from the same index.
    EXPECT_EQ(store->upsert_many(items_for({"b"})), 1);
    EXPECT_EQ(store->get("b")->feed_index, 1);
}

TEST_F(LocalFeedStoreTest, WatchHeadEmitsNowAndAfterCommit) {
    std::vector<size_t> sizes;
    std::vector<LocalFeedRecord> latest;
    auto sub = store->watch_head(10, [&](const std::vector<LocalFeedRecord>& window) {
        sizes.push_back(window.size());
        latest = window;
    });
    ASSERT_EQ(sizes.size(), 1u);
    EXPECT_EQ(sizes[0], 0u);

    store->upsert_many(items_for({"a", "b"}));
    ASSERT_EQ(sizes.size(), 2u);
    EXPECT_EQ(sizes[1], 2u);

    store->set_saved("a");
    ASSERT_EQ(sizes.size(), 3u);
    auto saved = std::find_if(latest.begin(), latest.end(),
                              [](const LocalFeedRecord& r) { return r.item_id == "a"; });
    ASSERT_NE(saved, latest.end());
    EXPECT_TRUE(saved->saved_at.has_value());

    sub.reset();
    store->upsert_many(items_for({"c"}));
    store->set_viewed("c");
    EXPECT_EQ(sizes.size(), 3u);
}

TEST_F(LocalFeedStoreTest, DataSurvivesReopen) {
    store->upsert_many(items_for({"a", "b"}));
    store.reset();

    LocalFeedStore reopened(db_path);
    reopened.open();
    EXPECT_EQ(reopened.count(), 2);
    EXPECT_EQ(reopened.get("b")->feed_index, 1);
}

TEST_F(LocalFeedStoreTest, ClearDropsEverything) {
    store->upsert_many(items_for({"a"}));
    store->set_saved("z");
    store->clear();
    EXPECT_EQ(store->count(), 0);
    EXPECT_EQ(store->count_saved(), 0);
}

TEST(LocalFeedStoreClosedTest, OperationsRequireOpen) {
    TempDir dir;
    LocalFeedStore store(dir.file("closed.db"));
    EXPECT_FALSE(store.is_open());
    EXPECT_THROW(store.count(), FeedSyncError);
}
