#pragma once
#include <vector>
#include "startup/startup_task.hpp"

namespace feed_sync {

inline constexpr const char* kSettingsTaskId = "settings";
inline constexpr const char* kLocalDbTaskId = "local_db";
inline constexpr const char* kOfflineBundleTaskId = "offline_bundle";
inline constexpr const char* kSyncFeedTaskId = "sync_feed_jokes";
inline constexpr const char* kFeedPollTaskId = "feed_poll";

// Expects JsonFileSettingsStore, LocalFeedStore, OfflineBundleLoader and
// FeedSyncService in the registry.
std::vector<StartupTask> default_startup_tasks();

} // namespace feed_sync
