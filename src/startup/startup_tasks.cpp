#include "startup/startup_tasks.hpp"
#include "feed_sync_service.hpp"
#include "local_feed_store.hpp"
#include "settings_store.hpp"
#include "startup/offline_bundle_loader.hpp"
#include <spdlog/spdlog.h>

namespace feed_sync {

namespace {

bool init_settings(const ServiceRegistry& services) {
    services.require<JsonFileSettingsStore>()->load();
    return true;
}

bool init_local_db(const ServiceRegistry& services) {
    auto store = services.require<LocalFeedStore>();
    store->open();
    spdlog::info("🗄️ Local feed ready: {} items", store->count());
    return true;
}

bool load_offline_bundle(const ServiceRegistry& services) {
    return services.require<OfflineBundleLoader>()->load_latest_bundle();
}

bool sync_feed(const ServiceRegistry& services) {
    return services.require<FeedSyncService>()->bootstrap();
}

// Polling off is not a failure.
bool start_feed_poll(const ServiceRegistry& services) {
    auto sync = services.require<FeedSyncService>();
    if (!sync->start_polling()) spdlog::debug("STARTUP: Feed polling disabled");
    return true;
}

} // namespace

std::vector<StartupTask> default_startup_tasks() {
    return {
        {kSettingsTaskId, StartupPhase::Critical, init_settings},
        {kLocalDbTaskId, StartupPhase::Critical, init_local_db},
        {kOfflineBundleTaskId, StartupPhase::BestEffort, load_offline_bundle},
        {kSyncFeedTaskId, StartupPhase::BestEffort, sync_feed},
        {kFeedPollTaskId, StartupPhase::Background, start_feed_poll},
    };
}

} // namespace feed_sync
