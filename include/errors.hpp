#pragma once
#include <stdexcept>
#include <string>

namespace feed_sync {

struct FeedSyncError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Network or remote-side failure while reading a page.
struct RemoteFetchError : FeedSyncError {
    using FeedSyncError::FeedSyncError;
};

// A local feed store batch was rolled back.
struct StoreWriteError : FeedSyncError {
    using FeedSyncError::FeedSyncError;
};

struct SettingsWriteError : FeedSyncError {
    using FeedSyncError::FeedSyncError;
};

struct BundleFormatError : FeedSyncError {
    using FeedSyncError::FeedSyncError;
};

struct ConfigError : FeedSyncError {
    using FeedSyncError::FeedSyncError;
};

} // namespace feed_sync
