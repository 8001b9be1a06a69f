#pragma once
#include <filesystem>
#include <memory>
#include "remote/document_cache.hpp"

namespace feed_sync {

/**
 * Seeds the DocumentCache from the bundle snapshot shipped with the
 * install, so the first sync pass can be served offline.
 */
class OfflineBundleLoader {
public:
    OfflineBundleLoader(std::shared_ptr<DocumentCache> cache, std::filesystem::path bundle_path);

    // False when the bundle is missing, unreadable or fails to ingest. Never throws.
    bool load_latest_bundle();

    const std::filesystem::path& bundle_path() const { return bundle_path_; }

private:
    std::shared_ptr<DocumentCache> cache_;
    std::filesystem::path bundle_path_;
};

} // namespace feed_sync
