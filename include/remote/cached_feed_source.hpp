#pragma once
#include <memory>
#include "remote/document_cache.hpp"
#include "remote/remote_feed_source.hpp"

namespace feed_sync {

/**
 * Network first, cache second. Successful network pages are written
 * through to the DocumentCache; when the network throws and the cache
 * holds the source's collection, the page is served from the cache.
 */
class CachedFeedSource : public IRemoteFeedSource {
public:
    CachedFeedSource(std::shared_ptr<IRemoteFeedSource> network, std::shared_ptr<DocumentCache> cache);

    FeedPage fetch_page(const SourceDescriptor& source,
                        const std::optional<PageCursor>& cursor,
                        int page_size) override;

private:
    std::shared_ptr<IRemoteFeedSource> network_;
    std::shared_ptr<DocumentCache> cache_;
};

} // namespace feed_sync
