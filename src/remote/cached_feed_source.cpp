#include "remote/cached_feed_source.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace feed_sync {

CachedFeedSource::CachedFeedSource(std::shared_ptr<IRemoteFeedSource> network, std::shared_ptr<DocumentCache> cache)
    : network_(std::move(network)), cache_(std::move(cache)) {}

FeedPage CachedFeedSource::fetch_page(const SourceDescriptor& source,
                                      const std::optional<PageCursor>& cursor,
                                      int page_size) {
    try {
        auto page = network_->fetch_page(source, cursor, page_size);
        if (cache_ && !page.items.empty()) cache_->put_items(source.collection, page.items);
        return page;
    } catch (const RemoteFetchError& e) {
        if (!cache_ || !cache_->has_collection(source.collection)) throw;
        spdlog::warn("📦 {} offline ({}), serving from document cache", source.id, e.what());
        return cache_->query_page(source, cursor, page_size);
    }
}

} // namespace feed_sync
