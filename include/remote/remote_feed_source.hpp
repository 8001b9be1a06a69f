#pragma once
#include <optional>
#include "feed_types.hpp"
#include "source_registry.hpp"

namespace feed_sync {

/**
 * Paginated read access to one remote feed source.
 *
 * Calling twice with the same cursor must be safe. Failures are reported
 * as RemoteFetchError.
 */
class IRemoteFeedSource {
public:
    virtual ~IRemoteFeedSource() = default;
    virtual FeedPage fetch_page(const SourceDescriptor& source,
                                const std::optional<PageCursor>& cursor,
                                int page_size) = 0;
};

} // namespace feed_sync
