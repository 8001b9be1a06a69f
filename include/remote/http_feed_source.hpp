#pragma once
#include <chrono>
#include <string>
#include "ConfigManager.hpp"
#include "remote/remote_feed_source.hpp"

namespace feed_sync {

/**
 * Remote feed pages over HTTP (cpr).
 *
 * GET {base_url}/v1/feeds/{collection}/pages?source=..&limit=..[&order_by=..&direction=..][&after=..]
 * 429, 503 and transport failures are retried with a growing pause;
 * anything else that is not a 200 raises RemoteFetchError.
 */
class HttpFeedSource : public IRemoteFeedSource {
public:
    explicit HttpFeedSource(RemoteConfig config, std::chrono::milliseconds retry_base = std::chrono::milliseconds(500));

    FeedPage fetch_page(const SourceDescriptor& source,
                        const std::optional<PageCursor>& cursor,
                        int page_size) override;

    // Decodes a page response body. Throws RemoteFetchError on malformed input.
    static FeedPage parse_page(const std::string& body, const std::string& source_id);

    std::string page_url(const SourceDescriptor& source) const;

private:
    RemoteConfig config_;
    std::chrono::milliseconds retry_base_;
};

} // namespace feed_sync
