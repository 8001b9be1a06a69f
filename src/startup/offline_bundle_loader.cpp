#include "startup/offline_bundle_loader.hpp"
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace feed_sync {

namespace fs = std::filesystem;

OfflineBundleLoader::OfflineBundleLoader(std::shared_ptr<DocumentCache> cache, fs::path bundle_path)
    : cache_(std::move(cache)), bundle_path_(std::move(bundle_path)) {}

bool OfflineBundleLoader::load_latest_bundle() {
    std::error_code ec;
    if (!fs::is_regular_file(bundle_path_, ec)) {
        spdlog::debug("BUNDLE: No bundle at {}", bundle_path_.string());
        return false;
    }

    std::ifstream in(bundle_path_, std::ios::binary);
    if (!in.is_open()) {
        spdlog::debug("BUNDLE: Could not open {}", bundle_path_.string());
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        spdlog::warn("BUNDLE: Read error on {}", bundle_path_.string());
        return false;
    }

    auto task = cache_->load_bundle(buffer.str());
    auto subscription = task->subscribe([](const LoadBundleTaskProgress& p) {
        spdlog::debug("BUNDLE: {} {}/{} documents, {}/{} bytes",
                      to_string(p.state), p.documents_loaded, p.total_documents, p.bytes_loaded, p.total_bytes);
    });

    auto result = task->wait();
    if (result.state != LoadBundleTaskState::Success) {
        spdlog::warn("⚠️ BUNDLE: {} not loaded: {}", bundle_path_.string(), result.error);
        return false;
    }
    spdlog::info("📦 BUNDLE: {} documents cached from {}", result.documents_loaded, bundle_path_.string());
    return true;
}

} // namespace feed_sync
