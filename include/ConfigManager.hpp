#pragma once
#include <vector>
#include <string>
#include <shared_mutex>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "source_registry.hpp"

namespace feed_sync {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 5003;
};

struct RemoteConfig {
    std::string base_url = "http://127.0.0.1:8080";
    std::string api_key;
    int timeout_ms = 10000;
    int max_retries = 4;
};

struct StorageConfig {
    std::string database_path = "feed_cache.db";
    std::string settings_path = "feed_settings.json";
    std::string bundle_path = "assets/data_bundles/firestore_bundle.txt";
};

struct SyncConfig {
    int page_size = 20;
    int min_ready_items = 50;
    int bootstrap_timeout_ms = 10000;
    int max_passes_per_trigger = 20;
    int poll_interval_seconds = 0; // 0 = no polling
};

struct AppConfig {
    ServerConfig server;
    RemoteConfig remote;
    StorageConfig storage;
    SyncConfig sync;
    SourceRegistry sources = SourceRegistry::defaults();
    std::string log_level = "info";

    // Missing keys keep their defaults. Throws ConfigError on invalid values.
    static AppConfig from_json(const nlohmann::json& j) {
        AppConfig c;
        try {
            if (j.contains("server")) {
                const auto& s = j["server"];
                c.server.host = s.value("host", c.server.host);
                c.server.port = s.value("port", c.server.port);
            }
            if (j.contains("remote")) {
                const auto& r = j["remote"];
                c.remote.base_url = r.value("base_url", c.remote.base_url);
                c.remote.api_key = r.value("api_key", c.remote.api_key);
                c.remote.timeout_ms = r.value("timeout_ms", c.remote.timeout_ms);
                c.remote.max_retries = r.value("max_retries", c.remote.max_retries);
            }
            if (j.contains("storage")) {
                const auto& s = j["storage"];
                c.storage.database_path = s.value("database_path", c.storage.database_path);
                c.storage.settings_path = s.value("settings_path", c.storage.settings_path);
                c.storage.bundle_path = s.value("bundle_path", c.storage.bundle_path);
            }
            if (j.contains("sync")) {
                const auto& s = j["sync"];
                c.sync.page_size = s.value("page_size", c.sync.page_size);
                c.sync.min_ready_items = s.value("min_ready_items", c.sync.min_ready_items);
                c.sync.bootstrap_timeout_ms = s.value("bootstrap_timeout_ms", c.sync.bootstrap_timeout_ms);
                c.sync.max_passes_per_trigger = s.value("max_passes_per_trigger", c.sync.max_passes_per_trigger);
                c.sync.poll_interval_seconds = s.value("poll_interval_seconds", c.sync.poll_interval_seconds);
            }
            if (j.contains("sources")) {
                const auto& s = j["sources"];
                std::vector<SourceDescriptor> priority, ordinary;
                for (const auto& p : s.value("priority", nlohmann::json::array())) {
                    priority.push_back(SourceDescriptor::from_json(p, SourceTier::Priority));
                }
                for (const auto& o : s.value("ordinary", nlohmann::json::array())) {
                    ordinary.push_back(SourceDescriptor::from_json(o, SourceTier::Ordinary));
                }
                c.sources = SourceRegistry(std::move(priority), std::move(ordinary));
            }
            if (j.contains("logging")) {
                c.log_level = j["logging"].value("level", c.log_level);
            }
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string("invalid configuration: ") + e.what());
        }

        if (c.sync.page_size <= 0) throw ConfigError("sync.page_size must be positive");
        if (c.sync.min_ready_items < 0) throw ConfigError("sync.min_ready_items must not be negative");
        if (c.server.port <= 0 || c.server.port > 65535) throw ConfigError("server.port out of range");
        return c;
    }
};

class ConfigManager {
private:
    AppConfig config_;
    std::string loaded_from_;
    std::string explicit_path_;
    mutable std::shared_mutex config_mutex;

public:
    explicit ConfigManager(std::string explicit_path = "") : explicit_path_(std::move(explicit_path)) {
        reload();
    }

    static std::vector<std::string> search_paths() {
        return {
            "feed_sync.json",            // 1. Current Working Directory
            "../feed_sync.json",         // 2. Parent Directory (common in build/Release)
            "build/feed_sync.json",      // 3. Build Directory
            "Release/feed_sync.json",    // 4. Release Directory
            "../../feed_sync.json"       // 5. Project Root (from build/Release)
        };
    }

    // Falls back to defaults, with an error log, when the file is missing or invalid.
    void reload() {
        std::unique_lock lock(config_mutex);

        std::vector<std::string> candidates;
        if (!explicit_path_.empty()) candidates.push_back(explicit_path_);
        else candidates = search_paths();

        std::ifstream f;
        std::string found_path;
        for (const auto& path : candidates) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
        }

        if (found_path.empty()) {
            if (!explicit_path_.empty()) {
                spdlog::error("🚨 Config file {} not found, using defaults", explicit_path_);
            } else {
                spdlog::warn("⚠️ feed_sync.json not found in any standard path, using defaults");
            }
            config_ = AppConfig{};
            loaded_from_.clear();
            return;
        }

        try {
            auto j = nlohmann::json::parse(f);
            config_ = AppConfig::from_json(j);
            loaded_from_ = found_path;
            spdlog::info("🛰️ Config loaded from {}: {} priority / {} ordinary sources",
                         found_path, config_.sources.priority_sources().size(),
                         config_.sources.ordinary_sources().size());
        } catch (const std::exception& e) {
            spdlog::error("💥 Failed to parse {}: {}. Using defaults", found_path, e.what());
            config_ = AppConfig{};
            loaded_from_.clear();
        }
    }

    AppConfig get() const {
        std::shared_lock lock(config_mutex);
        return config_;
    }

    // Empty when running on defaults.
    std::string loaded_from() const {
        std::shared_lock lock(config_mutex);
        return loaded_from_;
    }
};

// Applies logging.level and the process-wide pattern to the default logger.
inline void init_logging(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', keeping info", level);
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
}

} // namespace feed_sync
