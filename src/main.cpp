#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <string>

#include "ConfigManager.hpp"
#include "LogManager.hpp"
#include "feed_sync_service.hpp"
#include "local_feed_store.hpp"
#include "request_params.hpp"
#include "settings_store.hpp"
#include "remote/cached_feed_source.hpp"
#include "remote/document_cache.hpp"
#include "remote/http_feed_source.hpp"
#include "startup/offline_bundle_loader.hpp"
#include "startup/startup_orchestrator.hpp"
#include "startup/startup_tasks.hpp"

using json = nlohmann::json;
using namespace feed_sync;

class FeedSyncServer {
public:
    explicit FeedSyncServer(AppConfig config)
        : config_(std::move(config)),
          server_()
    {
        settings_ = std::make_shared<JsonFileSettingsStore>(config_.storage.settings_path);
        store_ = std::make_shared<LocalFeedStore>(config_.storage.database_path);
        cache_ = std::make_shared<DocumentCache>();

        auto network = std::make_shared<HttpFeedSource>(config_.remote);
        auto remote = std::make_shared<CachedFeedSource>(network, cache_);

        SyncOptions options;
        options.page_size = config_.sync.page_size;
        options.min_ready_items = config_.sync.min_ready_items;
        options.bootstrap_timeout = std::chrono::milliseconds(config_.sync.bootstrap_timeout_ms);
        options.max_passes_per_trigger = config_.sync.max_passes_per_trigger;
        options.poll_interval = std::chrono::seconds(config_.sync.poll_interval_seconds);
        sync_ = std::make_shared<FeedSyncService>(remote, store_, settings_, config_.sources, options);

        auto services = std::make_shared<ServiceRegistry>();
        services->add<JsonFileSettingsStore>(settings_);
        services->add<ISettingsStore>(settings_);
        services->add<LocalFeedStore>(store_);
        services->add<DocumentCache>(cache_);
        services->add<OfflineBundleLoader>(
            std::make_shared<OfflineBundleLoader>(cache_, config_.storage.bundle_path));
        services->add<FeedSyncService>(sync_);
        orchestrator_ = std::make_unique<StartupOrchestrator>(services, default_startup_tasks());

        setup_routes();
    }

    ~FeedSyncServer() {
        sync_->stop_polling();
    }

    bool start() {
        startup_report_ = orchestrator_->run();
        if (!startup_report_.ok) {
            spdlog::critical("🚨 Startup failed at {}", startup_report_.failed_task);
            return false;
        }
        return true;
    }

    void run() {
        spdlog::info("🚀 Starting feed sync daemon on {}:{}", config_.server.host, config_.server.port);
        if (!server_.listen(config_.server.host, config_.server.port)) {
            spdlog::error("❌ Could not bind {}:{}", config_.server.host, config_.server.port);
        }
    }

private:
    AppConfig config_;
    httplib::Server server_;

    std::shared_ptr<JsonFileSettingsStore> settings_;
    std::shared_ptr<LocalFeedStore> store_;
    std::shared_ptr<DocumentCache> cache_;
    std::shared_ptr<FeedSyncService> sync_;
    std::unique_ptr<StartupOrchestrator> orchestrator_;
    StartupReport startup_report_;

    static void send_error(httplib::Response& res, int status, const std::string& message) {
        res.status = status;
        res.set_content(json{{"error", message}}.dump(), "application/json");
    }

    static json records_json(const std::vector<LocalFeedRecord>& records) {
        json list = json::array();
        for (const auto& r : records) list.push_back(r.to_json());
        return list;
    }

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/api/admin/telemetry", [this](const httplib::Request&, httplib::Response& res) {
            json response = {
                {"sync", {
                    {"state", to_string(sync_->state())},
                    {"syncing", sync_->is_syncing()},
                    {"polling", sync_->is_polling()}
                }},
                {"startup", startup_report_.to_json()},
                {"cache_documents", cache_->size()},
                {"logs", LogManager::instance().get_logs_json()}
            };
            res.set_content(response.dump(), "application/json");
        });

        server_.Get("/api/feed/head", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                int limit = 100;
                if (req.has_param("limit")) limit = parse_positive_int(req.get_param_value("limit"), "limit");
                res.set_content(json{{"items", records_json(store_->head(limit))}}.dump(), "application/json");
            } catch (const std::invalid_argument& e) {
                send_error(res, 400, e.what());
            } catch (const std::exception& e) {
                send_error(res, 500, e.what());
            }
        });

        server_.Get("/api/feed/count", [this](const httplib::Request&, httplib::Response& res) {
            try {
                res.set_content(json{
                    {"count", store_->count()},
                    {"viewed", store_->count_viewed()},
                    {"saved", store_->count_saved()},
                    {"shared", store_->count_shared()}
                }.dump(), "application/json");
            } catch (const std::exception& e) {
                send_error(res, 500, e.what());
            }
        });

        server_.Get("/api/feed/cursor", [this](const httplib::Request&, httplib::Response& res) {
            auto cursor = sync_->current_cursor();
            res.set_content(json{
                {"cursor", json::parse(cursor.encode())},
                {"total_jokes_loaded", cursor.total_jokes_loaded()},
                {"state", to_string(sync_->state())}
            }.dump(), "application/json");
        });

        server_.Get("/api/feed/saved", [this](const httplib::Request&, httplib::Response& res) {
            try {
                res.set_content(json{{"items", records_json(store_->saved_items())}}.dump(), "application/json");
            } catch (const std::exception& e) {
                send_error(res, 500, e.what());
            }
        });

        server_.Post("/api/feed/sync", [this](const httplib::Request& req, httplib::Response& res) {
            bool force = req.has_param("force") && req.get_param_value("force") == "true";
            spdlog::info("🎯 Sync requested over HTTP (force={})", force);
            bool started = sync_->trigger_sync(force);
            try {
                res.set_content(json{
                    {"started", started},
                    {"count", store_->count()}
                }.dump(), "application/json");
            } catch (const std::exception& e) {
                send_error(res, 500, e.what());
            }
        });

        server_.Post("/api/feed/reset", [this](const httplib::Request&, httplib::Response& res) {
            sync_->reset();
            res.set_content(json{{"reset", true}}.dump(), "application/json");
        });

        server_.Post(R"(/api/feed/items/([^/]+)/(viewed|saved|unsaved|shared))",
                     [this](const httplib::Request& req, httplib::Response& res) {
            try {
                std::string item_id = req.matches[1];
                std::string action = req.matches[2];

                if (action == "viewed") store_->set_viewed(item_id);
                else if (action == "saved") store_->set_saved(item_id);
                else if (action == "unsaved") store_->set_unsaved(item_id);
                else store_->set_shared(item_id);

                auto record = store_->get(item_id);
                res.set_content(record ? record->to_json().dump() : json{{"item_id", item_id}}.dump(),
                                "application/json");
            } catch (const std::exception& e) {
                send_error(res, 500, e.what());
            }
        });
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    ConfigManager config_manager(argc > 1 ? argv[1] : "");
    auto config = config_manager.get();
    init_logging(config.log_level);

    FeedSyncServer server(config);
    if (!server.start()) return 1;
    server.run();
    return 0;
}
