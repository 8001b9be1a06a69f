#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

namespace feed_sync {

struct SyncPassLog {
    long long timestamp;
    std::string outcome;        // completed / skipped / failed
    std::string failed_source;  // empty unless failed
    int new_items;
    int pages_fetched;
    bool cold_start;
    long long total_jokes_loaded;
    double duration_ms;
};

class LogManager {
public:
    // Singleton access
    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(const SyncPassLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > 50) { // Keep last 50 only
            logs_.pop_front();
        }
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

    nlohmann::json get_logs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        // Newest first
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"outcome", it->outcome},
                {"failed_source", it->failed_source},
                {"new_items", it->new_items},
                {"pages_fetched", it->pages_fetched},
                {"cold_start", it->cold_start},
                {"total_jokes_loaded", it->total_jokes_loaded},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

private:
    LogManager() {}
    std::deque<SyncPassLog> logs_;
    std::mutex mtx_;
};

} // namespace feed_sync
