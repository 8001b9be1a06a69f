#include "settings_store.hpp"
#include "errors.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace feed_sync {

namespace fs = std::filesystem;
using json = nlohmann::json;

JsonFileSettingsStore::JsonFileSettingsStore(fs::path path) : path_(std::move(path)) {}

void JsonFileSettingsStore::load() {
    std::lock_guard<std::mutex> lock(mtx_);
    values_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        spdlog::info("SETTINGS: No settings file at {}, starting empty", path_.string());
        return;
    }

    try {
        std::ifstream f(path_);
        json j = json::parse(f);
        for (const auto& [key, value] : j.items()) {
            if (value.is_string()) values_[key] = value.get<std::string>();
        }
        spdlog::info("SETTINGS: Loaded {} keys from {}", values_.size(), path_.string());
    } catch (const std::exception& e) {
        spdlog::warn("SETTINGS: Ignoring corrupt settings file {}: {}", path_.string(), e.what());
        values_.clear();
    }
}

std::optional<std::string> JsonFileSettingsStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

void JsonFileSettingsStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto next = values_;
    next[key] = value;
    write_file(next);
    values_ = std::move(next);
}

void JsonFileSettingsStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!values_.count(key)) return;
    auto next = values_;
    next.erase(key);
    write_file(next);
    values_ = std::move(next);
}

void JsonFileSettingsStore::write_file(const std::map<std::string, std::string>& values) const {
    fs::path tmp = path_.string() + ".tmp";
    try {
        if (path_.has_parent_path()) fs::create_directories(path_.parent_path());

        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw SettingsWriteError("cannot open " + tmp.string());
        json j = values;
        out << j.dump(2);
        out.flush();
        if (!out) throw SettingsWriteError("short write to " + tmp.string());
        out.close();

        fs::rename(tmp, path_);
    } catch (const SettingsWriteError&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw SettingsWriteError(std::string("settings write failed: ") + e.what());
    }
}

} // namespace feed_sync
