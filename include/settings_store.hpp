#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace feed_sync {

// Durable string key-value storage (the process-wide preferences).
class ISettingsStore {
public:
    virtual ~ISettingsStore() = default;
    virtual std::optional<std::string> get(const std::string& key) const = 0;
    // Throws SettingsWriteError when the value could not be made durable.
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual void remove(const std::string& key) = 0;
};

/**
 * Settings persisted as one JSON object on disk.
 *
 * Every write rewrites the file through a temp file + rename, so a crash
 * leaves either the old or the new document. The in-memory view only
 * changes after the file write succeeded.
 */
class JsonFileSettingsStore : public ISettingsStore {
public:
    explicit JsonFileSettingsStore(std::filesystem::path path);

    // Reads the file; a missing or corrupt file starts empty.
    void load();

    std::optional<std::string> get(const std::string& key) const override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

    const std::filesystem::path& path() const { return path_; }

private:
    void write_file(const std::map<std::string, std::string>& values) const;

    std::filesystem::path path_;
    std::map<std::string, std::string> values_;
    mutable std::mutex mtx_;
};

} // namespace feed_sync
