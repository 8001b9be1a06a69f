#include "remote/document_cache.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace feed_sync {

using json = nlohmann::json;

const char* to_string(LoadBundleTaskState state) {
    switch (state) {
        case LoadBundleTaskState::Running: return "running";
        case LoadBundleTaskState::Success: return "success";
        case LoadBundleTaskState::Error: return "error";
    }
    return "unknown";
}

// --- LOAD BUNDLE TASK ---

LoadBundleTask::~LoadBundleTask() {
    if (worker_.valid()) worker_.wait();
}

ScopedSubscription LoadBundleTask::subscribe(ProgressObserver observer) {
    if (!observer) return ScopedSubscription();

    uint64_t id = 0;
    LoadBundleTaskProgress current;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        id = next_observer_id_++;
        observers_[id] = observer;
        current = latest_;
    }
    observer(current);

    std::weak_ptr<LoadBundleTask> weak = weak_from_this();
    return ScopedSubscription([weak, id]() {
        auto task = weak.lock();
        if (!task) return;
        std::lock_guard<std::mutex> lock(task->mtx_);
        task->observers_.erase(id);
    });
}

LoadBundleTaskProgress LoadBundleTask::latest() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return latest_;
}

LoadBundleTaskProgress LoadBundleTask::wait() const {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this] { return latest_.is_terminal(); });
    return latest_;
}

std::optional<LoadBundleTaskProgress> LoadBundleTask::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!cv_.wait_for(lock, timeout, [this] { return latest_.is_terminal(); })) return std::nullopt;
    return latest_;
}

void LoadBundleTask::publish(const LoadBundleTaskProgress& progress) {
    std::vector<ProgressObserver> to_notify;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        latest_ = progress;
        for (const auto& [id, obs] : observers_) to_notify.push_back(obs);
    }
    for (const auto& obs : to_notify) {
        try {
            obs(progress);
        } catch (const std::exception& e) {
            spdlog::error("BUNDLE: Progress observer failed: {}", e.what());
        }
    }
    if (progress.is_terminal()) cv_.notify_all();
}

// --- VALUE DECODING ---

json DocumentCache::decode_value(const json& typed) {
    if (!typed.is_object() || typed.size() != 1) return typed;

    auto entry = typed.begin();
    const std::string& kind = entry.key();
    const json& value = entry.value();
    if (kind == "nullValue") return nullptr;
    if (kind == "booleanValue") return value.is_boolean() ? value : json(value == "true");
    if (kind == "integerValue") {
        if (value.is_number()) return value;
        return static_cast<int64_t>(std::stoll(value.get<std::string>()));
    }
    if (kind == "doubleValue") return value;
    if (kind == "stringValue" || kind == "timestampValue" || kind == "referenceValue" || kind == "bytesValue") {
        return value;
    }
    if (kind == "geoPointValue") {
        return {{"latitude", value.value("latitude", 0.0)}, {"longitude", value.value("longitude", 0.0)}};
    }
    if (kind == "arrayValue") {
        json out = json::array();
        for (const auto& v : value.value("values", json::array())) out.push_back(decode_value(v));
        return out;
    }
    if (kind == "mapValue") {
        json out = json::object();
        for (const auto& [k, v] : value.value("fields", json::object()).items()) out[k] = decode_value(v);
        return out;
    }
    return typed;
}

// --- BUNDLE PARSING ---

namespace {

// "projects/p/databases/(default)/documents/jokes/abc" -> {"jokes", "abc"}
std::pair<std::string, std::string> split_document_name(const std::string& name) {
    std::string path = name;
    const std::string marker = "/documents/";
    auto at = name.find(marker);
    if (at != std::string::npos) path = name.substr(at + marker.size());

    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == path.size()) {
        throw BundleFormatError("bad document name: " + name);
    }
    std::string parent = path.substr(0, slash);
    auto parent_slash = parent.find_last_of('/');
    std::string collection = parent_slash == std::string::npos ? parent : parent.substr(parent_slash + 1);
    return {collection, path.substr(slash + 1)};
}

int64_t as_int(const json& v) {
    if (v.is_number()) return v.get<int64_t>();
    if (v.is_string()) return std::stoll(v.get<std::string>());
    return 0;
}

} // namespace

std::vector<CachedDocument> DocumentCache::parse_bundle(
    const std::string& bytes,
    const std::function<void(const LoadBundleTaskProgress&)>& on_progress) {
    std::vector<CachedDocument> docs;
    LoadBundleTaskProgress progress;
    progress.total_bytes = static_cast<int64_t>(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size()) {
        while (pos < bytes.size() && std::isspace(static_cast<unsigned char>(bytes[pos]))) ++pos;
        if (pos >= bytes.size()) break;

        size_t digits_end = pos;
        while (digits_end < bytes.size() && std::isdigit(static_cast<unsigned char>(bytes[digits_end]))) ++digits_end;
        if (digits_end == pos) {
            throw BundleFormatError("length prefix not found at offset " + std::to_string(pos));
        }

        const long long length = std::stoll(bytes.substr(pos, digits_end - pos));
        if (length <= 0) throw BundleFormatError("invalid element length at offset " + std::to_string(pos));

        size_t start = digits_end;
        if (start < bytes.size() && bytes[start] == '\r') ++start;
        if (start < bytes.size() && bytes[start] == '\n') ++start;
        if (start + static_cast<size_t>(length) > bytes.size()) {
            throw BundleFormatError("element exceeds bundle size at offset " + std::to_string(pos));
        }

        auto element = json::parse(bytes.substr(start, static_cast<size_t>(length)), nullptr, false);
        if (element.is_discarded() || !element.is_object()) {
            throw BundleFormatError("element at offset " + std::to_string(pos) + " is not a JSON object");
        }
        pos = start + static_cast<size_t>(length);

        try {
            if (element.contains("metadata")) {
                const auto& meta = element["metadata"];
                progress.total_documents = static_cast<int>(as_int(meta.value("totalDocuments", json(0))));
                if (meta.contains("totalBytes") && as_int(meta["totalBytes"]) > 0) {
                    progress.total_bytes = as_int(meta["totalBytes"]);
                }
                progress.bytes_loaded = static_cast<int64_t>(pos);
                if (on_progress) on_progress(progress);
            } else if (element.contains("document")) {
                const auto& d = element["document"];
                auto [collection, id] = split_document_name(d.at("name").get<std::string>());

                CachedDocument doc{collection, id, json::object()};
                for (const auto& [field, value] : d.value("fields", json::object()).items()) {
                    doc.fields[field] = decode_value(value);
                }
                docs.push_back(std::move(doc));

                progress.documents_loaded++;
                progress.bytes_loaded = static_cast<int64_t>(pos);
                if (on_progress) on_progress(progress);
            }
            // namedQuery / documentMetadata carry nothing the cache needs.
        } catch (const BundleFormatError&) {
            throw;
        } catch (const std::exception& e) {
            throw BundleFormatError(std::string("bad bundle element: ") + e.what());
        }
    }

    return docs;
}

std::shared_ptr<LoadBundleTask> DocumentCache::load_bundle(std::string bytes) {
    auto task = std::make_shared<LoadBundleTask>();
    LoadBundleTask* raw = task.get();

    raw->worker_ = std::async(std::launch::async, [this, raw, bytes = std::move(bytes)]() {
        LoadBundleTaskProgress last;
        last.total_bytes = static_cast<int64_t>(bytes.size());
        try {
            auto docs = parse_bundle(bytes, [&](const LoadBundleTaskProgress& p) {
                last = p;
                raw->publish(p);
            });
            apply(std::move(docs));
            last.state = LoadBundleTaskState::Success;
            last.bytes_loaded = last.total_bytes;
            spdlog::info("BUNDLE: Loaded {} documents ({} bytes)", last.documents_loaded, last.total_bytes);
        } catch (const std::exception& e) {
            last.state = LoadBundleTaskState::Error;
            last.error = e.what();
            spdlog::error("BUNDLE: Load failed: {}", e.what());
        }
        raw->publish(last);
    });

    return task;
}

// --- CACHE ---

void DocumentCache::apply(std::vector<CachedDocument> docs) {
    std::unique_lock lock(mtx_);
    for (auto& doc : docs) {
        auto& coll = collections_[doc.collection];
        coll.insert_or_assign(doc.id, std::move(doc));
    }
}

void DocumentCache::put(CachedDocument doc) {
    std::unique_lock lock(mtx_);
    auto& coll = collections_[doc.collection];
    coll.insert_or_assign(doc.id, std::move(doc));
}

void DocumentCache::put_items(const std::string& collection, const std::vector<FeedItem>& items) {
    std::unique_lock lock(mtx_);
    auto& coll = collections_[collection];
    for (const auto& item : items) {
        coll.insert_or_assign(item.id, CachedDocument{collection, item.id, item.payload});
    }
}

std::optional<CachedDocument> DocumentCache::get(const std::string& collection, const std::string& id) const {
    std::shared_lock lock(mtx_);
    auto c = collections_.find(collection);
    if (c == collections_.end()) return std::nullopt;
    auto d = c->second.find(id);
    if (d == c->second.end()) return std::nullopt;
    return d->second;
}

size_t DocumentCache::size() const {
    std::shared_lock lock(mtx_);
    size_t total = 0;
    for (const auto& [name, docs] : collections_) total += docs.size();
    return total;
}

size_t DocumentCache::size(const std::string& collection) const {
    std::shared_lock lock(mtx_);
    auto it = collections_.find(collection);
    return it == collections_.end() ? 0 : it->second.size();
}

FeedPage DocumentCache::query_page(const SourceDescriptor& source,
                                   const std::optional<PageCursor>& after,
                                   int limit) const {
    FeedPage page;
    if (limit <= 0) {
        page.next_cursor = after;
        page.has_more = true;
        return page;
    }

    std::shared_lock lock(mtx_);
    auto coll = collections_.find(source.collection);
    if (coll == collections_.end()) return page;

    auto key_of = [&](const CachedDocument& d) -> json {
        if (source.order_by.empty() || !d.fields.contains(source.order_by)) return nullptr;
        return d.fields.at(source.order_by);
    };
    // Strict ordering over (key, id), flipped for descending sources.
    auto before = [&](const json& ka, const std::string& ia, const json& kb, const std::string& ib) {
        bool less = ka < kb || (ka == kb && ia < ib);
        bool greater = kb < ka || (ka == kb && ib < ia);
        return source.descending ? greater : less;
    };

    std::vector<const CachedDocument*> docs;
    docs.reserve(coll->second.size());
    for (const auto& [id, doc] : coll->second) docs.push_back(&doc);
    std::sort(docs.begin(), docs.end(), [&](const CachedDocument* a, const CachedDocument* b) {
        return before(key_of(*a), a->id, key_of(*b), b->id);
    });

    auto it = docs.begin();
    if (after) {
        it = std::find_if(docs.begin(), docs.end(), [&](const CachedDocument* d) {
            return before(after->order_value, after->doc_id, key_of(*d), d->id);
        });
    }

    for (; it != docs.end() && static_cast<int>(page.items.size()) < limit; ++it) {
        page.items.push_back(FeedItem{(*it)->id, (*it)->fields, source.id});
    }
    page.has_more = it != docs.end();
    if (!page.items.empty()) {
        const auto* last = *std::prev(it);
        page.next_cursor = PageCursor{key_of(*last), last->id};
    } else {
        page.next_cursor = after;
    }
    return page;
}

} // namespace feed_sync
