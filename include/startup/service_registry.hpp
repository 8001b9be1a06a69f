#pragma once
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include "errors.hpp"

namespace feed_sync {

/**
 * Typed lookup of the process services. Filled once by the host before
 * startup; tasks only read from it.
 */
class ServiceRegistry {
public:
    template<typename T>
    void add(std::shared_ptr<T> service) {
        services_[std::type_index(typeid(T))] = std::move(service);
    }

    // nullptr when T was never registered.
    template<typename T>
    std::shared_ptr<T> get() const {
        auto it = services_.find(std::type_index(typeid(T)));
        if (it == services_.end()) return nullptr;
        return std::static_pointer_cast<T>(it->second);
    }

    template<typename T>
    std::shared_ptr<T> require() const {
        auto service = get<T>();
        if (!service) throw FeedSyncError(std::string("service not registered: ") + typeid(T).name());
        return service;
    }

    template<typename T>
    bool has() const { return services_.count(std::type_index(typeid(T))) > 0; }

    size_t size() const { return services_.size(); }

private:
    std::unordered_map<std::type_index, std::shared_ptr<void>> services_;
};

} // namespace feed_sync
