#pragma once
#include <functional>
#include <string>
#include "startup/service_registry.hpp"

namespace feed_sync {

enum class StartupPhase { Critical, BestEffort, Background };

const char* to_string(StartupPhase phase);

// A task succeeds by returning true. False or an exception is a failure.
struct StartupTask {
    std::string id;
    StartupPhase phase = StartupPhase::BestEffort;
    std::function<bool(const ServiceRegistry&)> execute;
};

} // namespace feed_sync
