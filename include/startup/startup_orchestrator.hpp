#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "startup/startup_task.hpp"

namespace feed_sync {

struct TaskOutcome {
    std::string id;
    StartupPhase phase = StartupPhase::BestEffort;
    bool succeeded = false;
    int attempts = 0;
    std::string error;
    double duration_ms = 0.0;
};

struct StartupReport {
    bool ok = true;          // false only when a critical task gave up
    std::string failed_task;
    std::vector<TaskOutcome> tasks;

    const TaskOutcome* find(const std::string& id) const;
    nlohmann::json to_json() const;
};

/**
 * Runs startup tasks in three phases: critical (in order, retried),
 * best-effort (in order, each isolated), then background (own threads).
 * Only a critical failure is reported as a failed startup.
 */
class StartupOrchestrator {
public:
    static constexpr int kCriticalAttempts = 3;

    StartupOrchestrator(std::shared_ptr<const ServiceRegistry> services,
                        std::vector<StartupTask> tasks,
                        int critical_attempts = kCriticalAttempts);
    ~StartupOrchestrator();

    StartupOrchestrator(const StartupOrchestrator&) = delete;
    StartupOrchestrator& operator=(const StartupOrchestrator&) = delete;

    StartupReport run();

    // Joins background tasks; their outcomes are available afterwards.
    void wait_for_background();
    std::vector<TaskOutcome> background_outcomes() const;

private:
    TaskOutcome run_once(const StartupTask& task) const;
    bool run_critical(StartupReport& report);
    void run_best_effort(StartupReport& report);
    void start_background();

    std::shared_ptr<const ServiceRegistry> services_;
    std::vector<StartupTask> tasks_;
    int critical_attempts_;

    mutable std::mutex bg_mtx_;
    std::vector<TaskOutcome> bg_outcomes_;
    std::vector<std::thread> bg_threads_;
};

} // namespace feed_sync
