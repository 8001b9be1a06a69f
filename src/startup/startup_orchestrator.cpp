#include "startup/startup_orchestrator.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace feed_sync {

const char* to_string(StartupPhase phase) {
    switch (phase) {
        case StartupPhase::Critical: return "critical";
        case StartupPhase::BestEffort: return "best_effort";
        case StartupPhase::Background: return "background";
    }
    return "unknown";
}

const TaskOutcome* StartupReport::find(const std::string& id) const {
    for (const auto& t : tasks) {
        if (t.id == id) return &t;
    }
    return nullptr;
}

nlohmann::json StartupReport::to_json() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& t : tasks) {
        list.push_back({
            {"id", t.id},
            {"phase", to_string(t.phase)},
            {"succeeded", t.succeeded},
            {"attempts", t.attempts},
            {"error", t.error},
            {"duration_ms", t.duration_ms}
        });
    }
    return {{"ok", ok}, {"failed_task", failed_task}, {"tasks", list}};
}

StartupOrchestrator::StartupOrchestrator(std::shared_ptr<const ServiceRegistry> services,
                                         std::vector<StartupTask> tasks,
                                         int critical_attempts)
    : services_(std::move(services)),
      tasks_(std::move(tasks)),
      critical_attempts_(critical_attempts < 1 ? 1 : critical_attempts) {}

StartupOrchestrator::~StartupOrchestrator() {
    wait_for_background();
}

// Single attempt inside its own failure boundary.
TaskOutcome StartupOrchestrator::run_once(const StartupTask& task) const {
    TaskOutcome outcome;
    outcome.id = task.id;
    outcome.phase = task.phase;
    outcome.attempts = 1;

    auto start = std::chrono::high_resolution_clock::now();
    try {
        if (!task.execute) {
            outcome.error = "task has no body";
        } else {
            outcome.succeeded = task.execute(*services_);
            if (!outcome.succeeded) outcome.error = "task reported failure";
        }
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }
    auto end = std::chrono::high_resolution_clock::now();
    outcome.duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return outcome;
}

bool StartupOrchestrator::run_critical(StartupReport& report) {
    for (const auto& task : tasks_) {
        if (task.phase != StartupPhase::Critical) continue;

        TaskOutcome outcome;
        int attempt = 0;
        double total_ms = 0.0;
        for (attempt = 1; attempt <= critical_attempts_; ++attempt) {
            outcome = run_once(task);
            total_ms += outcome.duration_ms;
            if (outcome.succeeded) break;
            if (attempt < critical_attempts_) {
                spdlog::error("STARTUP: Critical task {} failed (attempt {}): {}", task.id, attempt, outcome.error);
            }
        }
        outcome.attempts = outcome.succeeded ? attempt : critical_attempts_;
        outcome.duration_ms = total_ms;
        report.tasks.push_back(outcome);

        if (!outcome.succeeded) {
            spdlog::critical("🚨 STARTUP: Critical task {} failed after {} attempts: {}",
                             task.id, critical_attempts_, outcome.error);
            report.ok = false;
            report.failed_task = task.id;
            return false;
        }
        spdlog::debug("STARTUP: Critical task completed: {}", task.id);
    }
    return true;
}

void StartupOrchestrator::run_best_effort(StartupReport& report) {
    for (const auto& task : tasks_) {
        if (task.phase != StartupPhase::BestEffort) continue;
        auto outcome = run_once(task);
        if (outcome.succeeded) {
            spdlog::debug("STARTUP: Best effort task completed: {} ({:.1f} ms)", task.id, outcome.duration_ms);
        } else {
            spdlog::error("STARTUP: Best effort task failed: {} - {}", task.id, outcome.error);
        }
        report.tasks.push_back(outcome);
    }
}

void StartupOrchestrator::start_background() {
    for (const auto& task : tasks_) {
        if (task.phase != StartupPhase::Background) continue;
        bg_threads_.emplace_back([this, task]() {
            auto outcome = run_once(task);
            if (outcome.succeeded) spdlog::debug("STARTUP: Background task completed: {}", task.id);
            else spdlog::error("STARTUP: Background task failed: {} - {}", task.id, outcome.error);
            std::lock_guard<std::mutex> lock(bg_mtx_);
            bg_outcomes_.push_back(outcome);
        });
    }
}

StartupReport StartupOrchestrator::run() {
    StartupReport report;
    auto start = std::chrono::high_resolution_clock::now();

    spdlog::info("🚀 STARTUP: Running critical tasks...");
    if (!run_critical(report)) return report;

    spdlog::info("STARTUP: Running best effort and background tasks...");
    run_best_effort(report);
    start_background();

    auto end = std::chrono::high_resolution_clock::now();
    spdlog::info("✅ STARTUP: Sequence completed in {:.1f} ms",
                 std::chrono::duration<double, std::milli>(end - start).count());
    return report;
}

void StartupOrchestrator::wait_for_background() {
    for (auto& t : bg_threads_) {
        if (t.joinable()) t.join();
    }
    bg_threads_.clear();
}

std::vector<TaskOutcome> StartupOrchestrator::background_outcomes() const {
    std::lock_guard<std::mutex> lock(bg_mtx_);
    return bg_outcomes_;
}

} // namespace feed_sync
