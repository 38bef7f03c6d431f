/**
 * @file components.hpp
 * @brief Event consumers that ship with the engine
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * // Every engine notification now shows up in the log
 */

#pragma once

#include "cloudsync/events/event_bus.hpp"
#include "cloudsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace cloudsync::events {

/**
 * @brief Mirrors engine notifications to spdlog
 *
 * Activity entries are logged at the level matching their type; progress
 * entries and job-list snapshots only at debug.
 *
 * Subscriptions are scoped, so it may be shorter-lived than the bus.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus, std::shared_ptr<spdlog::logger> logger = nullptr)
        : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
        subscriptions_.push_back(bus.subscribe_scoped<JobsUpdatedEvent>(
            [this](const JobsUpdatedEvent& e) { on_jobs_updated(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<ActivityLoggedEvent>(
            [this](const ActivityLoggedEvent& e) { on_activity(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<ActivityClearedEvent>(
            [this](const ActivityClearedEvent&) { logger_->info("[ActivityCleared]"); }));
        subscriptions_.push_back(bus.subscribe_scoped<StatsUpdatedEvent>(
            [this](const StatsUpdatedEvent& e) { on_stats(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<ConnectivityChangedEvent>(
            [this](const ConnectivityChangedEvent& e) {
                logger_->info("[Connectivity] {}", e.online ? "online" : "offline");
            }));
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_jobs_updated(const JobsUpdatedEvent& e) {
        size_t running = 0;
        for (const auto& job : e.jobs) {
            if (job.status == jobs::JobStatus::Running) {
                ++running;
            }
        }
        logger_->debug("[JobsUpdated] jobs={} running={}", e.jobs.size(), running);
    }

    void on_activity(const ActivityLoggedEvent& e) {
        const auto& entry = e.entry;
        switch (entry.type) {
            case jobs::ActivityType::Error:
                logger_->error("[{}] {}", entry.job_name, entry.message);
                break;
            case jobs::ActivityType::Warning:
                logger_->warn("[{}] {}", entry.job_name, entry.message);
                break;
            case jobs::ActivityType::Progress:
                logger_->debug("[{}] {}", entry.job_name, entry.message);
                break;
            case jobs::ActivityType::Info:
            case jobs::ActivityType::Success:
                logger_->info("[{}] {}", entry.job_name, entry.message);
                break;
        }
    }

    void on_stats(const StatsUpdatedEvent& e) {
        if (!e.stats.storage) {
            logger_->debug("[StatsUpdated] active_jobs={}", e.stats.active_jobs);
            return;
        }
        const auto& quota = *e.stats.storage;
        logger_->info("[StorageStats] used={} total={} ({}%)", quota.used, quota.total, quota.percent);
    }

    std::shared_ptr<spdlog::logger> logger_;
    std::vector<Subscription> subscriptions_;
};

} // namespace cloudsync::events
