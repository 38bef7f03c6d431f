/**
 * @file events.hpp
 * @brief Notifications published by the orchestrator
 *
 * NAMING CONVENTION:
 * Events are past-tense: JobsUpdatedEvent, ActivityClearedEvent
 *
 * All events carry snapshots by value; handlers may keep them.
 */

#pragma once

#include "cloudsync/jobs/types.hpp"

#include <vector>

namespace cloudsync::events {

/**
 * @brief Full job list after any job changed
 *
 * WHO EMITS:
 * - Orchestrator on CRUD, run start/finish, stop, diff check
 * - Telemetry pipeline (throttled to about 5/s per job)
 */
struct JobsUpdatedEvent {
    std::vector<jobs::Job> jobs;
};

/**
 * @brief A single activity entry was recorded
 */
struct ActivityLoggedEvent {
    jobs::ActivityEntry entry;
};

struct ActivityClearedEvent {};

/**
 * @brief Storage quota snapshot was refreshed
 */
struct StatsUpdatedEvent {
    jobs::SyncStats stats;
};

/**
 * @brief Connectivity monitor saw an online/offline transition
 */
struct ConnectivityChangedEvent {
    bool online = true;
};

} // namespace cloudsync::events
