/**
 * @file orchestrator.hpp
 * @brief Single entry point for job management and execution
 *
 * WHY THIS FILE EXISTS:
 * Every consumer (daemon, HTTP layer, tests) drives the engine through
 * this facade. It owns the job list and wires together persistence,
 * process supervision, telemetry, scheduling and connectivity tracking.
 *
 * RUN PIPELINE (per job):
 *   claim slot -> local preconditions -> reachability probe (remote
 *   destination) -> best-effort mkdir -> status running -> spawn ->
 *   stream telemetry -> success | error | cancelled
 *
 * A precondition failure never spawns the transfer. A cancelled run
 * (stop, remove, shutdown) is finalised by the path that cancelled it;
 * the completion only releases the slot.
 *
 * THREAD SAFETY:
 * All public members may be called from any thread. Job state is
 * guarded by one mutex; it is never held while launching a process,
 * signalling one, or emitting an event.
 *
 * LIFETIME:
 * Timer and process handlers capture `this`. Call shutdown(), then stop
 * and join the io_context before destroying the orchestrator.
 */

#pragma once

#include "cloudsync/core/config.hpp"
#include "cloudsync/core/result.hpp"
#include "cloudsync/events/event_bus.hpp"
#include "cloudsync/jobs/activity_log.hpp"
#include "cloudsync/jobs/analytics.hpp"
#include "cloudsync/jobs/job_store.hpp"
#include "cloudsync/jobs/types.hpp"
#include "cloudsync/process/process.hpp"
#include "cloudsync/process/process_registry.hpp"
#include "cloudsync/sync/connectivity.hpp"
#include "cloudsync/sync/scheduler.hpp"
#include "cloudsync/telemetry/line_assembler.hpp"
#include "cloudsync/telemetry/telemetry_parser.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/logger.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cloudsync::sync {

class Orchestrator {
public:
    using DiffCallback = std::function<void(jobs::DiffStatus)>;
    using RemotesCallback = std::function<void(Result<std::vector<jobs::RemoteInfo>>)>;
    using ConnectionCallback = std::function<void(Result<void>)>;

    /**
     * @brief Load persisted jobs, activity and analytics
     *
     * Nothing runs until start() is called.
     */
    Orchestrator(asio::io_context& io_context,
                 Config config,
                 events::EventBus& bus,
                 process::ProcessLauncher& launcher,
                 std::shared_ptr<spdlog::logger> logger = nullptr);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Start timers and fire the boot pass
     *
     * Recomputes nextRun for every job, starts the connectivity monitor,
     * the scheduler tick and the storage-quota refresh, then runs every
     * idle job once.
     */
    void start();

    /**
     * @brief Cancel all runs and stop timers
     *
     * Sends SIGTERM to every supervised process, waits up to
     * shutdown_grace, SIGKILLs what is left and waits again. Blocks; the
     * io_context must keep running on another thread meanwhile.
     */
    void shutdown();

    // ── Job CRUD ───────────────────────────────────────────

    /**
     * @brief Create a job from @p spec; absent fields take defaults
     *
     * ERRORS:
     * - InvalidArgument: interval/concurrency/timeout < 1, retries < 0
     * - AlreadyExists:   @p spec.id names an existing job
     */
    Result<jobs::Job> add_job(const jobs::JobSpec& spec);

    /**
     * @brief Merge the set fields of @p spec into job @p id
     *
     * ERRORS: NotFound, InvalidArgument
     */
    Result<jobs::Job> update_job(const std::string& id, const jobs::JobSpec& spec);

    /// Stops the job first if it is running; false if @p id is unknown
    bool remove_job(const std::string& id);

    // ── Control ────────────────────────────────────────────

    /**
     * @brief Start a run now, regardless of interval or connectivity
     *
     * @return false if the job is unknown or already has a run in flight
     */
    bool run_now(const std::string& id);

    /**
     * @brief Cancel the run in flight; the job returns to idle
     *
     * @return false if nothing was running
     */
    bool stop_job(const std::string& id);

    /**
     * @brief One-way comparison of source against destination
     *
     * @return false if the job is unknown, busy, or already being checked
     */
    bool check_diff(const std::string& id, DiffCallback on_done = nullptr);

    /// One scheduler pass; ticks are skipped while offline
    void run_pass(PassKind pass);

    // ── Queries ────────────────────────────────────────────

    std::vector<jobs::Job> jobs() const;
    std::optional<jobs::Job> job(const std::string& id) const;
    std::vector<jobs::ActivityEntry> activity_log(std::size_t limit = jobs::ActivityLog::kDefaultQueryLimit) const;
    void clear_activity_log();
    jobs::SyncStats stats() const;

    void refresh_storage_stats();
    void list_remotes(RemotesCallback on_done);
    void test_connection(const std::string& remote, ConnectionCallback on_done);

    bool online() const noexcept { return connectivity_.online(); }
    ConnectivityMonitor& connectivity() noexcept { return connectivity_; }
    const process::ProcessRegistry& registry() const noexcept { return registry_; }

private:
    // Run pipeline (run_pipeline.cpp)
    void execute(const std::string& id, process::RunToken token);
    void prepare_destination(const std::string& id, process::RunToken token);
    void begin_sync(const std::string& id, process::RunToken token);
    void on_output(const std::string& id, telemetry::LineAssembler& assembler, std::string_view chunk);
    void emit_progress(const std::string& id);
    void finish_sync(const std::string& id, process::RunToken token, Result<process::ProcessResult> outcome);
    void fail_run(const std::string& id, process::RunToken token, const std::string& message);
    bool abandon_if_stopping(const std::string& id, process::RunToken token);
    void probe_remote(const std::string& remote, std::function<void(bool)> on_done);

    void on_connectivity_changed(bool online);
    void arm_storage_refresh();

    jobs::Job* find_locked(const std::string& id);
    const jobs::Job* find_locked(const std::string& id) const;
    std::string generate_id_locked() const;
    void save_locked();
    jobs::Job snapshot_of(const jobs::Job& job) const;

    void record_activity(jobs::ActivityType type, const std::string& job_id,
                         const std::string& job_name, const std::string& message,
                         std::optional<jobs::ActivityDetails> details = std::nullopt);
    void publish_jobs();

    asio::io_context& io_context_;
    Config config_;
    events::EventBus& bus_;
    process::ProcessLauncher& launcher_;
    std::shared_ptr<spdlog::logger> logger_;

    jobs::JobStore job_store_;
    jobs::ActivityLog activity_;
    jobs::AnalyticsAggregator analytics_;
    process::ProcessRegistry registry_;
    telemetry::TelemetryParser parser_;
    telemetry::ProgressThrottle throttle_;

    ConnectivityMonitor connectivity_;
    Scheduler scheduler_;
    asio::strand<asio::io_context::executor_type> storage_strand_;
    asio::steady_timer storage_timer_;
    bool storage_timer_stopped_ = true;

    mutable std::mutex mutex_;
    std::vector<jobs::Job> jobs_;
    std::optional<jobs::StorageQuota> storage_;
    std::atomic<bool> shutting_down_{false};
};

} // namespace cloudsync::sync
