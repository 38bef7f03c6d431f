#include "cloudsync/sync/orchestrator.hpp"

#include "cloudsync/events/events.hpp"
#include "cloudsync/process/rclone.hpp"

#include <boost/asio/dispatch.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace cloudsync::sync {

namespace {

constexpr const char* kSystemJobId = "system";
constexpr const char* kSystemJobName = "System";

Result<void> validate_spec(const jobs::JobSpec& spec) {
    if (spec.interval_minutes && *spec.interval_minutes < 1) {
        return Err<void>(ErrorCode::InvalidArgument, "intervalMinutes must be at least 1");
    }
    if (spec.concurrency && *spec.concurrency < 1) {
        return Err<void>(ErrorCode::InvalidArgument, "concurrency must be at least 1");
    }
    if (spec.timeout_seconds && *spec.timeout_seconds < 1) {
        return Err<void>(ErrorCode::InvalidArgument, "timeout must be at least 1 second");
    }
    if (spec.retries && *spec.retries < 0) {
        return Err<void>(ErrorCode::InvalidArgument, "retries must not be negative");
    }
    return Ok();
}

Timestamp next_run_after(const jobs::Job& job, Timestamp now) {
    return job.last_run.value_or(now) + std::chrono::minutes(job.interval_minutes);
}

} // namespace

Orchestrator::Orchestrator(asio::io_context& io_context,
                           Config config,
                           events::EventBus& bus,
                           process::ProcessLauncher& launcher,
                           std::shared_ptr<spdlog::logger> logger)
    : io_context_(io_context),
      config_(std::move(config)),
      bus_(bus),
      launcher_(launcher),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      job_store_(config_.jobs_file(), logger_),
      activity_(config_.activity_file(), config_.max_log_entries, logger_),
      analytics_(config_.analytics_file(), logger_),
      throttle_(config_.progress_interval),
      connectivity_(io_context, config_.connectivity_host, config_.connectivity_interval,
                    [this](bool online) { on_connectivity_changed(online); }, logger_),
      scheduler_(io_context, config_.scheduler_interval,
                 [this](PassKind pass) { run_pass(pass); }, logger_),
      storage_strand_(asio::make_strand(io_context)),
      storage_timer_(storage_strand_) {
    jobs_ = job_store_.load();
    activity_.load();
    analytics_.load();
    logger_->debug("Loaded {} activity entries", activity_.size());
}

void Orchestrator::start() {
    {
        std::lock_guard lock(mutex_);
        for (auto& job : jobs_) {
            job.next_run = due_time(job);
        }
        save_locked();
    }

    logger_->info("Orchestrator started (trigger policy: {})", to_string(config_.trigger_policy));
    connectivity_.start();
    scheduler_.start();
    refresh_storage_stats();
    asio::dispatch(storage_strand_, [this]() {
        storage_timer_stopped_ = false;
        arm_storage_refresh();
    });

    logger_->info("System startup: triggering immediate sync for all jobs");
    run_pass(PassKind::Boot);
}

void Orchestrator::shutdown() {
    if (shutting_down_.exchange(true)) {
        return;
    }
    logger_->info("Orchestrator shutting down...");

    scheduler_.stop();
    connectivity_.stop();
    asio::dispatch(storage_strand_, [this]() {
        storage_timer_stopped_ = true;
        storage_timer_.cancel();
    });

    auto busy = registry_.busy_jobs();
    for (const auto& id : busy) {
        auto handle = registry_.begin_stop(id);
        if (handle && *handle) {
            (*handle)->terminate();
        }
    }
    if (!busy.empty()) {
        logger_->info("Waiting for {} job(s) to stop", busy.size());
    }

    if (!registry_.wait_until_empty(config_.shutdown_grace)) {
        auto remaining = registry_.handles();
        logger_->warn("{} process(es) ignored SIGTERM, killing", remaining.size());
        for (auto& handle : remaining) {
            handle->kill();
        }
        if (!registry_.wait_until_empty(config_.shutdown_grace)) {
            logger_->error("Processes still running after forced kill");
        }
    }

    {
        std::lock_guard lock(mutex_);
        for (auto& job : jobs_) {
            if (job.status == jobs::JobStatus::Running) {
                job.status = jobs::JobStatus::Idle;
                job.progress = 0.0;
                job.speed = 0.0;
            }
        }
        save_locked();
    }
    logger_->info("Orchestrator shutdown complete");
}

// ── Job CRUD ───────────────────────────────────────────────

Result<jobs::Job> Orchestrator::add_job(const jobs::JobSpec& spec) {
    auto valid = validate_spec(spec);
    if (valid.is_error()) {
        return Err<jobs::Job>(valid.error());
    }

    jobs::Job created;
    {
        std::lock_guard lock(mutex_);
        if (spec.id && !spec.id->empty()) {
            if (find_locked(*spec.id)) {
                return Err<jobs::Job>(ErrorCode::AlreadyExists, "Job " + *spec.id + " already exists");
            }
            created.id = *spec.id;
        } else {
            created.id = generate_id_locked();
        }

        created.name = spec.name && !spec.name->empty() ? *spec.name : "Unnamed Job";
        created.source = spec.source.value_or("");
        created.destination = spec.destination.value_or("");
        created.interval_minutes = spec.interval_minutes.value_or(created.interval_minutes);
        created.concurrency = spec.concurrency.value_or(created.concurrency);
        created.timeout_seconds = spec.timeout_seconds.value_or(created.timeout_seconds);
        created.retries = spec.retries.value_or(created.retries);
        created.next_run = Clock::now() + std::chrono::minutes(created.interval_minutes);

        jobs_.push_back(created);
        save_locked();
    }

    record_activity(jobs::ActivityType::Info, created.id, created.name,
                    "Job \"" + created.name + "\" created");
    publish_jobs();
    return Ok(created);
}

Result<jobs::Job> Orchestrator::update_job(const std::string& id, const jobs::JobSpec& spec) {
    auto valid = validate_spec(spec);
    if (valid.is_error()) {
        return Err<jobs::Job>(valid.error());
    }

    jobs::Job updated;
    {
        std::lock_guard lock(mutex_);
        auto* job = find_locked(id);
        if (!job) {
            return Err<jobs::Job>(ErrorCode::NotFound, "Job " + id + " not found");
        }
        if (spec.name) job->name = *spec.name;
        if (spec.source) job->source = *spec.source;
        if (spec.destination) job->destination = *spec.destination;
        if (spec.concurrency) job->concurrency = *spec.concurrency;
        if (spec.timeout_seconds) job->timeout_seconds = *spec.timeout_seconds;
        if (spec.retries) job->retries = *spec.retries;
        if (spec.interval_minutes && *spec.interval_minutes != job->interval_minutes) {
            job->interval_minutes = *spec.interval_minutes;
            job->next_run = next_run_after(*job, Clock::now());
        }
        save_locked();
        updated = snapshot_of(*job);
    }

    record_activity(jobs::ActivityType::Info, updated.id, updated.name,
                    "Job \"" + updated.name + "\" updated");
    publish_jobs();
    return Ok(updated);
}

bool Orchestrator::remove_job(const std::string& id) {
    if (!job(id)) {
        return false;
    }

    stop_job(id);

    std::string name;
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(jobs_.begin(), jobs_.end(),
                               [&id](const jobs::Job& j) { return j.id == id; });
        if (it == jobs_.end()) {
            return false;
        }
        name = it->name;
        jobs_.erase(it);
        save_locked();
    }

    analytics_.remove(id);
    parser_.reset(id);
    throttle_.reset(id);

    record_activity(jobs::ActivityType::Info, id, name, "Job \"" + name + "\" deleted");
    publish_jobs();
    return true;
}

// ── Control ────────────────────────────────────────────────

bool Orchestrator::run_now(const std::string& id) {
    if (shutting_down_) {
        return false;
    }
    auto token = registry_.claim(id);
    if (!token) {
        return false;
    }
    if (!job(id)) {
        registry_.release(id, *token);
        return false;
    }
    execute(id, *token);
    return true;
}

bool Orchestrator::stop_job(const std::string& id) {
    auto handle = registry_.begin_stop(id);
    if (!handle) {
        return false;
    }

    std::string name;
    {
        std::lock_guard lock(mutex_);
        if (auto* job = find_locked(id)) {
            job->status = jobs::JobStatus::Idle;
            job->progress = 0.0;
            job->speed = 0.0;
            job->transferring.clear();
            job->current_file.reset();
            name = job->name;
            save_locked();
        }
    }

    if (*handle) {
        logger_->info("Sending SIGTERM to {} (pid {})", id, (*handle)->pid());
        (*handle)->terminate();
    }

    record_activity(jobs::ActivityType::Warning, id, name, "Job \"" + name + "\" stopped by user");
    publish_jobs();
    return true;
}

void Orchestrator::run_pass(PassKind pass) {
    if (shutting_down_) {
        return;
    }
    if (!online()) {
        logger_->debug("Scheduler pass skipped: offline");
        return;
    }

    auto snapshot = jobs();
    auto busy_list = registry_.busy_jobs();
    std::unordered_set<std::string> busy(busy_list.begin(), busy_list.end());
    auto steps = plan(snapshot, busy, Clock::now(), config_.trigger_policy, pass);

    for (const auto& step : steps) {
        auto it = std::find_if(snapshot.begin(), snapshot.end(),
                               [&step](const jobs::Job& j) { return j.id == step.job_id; });
        const std::string& name = it != snapshot.end() ? it->name : step.job_id;

        if (step.action == PlannedAction::Check) {
            check_diff(step.job_id, [this, id = step.job_id](jobs::DiffStatus status) {
                if (status == jobs::DiffStatus::Different && online()) {
                    logger_->info("Job {} has pending changes, syncing early", id);
                    run_now(id);
                }
            });
            continue;
        }

        if (pass == PassKind::Tick) {
            record_activity(jobs::ActivityType::Info, step.job_id, name,
                            "Recurring sync cycle reached. Verifying integrity...");
        }
        run_now(step.job_id);
    }
}

// ── Queries ────────────────────────────────────────────────

std::vector<jobs::Job> Orchestrator::jobs() const {
    std::lock_guard lock(mutex_);
    std::vector<jobs::Job> result;
    result.reserve(jobs_.size());
    for (const auto& job : jobs_) {
        result.push_back(snapshot_of(job));
    }
    return result;
}

std::optional<jobs::Job> Orchestrator::job(const std::string& id) const {
    std::lock_guard lock(mutex_);
    const auto* found = find_locked(id);
    if (!found) {
        return std::nullopt;
    }
    return snapshot_of(*found);
}

std::vector<jobs::ActivityEntry> Orchestrator::activity_log(std::size_t limit) const {
    return activity_.recent(limit);
}

void Orchestrator::clear_activity_log() {
    activity_.clear();
    bus_.emit(events::ActivityClearedEvent{});
}

jobs::SyncStats Orchestrator::stats() const {
    jobs::SyncStats stats;
    std::lock_guard lock(mutex_);
    for (const auto& job : jobs_) {
        if (job.status != jobs::JobStatus::Running) {
            continue;
        }
        stats.speed += job.speed;
        stats.bytes += job.bytes_transferred;
        stats.transfers += job.files_transferred;
    }
    stats.active_jobs = registry_.running_count();
    stats.storage = storage_;
    return stats;
}

void Orchestrator::refresh_storage_stats() {
    process::ProcessRequest request{config_.rclone.binary, process::listremotes_args()};
    request.timeout = config_.rclone.probe_timeout;

    launcher_.launch(std::move(request), {}, [this](Result<process::ProcessResult> listed) {
        if (listed.is_error()) {
            logger_->warn("Failed to fetch storage stats: {}", listed.error().message);
            return;
        }
        auto remotes = process::parse_remotes(listed.value().stdout_text);
        if (remotes.empty()) {
            logger_->debug("No remotes configured, skipping storage stats");
            return;
        }
        auto preferred = std::find_if(remotes.begin(), remotes.end(),
            [this](const jobs::RemoteInfo& r) { return r.name == config_.storage_remote; });
        std::string target = preferred != remotes.end() ? preferred->name : remotes.front().name;

        process::ProcessRequest about{config_.rclone.binary, process::about_args(target)};
        about.timeout = config_.rclone.command_timeout;
        launcher_.launch(std::move(about), {}, [this, target](Result<process::ProcessResult> result) {
            if (result.is_error()) {
                logger_->warn("Failed to fetch storage stats for {}: {}", target, result.error().message);
                return;
            }
            auto quota = process::parse_about(result.value().stdout_text);
            if (quota.is_error()) {
                logger_->warn("Failed to fetch storage stats for {}: {}", target, quota.error().message);
                return;
            }
            {
                std::lock_guard lock(mutex_);
                storage_ = quota.value();
            }
            bus_.emit(events::StatsUpdatedEvent{stats()});
        });
    });
}

void Orchestrator::list_remotes(RemotesCallback on_done) {
    process::ProcessRequest request{config_.rclone.binary, process::listremotes_args()};
    request.timeout = config_.rclone.probe_timeout;

    launcher_.launch(std::move(request), {},
        [this, on_done = std::move(on_done)](Result<process::ProcessResult> result) mutable {
            if (result.is_ok()) {
                on_done(Ok(process::parse_remotes(result.value().stdout_text)));
                return;
            }

            // Older tool versions lack --long
            logger_->debug("listremotes --long failed ({}), retrying without", result.error().message);
            process::ProcessRequest plain{config_.rclone.binary, {"listremotes"}};
            plain.timeout = config_.rclone.probe_timeout;
            launcher_.launch(std::move(plain), {},
                [this, on_done = std::move(on_done)](Result<process::ProcessResult> retry) {
                    if (retry.is_error()) {
                        logger_->error("Failed to list remotes: {}", retry.error().message);
                        on_done(Err<std::vector<jobs::RemoteInfo>>(retry.error()));
                        return;
                    }
                    on_done(Ok(process::parse_remotes(retry.value().stdout_text)));
                });
        });
}

void Orchestrator::test_connection(const std::string& remote, ConnectionCallback on_done) {
    probe_remote(remote, [remote, on_done = std::move(on_done)](bool reachable) {
        if (reachable) {
            on_done(Ok());
        } else {
            on_done(Err<void>(ErrorCode::Unreachable, "Connection to " + remote + " failed"));
        }
    });
}

// ── Connectivity / timers ──────────────────────────────────

void Orchestrator::on_connectivity_changed(bool online) {
    bus_.emit(events::ConnectivityChangedEvent{online});

    if (!online) {
        record_activity(jobs::ActivityType::Warning, kSystemJobId, kSystemJobName,
                        "Network connectivity lost. Scheduled syncs are paused.");
        return;
    }

    std::size_t rearmed = 0;
    {
        std::lock_guard lock(mutex_);
        for (auto& job : jobs_) {
            if (job.status == jobs::JobStatus::Error) {
                job.status = jobs::JobStatus::Idle;
                ++rearmed;
            }
        }
        if (rearmed > 0) {
            save_locked();
        }
    }

    record_activity(jobs::ActivityType::Info, kSystemJobId, kSystemJobName,
                    "Network connectivity restored. Resuming scheduled syncs.");
    if (rearmed > 0) {
        logger_->info("Re-armed {} job(s) parked in error", rearmed);
    }
    publish_jobs();
    run_pass(PassKind::Boot);
}

void Orchestrator::arm_storage_refresh() {
    storage_timer_.expires_after(config_.storage_refresh_interval);
    storage_timer_.async_wait([this](boost::system::error_code ec) {
        if (ec || storage_timer_stopped_) {
            return;
        }
        refresh_storage_stats();
        arm_storage_refresh();
    });
}

// ── Helpers ────────────────────────────────────────────────

jobs::Job* Orchestrator::find_locked(const std::string& id) {
    auto it = std::find_if(jobs_.begin(), jobs_.end(),
                           [&id](const jobs::Job& j) { return j.id == id; });
    return it != jobs_.end() ? &*it : nullptr;
}

const jobs::Job* Orchestrator::find_locked(const std::string& id) const {
    auto it = std::find_if(jobs_.begin(), jobs_.end(),
                           [&id](const jobs::Job& j) { return j.id == id; });
    return it != jobs_.end() ? &*it : nullptr;
}

std::string Orchestrator::generate_id_locked() const {
    std::string base = std::to_string(to_epoch_millis(Clock::now()));
    std::string candidate = base;
    for (int suffix = 1; find_locked(candidate); ++suffix) {
        candidate = base + "-" + std::to_string(suffix);
    }
    return candidate;
}

void Orchestrator::save_locked() {
    // Failures are logged by the store; memory stays authoritative
    auto saved = job_store_.save(jobs_);
    (void)saved;
}

jobs::Job Orchestrator::snapshot_of(const jobs::Job& job) const {
    jobs::Job copy = job;
    copy.analytics = analytics_.get(job.id);
    return copy;
}

void Orchestrator::record_activity(jobs::ActivityType type, const std::string& job_id,
                                   const std::string& job_name, const std::string& message,
                                   std::optional<jobs::ActivityDetails> details) {
    auto entry = activity_.append(type, job_id, job_name, message, std::move(details));
    bus_.emit(events::ActivityLoggedEvent{std::move(entry)});
}

void Orchestrator::publish_jobs() {
    bus_.emit(events::JobsUpdatedEvent{jobs()});
}

} // namespace cloudsync::sync
