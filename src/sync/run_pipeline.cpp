#include "cloudsync/sync/orchestrator.hpp"

#include "cloudsync/core/format.hpp"
#include "cloudsync/process/rclone.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace cloudsync::sync {

namespace {

jobs::ActivityDetails progress_details(const jobs::Job& job) {
    jobs::ActivityDetails details;
    details.progress = job.progress;
    details.speed = job.speed;
    details.bytes_transferred = job.bytes_transferred;
    details.files_transferred = job.files_transferred;
    if (!job.eta.empty()) {
        details.eta = job.eta;
    }
    if (job.current_file) {
        details.file_name = job.current_file;
        details.file_size = job.current_file_size;
    }
    details.total_bytes = job.total_bytes;
    return details;
}

std::string progress_message(const jobs::Job& job) {
    if (job.current_file) {
        return "Syncing: " + *job.current_file;
    }
    return "Transferred " + std::to_string(job.files_transferred) + " files...";
}

} // namespace

void Orchestrator::execute(const std::string& id, process::RunToken token) {
    auto snapshot = job(id);
    if (!snapshot) {
        registry_.release(id, token);
        return;
    }

    if (snapshot->source.empty() || snapshot->destination.empty()) {
        fail_run(id, token, "Source and destination are required");
        return;
    }
    if (process::is_local_path(snapshot->source)) {
        std::error_code ec;
        if (!std::filesystem::exists(snapshot->source, ec)) {
            fail_run(id, token, "Source path does not exist: " + snapshot->source);
            return;
        }
    }

    auto remote = process::remote_name(snapshot->destination);
    if (!remote) {
        begin_sync(id, token);
        return;
    }

    probe_remote(*remote, [this, id, token, name = *remote](bool reachable) {
        if (abandon_if_stopping(id, token)) {
            return;
        }
        if (!reachable) {
            fail_run(id, token, "Remote \"" + name + "\" is not reachable or not configured.");
            return;
        }
        prepare_destination(id, token);
    });
}

void Orchestrator::prepare_destination(const std::string& id, process::RunToken token) {
    auto snapshot = job(id);
    if (!snapshot) {
        registry_.release(id, token);
        return;
    }

    process::ProcessRequest request{config_.rclone.binary, process::mkdir_args(snapshot->destination)};
    request.timeout = config_.rclone.command_timeout;
    launcher_.launch(std::move(request), {}, [this, id, token](Result<process::ProcessResult> made) {
        if (made.is_error()) {
            logger_->debug("mkdir for {} failed (might already exist): {}", id, made.error().message);
        }
        if (abandon_if_stopping(id, token)) {
            return;
        }
        begin_sync(id, token);
    });
}

void Orchestrator::begin_sync(const std::string& id, process::RunToken token) {
    jobs::Job snapshot;
    {
        std::lock_guard lock(mutex_);
        auto* job = find_locked(id);
        if (!job || registry_.is_stopping(id)) {
            registry_.release(id, token);
            return;
        }
        job->status = jobs::JobStatus::Running;
        job->progress = 0.0;
        job->last_error.reset();
        job->bytes_transferred = 0;
        job->total_bytes = 0;
        job->files_transferred = 0;
        job->total_files = 0;
        job->speed = 0.0;
        job->eta.clear();
        job->current_file.reset();
        job->current_file_size = 0;
        job->current_file_bytes = 0;
        job->transferring.clear();
        job->started_at = Clock::now();
        save_locked();
        snapshot = *job;
    }
    parser_.reset(id);
    throttle_.reset(id);

    record_activity(jobs::ActivityType::Info, id, snapshot.name,
                    "Starting sync: " + snapshot.source + " → " + snapshot.destination);
    publish_jobs();

    process::ProcessRequest request{config_.rclone.binary, process::sync_args(snapshot, config_.rclone)};

    auto stderr_lines = std::make_shared<telemetry::LineAssembler>();
    auto stdout_lines = std::make_shared<telemetry::LineAssembler>();
    process::ProcessCallbacks callbacks;
    callbacks.on_spawn = [this, id, token](std::shared_ptr<process::ProcessHandle> handle) {
        if (!registry_.attach(id, token, handle)) {
            logger_->info("Job {} was stopped before its process started, terminating", id);
            handle->terminate();
        }
    };
    callbacks.on_stderr = [this, id, stderr_lines](std::string_view chunk) {
        on_output(id, *stderr_lines, chunk);
    };
    callbacks.on_stdout = [this, id, stdout_lines](std::string_view chunk) {
        on_output(id, *stdout_lines, chunk);
    };

    logger_->debug("Launching {} for job {}", config_.rclone.binary, id);
    launcher_.launch(std::move(request), std::move(callbacks),
        [this, id, token](Result<process::ProcessResult> outcome) {
            finish_sync(id, token, std::move(outcome));
        });
}

void Orchestrator::on_output(const std::string& id, telemetry::LineAssembler& assembler,
                             std::string_view chunk) {
    auto lines = assembler.feed(chunk);
    if (lines.empty()) {
        return;
    }

    bool applied = false;
    {
        std::lock_guard lock(mutex_);
        auto* job = find_locked(id);
        if (!job || job->status != jobs::JobStatus::Running) {
            return;
        }
        for (const auto& line : lines) {
            if (parser_.apply_line(*job, line)) {
                applied = true;
            } else {
                logger_->debug("[{}] {}", id, line);
            }
        }
    }

    if (applied && throttle_.should_emit(id)) {
        emit_progress(id);
    }
}

void Orchestrator::emit_progress(const std::string& id) {
    auto snapshot = job(id);
    if (!snapshot) {
        return;
    }
    publish_jobs();
    record_activity(jobs::ActivityType::Progress, id, snapshot->name,
                    progress_message(*snapshot), progress_details(*snapshot));
}

void Orchestrator::finish_sync(const std::string& id, process::RunToken token,
                               Result<process::ProcessResult> outcome) {
    bool cancelled = outcome.is_error() && outcome.error().code == ErrorCode::Cancelled;
    if (cancelled || registry_.is_stopping(id)) {
        // stop_job/remove_job/shutdown already finalised the job
        logger_->debug("Run of {} ended after cancellation", id);
        registry_.release(id, token);
        parser_.reset(id);
        throttle_.reset(id);
        return;
    }

    if (outcome.is_error()) {
        fail_run(id, token, outcome.error().message);
        return;
    }

    std::string name;
    std::uint64_t bytes = 0;
    double final_speed = 0.0;
    std::int64_t seconds = 0;
    {
        std::lock_guard lock(mutex_);
        auto* job = find_locked(id);
        if (!job) {
            registry_.release(id, token);
            return;
        }
        auto now = Clock::now();
        final_speed = job->speed;
        bytes = job->bytes_transferred;
        if (job->started_at) {
            seconds = std::chrono::duration_cast<std::chrono::seconds>(now - *job->started_at).count();
        }
        job->status = jobs::JobStatus::Success;
        job->last_run = now;
        job->next_run = now + std::chrono::minutes(job->interval_minutes);
        job->progress = 100.0;
        job->speed = 0.0;
        job->eta.clear();
        job->transferring.clear();
        job->current_file.reset();
        name = job->name;
        save_locked();
    }
    registry_.release(id, token);
    parser_.reset(id);
    throttle_.reset(id);

    analytics_.record(id, jobs::RunOutcome::Success, bytes, final_speed);
    record_activity(jobs::ActivityType::Success, id, name,
                    "Sync completed in " + format_duration(seconds) + ". Transferred " + format_bytes(bytes));
    publish_jobs();
}

void Orchestrator::fail_run(const std::string& id, process::RunToken token, const std::string& message) {
    std::string name = id;
    {
        std::lock_guard lock(mutex_);
        auto* job = find_locked(id);
        if (!job) {
            registry_.release(id, token);
            return;
        }
        job->status = jobs::JobStatus::Error;
        job->last_error = message;
        job->speed = 0.0;
        job->transferring.clear();
        job->current_file.reset();
        name = job->name;
        save_locked();
    }
    registry_.release(id, token);
    parser_.reset(id);
    throttle_.reset(id);

    analytics_.record(id, jobs::RunOutcome::Error, 0, 0.0);
    record_activity(jobs::ActivityType::Error, id, name, "Sync failed: " + message);
    publish_jobs();
}

bool Orchestrator::abandon_if_stopping(const std::string& id, process::RunToken token) {
    if (!registry_.is_stopping(id)) {
        return false;
    }
    registry_.release(id, token);
    return true;
}

void Orchestrator::probe_remote(const std::string& remote, std::function<void(bool)> on_done) {
    process::ProcessRequest request{config_.rclone.binary, process::probe_args(remote)};
    request.timeout = config_.rclone.probe_timeout;
    launcher_.launch(std::move(request), {},
        [this, remote, on_done = std::move(on_done)](Result<process::ProcessResult> result) {
            if (result.is_error()) {
                logger_->warn("Remote {} is not reachable: {}", remote, result.error().message);
            }
            on_done(result.is_ok());
        });
}

bool Orchestrator::check_diff(const std::string& id, DiffCallback on_done) {
    jobs::Job snapshot;
    {
        std::lock_guard lock(mutex_);
        auto* job = find_locked(id);
        if (!job || registry_.is_busy(id) || job->status == jobs::JobStatus::Running ||
            job->diff_status == jobs::DiffStatus::Checking) {
            return false;
        }
        job->diff_status = jobs::DiffStatus::Checking;
        save_locked();
        snapshot = *job;
    }
    publish_jobs();
    logger_->info("Performing diff check for {} ({})", snapshot.name, id);

    process::ProcessRequest request{config_.rclone.binary, process::check_args(snapshot), {0, 1}};
    request.timeout = config_.rclone.command_timeout;
    launcher_.launch(std::move(request), {},
        [this, id, on_done = std::move(on_done)](Result<process::ProcessResult> result) {
            jobs::DiffStatus status = jobs::DiffStatus::Error;
            {
                std::lock_guard lock(mutex_);
                auto* job = find_locked(id);
                if (!job) {
                    return;
                }
                if (result.is_ok() && result.value().exit_code == 0) {
                    job->diff_status = jobs::DiffStatus::Synced;
                    job->pending_changes = 0;
                } else if (result.is_ok() && result.value().exit_code == 1) {
                    job->diff_status = jobs::DiffStatus::Different;
                    job->pending_changes = 1;
                } else {
                    job->diff_status = jobs::DiffStatus::Error;
                }
                job->last_diff_check = Clock::now();
                status = job->diff_status;
                save_locked();
            }
            if (result.is_error()) {
                logger_->warn("Diff check for {} failed: {}", id, result.error().message);
            }
            publish_jobs();
            if (on_done) {
                on_done(status);
            }
        });
    return true;
}

} // namespace cloudsync::sync
