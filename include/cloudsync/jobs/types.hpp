#pragma once

/**
 * @file types.hpp
 * @brief Job, activity and analytics records
 *
 * A Job is a recurring source -> destination synchronization executed by
 * the external transfer tool. Its live progress fields are only
 * meaningful while status == Running, and keep the final values after
 * the run settles into Success or Error.
 *
 * STATUS TRANSITIONS:
 * Idle/Success/Error -> Running    (run started, preconditions passed)
 * Running -> Success                (tool exited with an allowed code)
 * Running -> Error                  (non-zero exit, spawn or I/O failure)
 * Running -> Idle                   (stopped by the user)
 * Idle/Success -> Error             (precondition failure, no process spawned)
 * Error -> Idle                     (connectivity restored)
 */

#include "cloudsync/core/time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cloudsync::jobs {

enum class JobStatus {
    Idle,
    Running,
    Error,
    Success
};

/**
 * @brief Result of the last pre-flight comparison
 *
 * Unknown means no check has completed since the job was created.
 */
enum class DiffStatus {
    Unknown,
    Synced,
    Different,
    Checking,
    Error
};

const char* to_string(JobStatus status) noexcept;
const char* to_string(DiffStatus status) noexcept;
JobStatus job_status_from_string(const std::string& text);
DiffStatus diff_status_from_string(const std::string& text);

/**
 * @brief One in-flight transfer reported by the tool
 */
struct TransferItem {
    std::string name;
    std::uint64_t size = 0;
    std::uint64_t bytes = 0;
    double percentage = 0.0;
    double speed = 0.0;
    double speed_avg = 0.0;
    double eta = 0.0;
};

struct JobAnalytics {
    std::uint64_t success_count = 0;
    std::uint64_t error_count = 0;
    std::uint64_t total_bytes = 0;
    double avg_speed = 0.0;
};

struct Job {
    std::string id;
    std::string name;
    std::string source;
    std::string destination;
    int interval_minutes = 60;
    int concurrency = 8;
    int timeout_seconds = 30;
    int retries = 10;

    JobStatus status = JobStatus::Idle;
    std::optional<std::string> last_error;
    std::optional<Timestamp> last_run;
    std::optional<Timestamp> next_run;
    std::optional<Timestamp> started_at;

    // Live progress
    double progress = 0.0;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t files_transferred = 0;
    std::uint64_t total_files = 0;
    double speed = 0.0;                       ///< Smoothed bytes/second
    double last_speed = 0.0;                  ///< Last smoothed value, kept after the reset on finish
    std::string eta;
    std::optional<std::string> current_file;
    std::uint64_t current_file_size = 0;
    std::uint64_t current_file_bytes = 0;
    std::vector<TransferItem> transferring;

    // Pre-flight comparison
    DiffStatus diff_status = DiffStatus::Unknown;
    std::optional<Timestamp> last_diff_check;
    std::optional<int> pending_changes;       ///< 0 or 1, not a file count

    std::optional<JobAnalytics> analytics;    ///< Filled in on snapshots only
};

/**
 * @brief Field set for add_job / update_job; unset fields are left alone
 */
struct JobSpec {
    std::optional<std::string> id;
    std::optional<std::string> name;
    std::optional<std::string> source;
    std::optional<std::string> destination;
    std::optional<int> interval_minutes;
    std::optional<int> concurrency;
    std::optional<int> timeout_seconds;
    std::optional<int> retries;
};

enum class ActivityType {
    Info,
    Warning,
    Error,
    Success,
    Progress
};

const char* to_string(ActivityType type) noexcept;
ActivityType activity_type_from_string(const std::string& text);

struct ActivityDetails {
    std::optional<double> progress;
    std::optional<double> speed;
    std::optional<std::uint64_t> bytes_transferred;
    std::optional<std::uint64_t> files_transferred;
    std::optional<std::string> eta;
    std::optional<std::string> file_name;
    std::optional<std::uint64_t> file_size;
    std::optional<std::uint64_t> total_bytes;
};

struct ActivityEntry {
    std::string id;
    Timestamp timestamp{};
    ActivityType type = ActivityType::Info;
    std::string job_id;
    std::string job_name;
    std::string message;
    std::optional<ActivityDetails> details;
};

struct StorageQuota {
    std::uint64_t total = 0;
    std::uint64_t used = 0;
    std::uint64_t free = 0;
    int percent = 0;
};

/**
 * @brief Aggregate over the jobs that are running right now
 */
struct SyncStats {
    double speed = 0.0;
    std::uint64_t bytes = 0;
    std::uint64_t transfers = 0;
    std::size_t active_jobs = 0;
    std::optional<StorageQuota> storage;
};

struct RemoteInfo {
    std::string name;
    std::string type;
};

} // namespace cloudsync::jobs
