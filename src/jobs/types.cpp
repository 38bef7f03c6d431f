#include "cloudsync/jobs/types.hpp"

namespace cloudsync::jobs {

const char* to_string(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Idle: return "idle";
        case JobStatus::Running: return "running";
        case JobStatus::Error: return "error";
        case JobStatus::Success: return "success";
    }
    return "idle";
}

const char* to_string(DiffStatus status) noexcept {
    switch (status) {
        case DiffStatus::Unknown: return "unknown";
        case DiffStatus::Synced: return "synced";
        case DiffStatus::Different: return "different";
        case DiffStatus::Checking: return "checking";
        case DiffStatus::Error: return "error";
    }
    return "unknown";
}

const char* to_string(ActivityType type) noexcept {
    switch (type) {
        case ActivityType::Info: return "info";
        case ActivityType::Warning: return "warning";
        case ActivityType::Error: return "error";
        case ActivityType::Success: return "success";
        case ActivityType::Progress: return "progress";
    }
    return "info";
}

JobStatus job_status_from_string(const std::string& text) {
    if (text == "running") return JobStatus::Running;
    if (text == "error") return JobStatus::Error;
    if (text == "success") return JobStatus::Success;
    return JobStatus::Idle;
}

DiffStatus diff_status_from_string(const std::string& text) {
    if (text == "synced") return DiffStatus::Synced;
    if (text == "different") return DiffStatus::Different;
    if (text == "checking") return DiffStatus::Checking;
    if (text == "error") return DiffStatus::Error;
    return DiffStatus::Unknown;
}

ActivityType activity_type_from_string(const std::string& text) {
    if (text == "warning") return ActivityType::Warning;
    if (text == "error") return ActivityType::Error;
    if (text == "success") return ActivityType::Success;
    if (text == "progress") return ActivityType::Progress;
    return ActivityType::Info;
}

} // namespace cloudsync::jobs
