#include "cloudsync/jobs/json.hpp"

namespace cloudsync::jobs {
using json = nlohmann::json;

namespace {

void put_time(json& j, const char* key, const std::optional<Timestamp>& tp) {
    if (tp) {
        j[key] = to_iso8601(*tp);
    }
}

std::optional<Timestamp> get_time(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) {
        return std::nullopt;
    }
    auto parsed = parse_iso8601(j.at(key).get<std::string>());
    if (parsed.is_error()) {
        return std::nullopt;
    }
    return parsed.value();
}

template<typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template<typename T>
std::optional<T> get_optional(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

// The tool reports some counters as floats; accept either form.
std::uint64_t get_count(const json& j, const char* key) {
    if (!j.contains(key)) {
        return 0;
    }
    const auto& value = j.at(key);
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_number()) {
        const double d = value.get<double>();
        return d > 0 ? static_cast<std::uint64_t>(d) : 0;
    }
    return 0;
}

double get_number(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_number()) {
        return 0.0;
    }
    return j.at(key).get<double>();
}

} // namespace

void to_json(json& j, const TransferItem& item) {
    j = json{
        {"name", item.name},
        {"size", item.size},
        {"bytes", item.bytes},
        {"percentage", item.percentage},
        {"speed", item.speed},
        {"speedAvg", item.speed_avg},
        {"eta", item.eta}
    };
}

void from_json(const json& j, TransferItem& item) {
    item.name = j.value("name", std::string{});
    item.size = get_count(j, "size");
    item.bytes = get_count(j, "bytes");
    item.percentage = get_number(j, "percentage");
    item.speed = get_number(j, "speed");
    item.speed_avg = get_number(j, "speedAvg");
    item.eta = get_number(j, "eta");
}

void to_json(json& j, const JobAnalytics& analytics) {
    j = json{
        {"successCount", analytics.success_count},
        {"errorCount", analytics.error_count},
        {"totalBytes", analytics.total_bytes},
        {"avgSpeed", analytics.avg_speed}
    };
}

void from_json(const json& j, JobAnalytics& analytics) {
    analytics.success_count = get_count(j, "successCount");
    analytics.error_count = get_count(j, "errorCount");
    analytics.total_bytes = get_count(j, "totalBytes");
    analytics.avg_speed = get_number(j, "avgSpeed");
}

void to_json(json& j, const Job& job) {
    j = json{
        {"id", job.id},
        {"name", job.name},
        {"source", job.source},
        {"destination", job.destination},
        {"intervalMinutes", job.interval_minutes},
        {"concurrency", job.concurrency},
        {"timeout", job.timeout_seconds},
        {"retries", job.retries},
        {"status", to_string(job.status)},
        {"lastError", job.last_error ? json(*job.last_error) : json(nullptr)},
        {"progress", job.progress},
        {"bytesTransferred", job.bytes_transferred},
        {"totalBytes", job.total_bytes},
        {"filesTransferred", job.files_transferred},
        {"totalFiles", job.total_files},
        {"speed", job.speed},
        {"lastSpeed", job.last_speed},
        {"eta", job.eta},
        {"currentFileSize", job.current_file_size},
        {"currentFileBytes", job.current_file_bytes},
        {"transferring", job.transferring},
        {"diffStatus", to_string(job.diff_status)}
    };
    put_time(j, "lastRun", job.last_run);
    put_time(j, "nextRun", job.next_run);
    put_time(j, "startedAt", job.started_at);
    put_time(j, "lastDiffCheck", job.last_diff_check);
    put_optional(j, "currentFile", job.current_file);
    put_optional(j, "pendingChanges", job.pending_changes);
    if (job.analytics) {
        j["analytics"] = *job.analytics;
    }
}

void from_json(const json& j, Job& job) {
    job.id = j.value("id", std::string{});
    job.name = j.value("name", std::string{});
    job.source = j.value("source", std::string{});
    job.destination = j.value("destination", std::string{});
    job.interval_minutes = j.value("intervalMinutes", 60);
    job.concurrency = j.value("concurrency", 8);
    job.timeout_seconds = j.value("timeout", 30);
    job.retries = j.value("retries", 10);
    job.status = job_status_from_string(j.value("status", std::string{"idle"}));
    job.last_error = get_optional<std::string>(j, "lastError");
    job.last_run = get_time(j, "lastRun");
    job.next_run = get_time(j, "nextRun");
    job.started_at = get_time(j, "startedAt");
    job.progress = get_number(j, "progress");
    job.bytes_transferred = get_count(j, "bytesTransferred");
    job.total_bytes = get_count(j, "totalBytes");
    job.files_transferred = get_count(j, "filesTransferred");
    job.total_files = get_count(j, "totalFiles");
    job.speed = get_number(j, "speed");
    job.last_speed = get_number(j, "lastSpeed");
    job.eta = j.value("eta", std::string{});
    job.current_file = get_optional<std::string>(j, "currentFile");
    job.current_file_size = get_count(j, "currentFileSize");
    job.current_file_bytes = get_count(j, "currentFileBytes");
    job.transferring.clear();
    if (j.contains("transferring") && j.at("transferring").is_array()) {
        job.transferring = j.at("transferring").get<std::vector<TransferItem>>();
    }
    job.diff_status = diff_status_from_string(j.value("diffStatus", std::string{"unknown"}));
    job.last_diff_check = get_time(j, "lastDiffCheck");
    job.pending_changes = get_optional<int>(j, "pendingChanges");
    job.analytics.reset();
}

void to_json(json& j, const ActivityDetails& details) {
    j = json::object();
    put_optional(j, "progress", details.progress);
    put_optional(j, "speed", details.speed);
    put_optional(j, "bytesTransferred", details.bytes_transferred);
    put_optional(j, "filesTransferred", details.files_transferred);
    put_optional(j, "eta", details.eta);
    put_optional(j, "fileName", details.file_name);
    put_optional(j, "fileSize", details.file_size);
    put_optional(j, "totalBytes", details.total_bytes);
}

void from_json(const json& j, ActivityDetails& details) {
    details.progress = get_optional<double>(j, "progress");
    details.speed = get_optional<double>(j, "speed");
    details.bytes_transferred = get_optional<std::uint64_t>(j, "bytesTransferred");
    details.files_transferred = get_optional<std::uint64_t>(j, "filesTransferred");
    details.eta = get_optional<std::string>(j, "eta");
    details.file_name = get_optional<std::string>(j, "fileName");
    details.file_size = get_optional<std::uint64_t>(j, "fileSize");
    details.total_bytes = get_optional<std::uint64_t>(j, "totalBytes");
}

void to_json(json& j, const ActivityEntry& entry) {
    j = json{
        {"id", entry.id},
        {"timestamp", to_iso8601(entry.timestamp)},
        {"type", to_string(entry.type)},
        {"jobId", entry.job_id},
        {"jobName", entry.job_name},
        {"message", entry.message}
    };
    if (entry.details) {
        j["details"] = *entry.details;
    }
}

void from_json(const json& j, ActivityEntry& entry) {
    entry.id = j.value("id", std::string{});
    entry.timestamp = get_time(j, "timestamp").value_or(Timestamp{});
    entry.type = activity_type_from_string(j.value("type", std::string{"info"}));
    entry.job_id = j.value("jobId", std::string{});
    entry.job_name = j.value("jobName", std::string{});
    entry.message = j.value("message", std::string{});
    entry.details.reset();
    if (j.contains("details") && j.at("details").is_object()) {
        entry.details = j.at("details").get<ActivityDetails>();
    }
}

void to_json(json& j, const StorageQuota& quota) {
    j = json{
        {"total", quota.total},
        {"used", quota.used},
        {"free", quota.free},
        {"percent", quota.percent}
    };
}

void to_json(json& j, const SyncStats& stats) {
    j = json{
        {"speed", stats.speed},
        {"bytes", stats.bytes},
        {"transfers", stats.transfers},
        {"activeJobs", stats.active_jobs}
    };
    if (stats.storage) {
        j["storage"] = *stats.storage;
    }
}

} // namespace cloudsync::jobs
