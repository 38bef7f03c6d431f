#include "cloudsync/telemetry/telemetry_parser.hpp"

#include "cloudsync/core/format.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>

namespace cloudsync::telemetry {
using json = nlohmann::json;

namespace {

double number(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return 0.0;
    }
    return it->get<double>();
}

std::uint64_t count(const json& obj, const char* key) {
    double value = number(obj, key);
    return value > 0 ? static_cast<std::uint64_t>(value) : 0;
}

jobs::TransferItem to_transfer_item(const json& item) {
    jobs::TransferItem transfer;
    if (auto it = item.find("name"); it != item.end() && it->is_string()) {
        transfer.name = it->get<std::string>();
    }
    transfer.size = count(item, "size");
    transfer.bytes = count(item, "bytes");
    transfer.percentage = number(item, "percentage");
    transfer.speed = number(item, "speed");
    transfer.speed_avg = number(item, "speedAvg");
    transfer.eta = number(item, "eta");
    return transfer;
}

} // namespace

double SpeedSmoother::sample(const std::string& job_id, std::uint64_t bytes,
                             double current, SteadyClock::time_point now) {
    std::lock_guard lock(mutex_);
    auto it = samples_.find(job_id);
    if (it == samples_.end()) {
        samples_[job_id] = Sample{now, bytes};
        return 0.0;
    }

    auto& previous = it->second;
    auto elapsed = now - previous.at;
    if (elapsed < kMinSampleSpacing) {
        return current;
    }

    double seconds = std::chrono::duration<double>(elapsed).count();
    double delta = bytes > previous.bytes ? static_cast<double>(bytes - previous.bytes) : 0.0;
    double rate = std::min(delta / seconds, kMaxPlausibleSpeed);
    double speed = current * kHistoryWeight + rate * kSampleWeight;

    previous = Sample{now, bytes};
    return speed < kIdleFloor ? 0.0 : speed;
}

void SpeedSmoother::reset(const std::string& job_id) {
    std::lock_guard lock(mutex_);
    samples_.erase(job_id);
}

bool TelemetryParser::apply_line(jobs::Job& job, const std::string& line,
                                 SteadyClock::time_point now) {
    auto doc = json::parse(line, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return false;
    }
    auto stats_it = doc.find("stats");
    if (stats_it == doc.end() || !stats_it->is_object()) {
        return false;
    }
    const auto& stats = *stats_it;

    job.bytes_transferred = count(stats, "bytes");
    job.total_bytes = count(stats, "totalBytes");
    job.files_transferred = count(stats, "transfers");
    job.total_files = count(stats, "totalTransfers");

    job.speed = smoother_.sample(job.id, job.bytes_transferred, job.speed, now);
    job.last_speed = job.speed;

    if (job.total_bytes > 0) {
        job.progress = std::round(static_cast<double>(job.bytes_transferred) /
                                  static_cast<double>(job.total_bytes) * 100.0);
    } else if (job.total_files > 0) {
        job.progress = std::round(static_cast<double>(job.files_transferred) /
                                  static_cast<double>(job.total_files) * 100.0);
    } else {
        job.progress = 0.0;
    }

    double eta = number(stats, "eta");
    if (eta > 0) {
        job.eta = format_duration(static_cast<std::int64_t>(std::llround(eta)));
    }

    job.transferring.clear();
    auto transferring = stats.find("transferring");
    if (transferring != stats.end() && transferring->is_array()) {
        for (const auto& item : *transferring) {
            if (item.is_object()) {
                job.transferring.push_back(to_transfer_item(item));
            }
        }
    }

    if (job.transferring.empty()) {
        job.current_file.reset();
        job.current_file_size = 0;
        job.current_file_bytes = 0;
    } else {
        const auto& first = job.transferring.front();
        job.current_file = first.name;
        job.current_file_size = first.size;
        job.current_file_bytes = first.bytes;
    }
    return true;
}

bool ProgressThrottle::should_emit(const std::string& job_id, SteadyClock::time_point now) {
    std::lock_guard lock(mutex_);
    auto it = last_emit_.find(job_id);
    if (it != last_emit_.end() && now - it->second < interval_) {
        return false;
    }
    last_emit_[job_id] = now;
    return true;
}

void ProgressThrottle::reset(const std::string& job_id) {
    std::lock_guard lock(mutex_);
    last_emit_.erase(job_id);
}

} // namespace cloudsync::telemetry
