#include "cloudsync/jobs/analytics.hpp"

#include "cloudsync/core/file_io.hpp"
#include "cloudsync/jobs/json.hpp"

#include <spdlog/spdlog.h>

namespace cloudsync::jobs {
using json = nlohmann::json;

namespace {

constexpr double kHistoryWeight = 0.7;
constexpr double kSampleWeight = 0.3;

} // namespace

AnalyticsAggregator::AnalyticsAggregator(std::filesystem::path path, std::shared_ptr<spdlog::logger> logger)
    : path_(std::move(path)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

void AnalyticsAggregator::load() {
    if (path_.empty()) {
        return;
    }

    auto content = read_file(path_);
    if (content.is_error()) {
        if (content.error().code != ErrorCode::NotFound) {
            logger_->error("Failed to load analytics: {}", content.error().message);
        }
        return;
    }

    auto doc = json::parse(content.value(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        logger_->error("Failed to load analytics: {} is not a JSON object", path_.string());
        return;
    }

    std::unordered_map<std::string, JobAnalytics> loaded;
    for (const auto& [job_id, value] : doc.items()) {
        if (value.is_object()) {
            loaded[job_id] = value.get<JobAnalytics>();
        }
    }

    std::lock_guard lock(mutex_);
    records_ = std::move(loaded);
}

JobAnalytics AnalyticsAggregator::record(const std::string& job_id, RunOutcome outcome,
                                         std::uint64_t bytes, double speed) {
    std::lock_guard lock(mutex_);
    auto& stats = records_[job_id];
    if (outcome == RunOutcome::Success) {
        ++stats.success_count;
        stats.total_bytes += bytes;
        stats.avg_speed = stats.avg_speed == 0.0
            ? speed
            : stats.avg_speed * kHistoryWeight + speed * kSampleWeight;
    } else {
        ++stats.error_count;
    }
    persist_locked();
    return stats;
}

std::optional<JobAnalytics> AnalyticsAggregator::get(const std::string& job_id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(job_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool AnalyticsAggregator::remove(const std::string& job_id) {
    std::lock_guard lock(mutex_);
    if (records_.erase(job_id) == 0) {
        return false;
    }
    persist_locked();
    return true;
}

std::unordered_map<std::string, JobAnalytics> AnalyticsAggregator::all() const {
    std::lock_guard lock(mutex_);
    return records_;
}

void AnalyticsAggregator::persist_locked() const {
    if (path_.empty()) {
        return;
    }
    json doc = json::object();
    for (const auto& [job_id, stats] : records_) {
        doc[job_id] = stats;
    }
    auto written = write_file_atomic(path_, doc.dump(2));
    if (written.is_error()) {
        logger_->error("Failed to save analytics: {}", written.error().message);
    }
}

} // namespace cloudsync::jobs
