#pragma once

#include "cloudsync/jobs/types.hpp"

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace cloudsync::jobs {

enum class RunOutcome {
    Success,
    Error
};

/**
 * @brief Per-job rolling counters, persisted apart from job state
 *
 * Only job completion mutates a record. avg_speed is an exponential
 * moving average (0.7 old, 0.3 new) seeded by the first successful run.
 */
class AnalyticsAggregator {
public:
    explicit AnalyticsAggregator(std::filesystem::path path,
                                 std::shared_ptr<spdlog::logger> logger = nullptr);

    void load();

    /**
     * @brief Fold one finished run into the job's record and persist
     *
     * @param bytes  bytes moved by the run (ignored for errors)
     * @param speed  final smoothed speed of the run (ignored for errors)
     */
    JobAnalytics record(const std::string& job_id, RunOutcome outcome, std::uint64_t bytes, double speed);

    std::optional<JobAnalytics> get(const std::string& job_id) const;

    /// @return false if there was no record for @p job_id
    bool remove(const std::string& job_id);

    std::unordered_map<std::string, JobAnalytics> all() const;

private:
    void persist_locked() const;

    std::filesystem::path path_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, JobAnalytics> records_;
};

} // namespace cloudsync::jobs
