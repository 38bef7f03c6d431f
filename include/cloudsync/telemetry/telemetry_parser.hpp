#pragma once

/**
 * @file telemetry_parser.hpp
 * @brief Folds the transfer tool's JSON log lines into live job state
 *
 * Only records carrying a "stats" object are applied; every other line
 * (plain diagnostics, malformed JSON, unrelated records) is ignored and
 * never changes job status.
 *
 * SPEED SMOOTHING:
 * The reported instantaneous rate is too noisy to display. Instead the
 * parser measures the byte delta between samples at least kMinSampleSpacing
 * apart, clamps it at kMaxPlausibleSpeed and blends it in:
 *
 *     speed = 0.6 * previous + 0.4 * min(delta / dt, cap)
 *
 * Results below kIdleFloor are reported as exactly 0. The accumulators
 * live in a side table keyed by job id, not on the Job record.
 */

#include "cloudsync/jobs/types.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cloudsync::telemetry {

using SteadyClock = std::chrono::steady_clock;

class SpeedSmoother {
public:
    static constexpr std::chrono::milliseconds kMinSampleSpacing{2000};
    static constexpr double kMaxPlausibleSpeed = 125.0 * 1024 * 1024;
    static constexpr double kIdleFloor = 1024.0;
    static constexpr double kHistoryWeight = 0.6;
    static constexpr double kSampleWeight = 0.4;

    /**
     * @brief Feed one cumulative byte count
     *
     * @param current  speed currently shown for the job
     * @return the speed to show after this sample
     */
    double sample(const std::string& job_id, std::uint64_t bytes,
                  double current, SteadyClock::time_point now);

    void reset(const std::string& job_id);

private:
    struct Sample {
        SteadyClock::time_point at;
        std::uint64_t bytes = 0;
    };

    std::mutex mutex_;
    std::unordered_map<std::string, Sample> samples_;
};

class TelemetryParser {
public:
    /**
     * @brief Apply one line to @p job
     *
     * @return true if the line was a stats record and @p job changed
     */
    bool apply_line(jobs::Job& job, const std::string& line,
                    SteadyClock::time_point now = SteadyClock::now());

    /// Forget smoothing state; called when a run starts or ends
    void reset(const std::string& job_id) { smoother_.reset(job_id); }

private:
    SpeedSmoother smoother_;
};

/**
 * @brief At most one notification per job per interval
 */
class ProgressThrottle {
public:
    explicit ProgressThrottle(std::chrono::milliseconds interval = std::chrono::milliseconds(200))
        : interval_(interval) {}

    /// True if a notification may go out now; records it if so
    bool should_emit(const std::string& job_id, SteadyClock::time_point now = SteadyClock::now());

    void reset(const std::string& job_id);

private:
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::unordered_map<std::string, SteadyClock::time_point> last_emit_;
};

} // namespace cloudsync::telemetry
