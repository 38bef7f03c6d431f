#pragma once

/**
 * @file config.hpp
 * @brief Engine configuration
 *
 * Loaded from an optional JSON file, then overridden by environment
 * variables, then by command-line flags in the daemon. The resulting
 * value is handed to the Orchestrator at construction; nothing reads
 * configuration from global state.
 *
 * EXAMPLE FILE:
 * {
 *   "data_dir": "/var/lib/cloudsync",
 *   "scheduler_interval_seconds": 60,
 *   "trigger_policy": "interval",
 *   "rclone": { "binary": "/usr/bin/rclone", "stats_interval": "1s" }
 * }
 */

#include "cloudsync/core/result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace cloudsync {

/**
 * @brief When the scheduler decides a job should run
 *
 * Interval:       lastRun + interval has elapsed
 * IntervalOrDiff: as above, or a pre-flight check reports differences
 */
enum class TriggerPolicy {
    Interval,
    IntervalOrDiff
};

const char* to_string(TriggerPolicy policy) noexcept;
Result<TriggerPolicy> parse_trigger_policy(const std::string& text);

struct RcloneSettings {
    std::string binary = "rclone";
    std::chrono::seconds command_timeout{300};
    std::chrono::seconds probe_timeout{5};
    std::string stats_interval = "1s";
    std::vector<std::string> excludes{
        ".wrangler/**",
        "**/node_modules/**",
        "**/.git/**",
        "**/*.tmp"
    };
};

struct Config {
    std::filesystem::path data_dir = "data";

    std::chrono::seconds scheduler_interval{60};
    std::chrono::seconds connectivity_interval{30};
    std::string connectivity_host = "google.com";
    std::chrono::seconds storage_refresh_interval{300};
    std::string storage_remote = "backup";
    std::chrono::milliseconds progress_interval{200};
    std::chrono::seconds shutdown_grace{10};
    std::size_t max_log_entries = 1000;
    TriggerPolicy trigger_policy = TriggerPolicy::Interval;

    std::string log_level = "info";
    std::filesystem::path log_file;

    RcloneSettings rclone;

    std::filesystem::path jobs_file() const { return data_dir / "jobs.json"; }
    std::filesystem::path activity_file() const { return data_dir / "activity.json"; }
    std::filesystem::path analytics_file() const { return data_dir / "analytics.json"; }

    /**
     * @brief Read a JSON config file; keys absent from the file keep defaults
     */
    static Result<Config> load(const std::filesystem::path& path);

    static Result<Config> from_json(const nlohmann::json& doc);

    /**
     * @brief Apply CLOUDSYNC_DATA_DIR, RCLONE_TIMEOUT and LOG_LEVEL
     */
    Result<void> apply_environment();

    Result<void> validate() const;
};

} // namespace cloudsync
