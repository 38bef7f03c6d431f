#pragma once

/**
 * @file activity_log.hpp
 * @brief Bounded, time-ordered ledger of human-readable job events
 *
 * Entries are kept oldest -> newest. Once the ledger grows past its
 * retention cap the oldest entries are evicted. Queries hand back
 * newest-first slices.
 *
 * THREAD SAFETY:
 * All members lock an internal mutex; safe to call from any thread.
 */

#include "cloudsync/core/result.hpp"
#include "cloudsync/jobs/types.hpp"

#include <spdlog/logger.h>

#include <cstddef>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace cloudsync::jobs {

class ActivityLog {
public:
    static constexpr std::size_t kDefaultMaxEntries = 1000;
    static constexpr std::size_t kDefaultQueryLimit = 100;

    explicit ActivityLog(std::filesystem::path path,
                         std::size_t max_entries = kDefaultMaxEntries,
                         std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Replace the in-memory ledger with the persisted one
     *
     * Loaded entries are sorted by timestamp and truncated to the cap.
     */
    void load();

    /**
     * @brief Record an entry, evict past the cap, persist
     *
     * @return The stored entry (with its generated id and timestamp)
     */
    ActivityEntry append(ActivityType type,
                         const std::string& job_id,
                         const std::string& job_name,
                         const std::string& message,
                         std::optional<ActivityDetails> details = std::nullopt);

    /**
     * @brief Newest-first slice of at most @p limit entries
     */
    std::vector<ActivityEntry> recent(std::size_t limit = kDefaultQueryLimit) const;

    void clear();

    std::size_t size() const;
    std::size_t max_entries() const noexcept { return max_entries_; }

private:
    std::string next_id(Timestamp now);
    void persist_locked() const;

    std::filesystem::path path_;
    std::size_t max_entries_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::deque<ActivityEntry> entries_;
    std::mt19937_64 rng_;
};

} // namespace cloudsync::jobs
