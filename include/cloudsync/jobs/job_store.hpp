#pragma once

/**
 * @file job_store.hpp
 * @brief Durable job list
 *
 * WHY THIS FILE EXISTS:
 * Job definitions and their last-known status must survive restarts.
 * The Orchestrator owns the live Job records; this store only reads
 * them back at startup and rewrites the whole file on every mutation.
 *
 * DESIGN DECISIONS:
 * - Full overwrite, not append: a few hundred jobs at most
 * - Write failures are reported but never fatal; the in-memory list
 *   stays authoritative for the lifetime of the process
 * - A job persisted as "running" is loaded as "idle": its process
 *   did not survive the restart
 *
 * FILE SHAPE:
 * [ { "id": "1760688000000", "name": "Docs", "source": "/home/me/docs",
 *     "destination": "remote1:backup", "intervalMinutes": 60, ... } ]
 */

#include "cloudsync/core/result.hpp"
#include "cloudsync/jobs/types.hpp"

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace cloudsync::jobs {

class JobStore {
public:
    /**
     * @param path     jobs file; empty keeps the store memory-only
     * @param logger   destination for load/save diagnostics
     */
    explicit JobStore(std::filesystem::path path,
                      std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Read the persisted list
     *
     * A missing file is an empty list. A corrupt file is logged and also
     * yields an empty list so the engine can still start.
     */
    std::vector<Job> load() const;

    /**
     * @brief Overwrite the file with @p jobs
     *
     * The analytics snapshot on each job is not written; analytics have
     * their own file.
     */
    Result<void> save(const std::vector<Job>& jobs) const;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex write_mutex_;
};

} // namespace cloudsync::jobs
