#pragma once

/**
 * @file process_registry.hpp
 * @brief At most one live transfer process per job
 *
 * A slot is claimed before any pre-flight work starts, so two concurrent
 * run requests for the same job cannot both reach the spawn step. The
 * claim token distinguishes the current run from a stale one whose
 * process outlived a stop.
 *
 * SLOT STATES:
 *   Starting  claimed, pre-flight in progress, no process yet
 *   Running   process attached
 *   Stopping  stop requested; slot is held until the process exits
 */

#include "cloudsync/process/process.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloudsync::process {

using RunToken = std::uint64_t;

class ProcessRegistry {
public:
    /// Fails (nullopt) if the job already holds a slot in any state
    std::optional<RunToken> claim(const std::string& job_id);

    /**
     * @brief Bind a spawned process to its claimed slot
     *
     * @return false if the slot was released or is stopping; the caller
     *         must then terminate @p handle itself
     */
    bool attach(const std::string& job_id, RunToken token, std::shared_ptr<ProcessHandle> handle);

    /**
     * @brief Mark the slot Stopping and hand back its process
     *
     * @return nullopt if the job holds no slot or is already stopping;
     *         a null pointer if the slot is still in pre-flight
     */
    std::optional<std::shared_ptr<ProcessHandle>> begin_stop(const std::string& job_id);

    /// Release the slot if @p token still owns it
    void release(const std::string& job_id, RunToken token);

    bool is_busy(const std::string& job_id) const;
    bool is_running(const std::string& job_id) const;
    bool is_stopping(const std::string& job_id) const;
    std::size_t running_count() const;
    std::vector<std::string> busy_jobs() const;
    std::vector<std::shared_ptr<ProcessHandle>> handles() const;

    /// Block until every slot is released or @p timeout elapses
    bool wait_until_empty(std::chrono::milliseconds timeout) const;

private:
    enum class SlotState { Starting, Running, Stopping };

    struct Slot {
        RunToken token = 0;
        SlotState state = SlotState::Starting;
        std::shared_ptr<ProcessHandle> handle;
    };

    mutable std::mutex mutex_;
    mutable std::condition_variable released_;
    std::unordered_map<std::string, Slot> slots_;
    RunToken next_token_ = 1;
};

} // namespace cloudsync::process
