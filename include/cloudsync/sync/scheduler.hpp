#pragma once

/**
 * @file scheduler.hpp
 * @brief Decides which jobs run, and when the decision is taken
 *
 * The decision itself is a pure function over a job snapshot so that it
 * can be tested without timers. The Scheduler class only owns the
 * periodic tick and hands each pass to its owner.
 */

#include "cloudsync/core/config.hpp"
#include "cloudsync/core/time.hpp"
#include "cloudsync/jobs/types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/logger.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace cloudsync::sync {

namespace asio = boost::asio;

enum class PassKind {
    Tick,   ///< Periodic: only jobs whose interval has elapsed
    Boot    ///< Startup or connectivity recovery: every idle job
};

enum class PlannedAction {
    Run,
    Check   ///< Pre-flight comparison; a difference triggers a run
};

struct PlannedStep {
    std::string job_id;
    PlannedAction action = PlannedAction::Run;
};

/// lastRun (or the epoch when never run) + interval
Timestamp due_time(const jobs::Job& job);

/**
 * @brief Plan one scheduler pass
 *
 * Jobs that are busy (claimed in the process registry), running or
 * mid-check are never planned.
 */
std::vector<PlannedStep> plan(const std::vector<jobs::Job>& jobs,
                              const std::unordered_set<std::string>& busy,
                              Timestamp now,
                              TriggerPolicy policy,
                              PassKind pass);

/**
 * @brief Fixed-period tick on the io_context
 *
 * The first tick fires one interval after start(). Handlers run on a
 * private strand; stop() is safe from any thread.
 */
class Scheduler {
public:
    using PassHandler = std::function<void(PassKind)>;

    Scheduler(asio::io_context& io_context,
              std::chrono::milliseconds interval,
              PassHandler on_pass,
              std::shared_ptr<spdlog::logger> logger = nullptr);

    void start();
    void stop();

private:
    void arm();

    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;
    std::chrono::milliseconds interval_;
    PassHandler on_pass_;
    std::shared_ptr<spdlog::logger> logger_;
    bool stopped_ = true;
};

} // namespace cloudsync::sync
