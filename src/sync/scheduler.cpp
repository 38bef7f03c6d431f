#include "cloudsync/sync/scheduler.hpp"

#include <boost/asio/dispatch.hpp>
#include <spdlog/spdlog.h>

namespace cloudsync::sync {

Timestamp due_time(const jobs::Job& job) {
    Timestamp last = job.last_run.value_or(Timestamp{});
    return last + std::chrono::minutes(job.interval_minutes);
}

std::vector<PlannedStep> plan(const std::vector<jobs::Job>& jobs,
                              const std::unordered_set<std::string>& busy,
                              Timestamp now,
                              TriggerPolicy policy,
                              PassKind pass) {
    std::vector<PlannedStep> steps;
    for (const auto& job : jobs) {
        if (busy.count(job.id) != 0 ||
            job.status == jobs::JobStatus::Running ||
            job.diff_status == jobs::DiffStatus::Checking) {
            continue;
        }

        if (pass == PassKind::Boot || now >= due_time(job)) {
            steps.push_back({job.id, PlannedAction::Run});
        } else if (policy == TriggerPolicy::IntervalOrDiff) {
            steps.push_back({job.id, PlannedAction::Check});
        }
    }
    return steps;
}

Scheduler::Scheduler(asio::io_context& io_context,
                     std::chrono::milliseconds interval,
                     PassHandler on_pass,
                     std::shared_ptr<spdlog::logger> logger)
    : strand_(asio::make_strand(io_context)),
      timer_(strand_),
      interval_(interval),
      on_pass_(std::move(on_pass)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

void Scheduler::start() {
    asio::dispatch(strand_, [this]() {
        if (!stopped_) {
            return;
        }
        stopped_ = false;
        logger_->info("Scheduler started, tick every {}s",
                      std::chrono::duration_cast<std::chrono::seconds>(interval_).count());
        arm();
    });
}

void Scheduler::stop() {
    asio::dispatch(strand_, [this]() {
        stopped_ = true;
        timer_.cancel();
    });
}

void Scheduler::arm() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](boost::system::error_code ec) {
        if (ec || stopped_) {
            return;
        }
        if (on_pass_) {
            on_pass_(PassKind::Tick);
        }
        arm();
    });
}

} // namespace cloudsync::sync
