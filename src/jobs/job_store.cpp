#include "cloudsync/jobs/job_store.hpp"

#include "cloudsync/core/file_io.hpp"
#include "cloudsync/jobs/json.hpp"

#include <spdlog/spdlog.h>

namespace cloudsync::jobs {
using json = nlohmann::json;

JobStore::JobStore(std::filesystem::path path, std::shared_ptr<spdlog::logger> logger)
    : path_(std::move(path)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

std::vector<Job> JobStore::load() const {
    std::vector<Job> jobs;
    if (path_.empty()) {
        return jobs;
    }

    auto content = read_file(path_);
    if (content.is_error()) {
        if (content.error().code != ErrorCode::NotFound) {
            logger_->error("Failed to load jobs: {}", content.error().message);
        }
        return jobs;
    }

    auto doc = json::parse(content.value(), nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        logger_->error("Failed to load jobs: {} is not a JSON array", path_.string());
        return jobs;
    }

    for (const auto& item : doc) {
        if (!item.is_object()) {
            continue;
        }
        try {
            Job job = item.get<Job>();
            if (job.id.empty()) {
                logger_->warn("Skipping stored job without id");
                continue;
            }
            if (job.status == JobStatus::Running) {
                job.status = JobStatus::Idle;
                job.speed = 0.0;
            }
            if (job.diff_status == DiffStatus::Checking) {
                job.diff_status = DiffStatus::Unknown;
            }
            jobs.push_back(std::move(job));
        } catch (const json::exception& e) {
            logger_->warn("Skipping malformed job record: {}", e.what());
        }
    }

    logger_->info("Loaded {} jobs from disk", jobs.size());
    return jobs;
}

Result<void> JobStore::save(const std::vector<Job>& jobs) const {
    if (path_.empty()) {
        return Ok();
    }

    json doc = json::array();
    for (const auto& job : jobs) {
        json item = job;
        item.erase("analytics");
        doc.push_back(std::move(item));
    }

    std::lock_guard lock(write_mutex_);
    auto written = write_file_atomic(path_, doc.dump(2));
    if (written.is_error()) {
        logger_->error("Failed to save jobs: {}", written.error().message);
    }
    return written;
}

} // namespace cloudsync::jobs
