#include "cloudsync/jobs/activity_log.hpp"

#include "cloudsync/core/file_io.hpp"
#include "cloudsync/jobs/json.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace cloudsync::jobs {
using json = nlohmann::json;

ActivityLog::ActivityLog(std::filesystem::path path,
                         std::size_t max_entries,
                         std::shared_ptr<spdlog::logger> logger)
    : path_(std::move(path)),
      max_entries_(max_entries == 0 ? kDefaultMaxEntries : max_entries),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      rng_(std::random_device{}()) {}

void ActivityLog::load() {
    if (path_.empty()) {
        return;
    }

    auto content = read_file(path_);
    if (content.is_error()) {
        if (content.error().code != ErrorCode::NotFound) {
            logger_->warn("Failed to load activity log: {}", content.error().message);
        }
        return;
    }

    auto doc = json::parse(content.value(), nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        logger_->warn("Ignoring activity log {}: not a JSON array", path_.string());
        return;
    }

    std::vector<ActivityEntry> loaded;
    loaded.reserve(doc.size());
    for (const auto& item : doc) {
        if (!item.is_object()) {
            continue;
        }
        try {
            loaded.push_back(item.get<ActivityEntry>());
        } catch (const json::exception& e) {
            logger_->debug("Skipping malformed activity entry: {}", e.what());
        }
    }

    std::stable_sort(loaded.begin(), loaded.end(), [](const ActivityEntry& lhs, const ActivityEntry& rhs) {
        return lhs.timestamp < rhs.timestamp;
    });
    if (loaded.size() > max_entries_) {
        loaded.erase(loaded.begin(), loaded.end() - static_cast<std::ptrdiff_t>(max_entries_));
    }

    std::lock_guard lock(mutex_);
    entries_.assign(std::make_move_iterator(loaded.begin()), std::make_move_iterator(loaded.end()));
}

ActivityEntry ActivityLog::append(ActivityType type,
                                  const std::string& job_id,
                                  const std::string& job_name,
                                  const std::string& message,
                                  std::optional<ActivityDetails> details) {
    std::lock_guard lock(mutex_);

    ActivityEntry entry;
    entry.timestamp = Clock::now();
    entry.id = next_id(entry.timestamp);
    entry.type = type;
    entry.job_id = job_id;
    entry.job_name = job_name;
    entry.message = message;
    entry.details = std::move(details);

    entries_.push_back(entry);
    while (entries_.size() > max_entries_) {
        entries_.pop_front();
    }

    persist_locked();
    return entry;
}

std::vector<ActivityEntry> ActivityLog::recent(std::size_t limit) const {
    std::lock_guard lock(mutex_);
    const auto count = std::min(limit, entries_.size());
    return std::vector<ActivityEntry>(entries_.rbegin(), entries_.rbegin() + static_cast<std::ptrdiff_t>(count));
}

void ActivityLog::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
    persist_locked();
}

std::size_t ActivityLog::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::string ActivityLog::next_id(Timestamp now) {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<int> pick(0, 35);

    std::string id = std::to_string(to_epoch_millis(now));
    id.push_back('-');
    for (int i = 0; i < 9; ++i) {
        id.push_back(kAlphabet[pick(rng_)]);
    }
    return id;
}

void ActivityLog::persist_locked() const {
    if (path_.empty()) {
        return;
    }
    json doc = json::array();
    for (const auto& entry : entries_) {
        doc.push_back(entry);
    }
    auto written = write_file_atomic(path_, doc.dump(2));
    if (written.is_error()) {
        logger_->warn("Failed to save activity log: {}", written.error().message);
    }
}

} // namespace cloudsync::jobs
