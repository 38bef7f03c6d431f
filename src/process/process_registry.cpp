#include "cloudsync/process/process_registry.hpp"

namespace cloudsync::process {

std::optional<RunToken> ProcessRegistry::claim(const std::string& job_id) {
    std::lock_guard lock(mutex_);
    if (slots_.count(job_id) != 0) {
        return std::nullopt;
    }
    RunToken token = next_token_++;
    slots_[job_id] = Slot{token, SlotState::Starting, nullptr};
    return token;
}

bool ProcessRegistry::attach(const std::string& job_id, RunToken token,
                             std::shared_ptr<ProcessHandle> handle) {
    std::lock_guard lock(mutex_);
    auto it = slots_.find(job_id);
    if (it == slots_.end() || it->second.token != token) {
        return false;
    }
    // Keep the handle even when stopping so shutdown can still kill it
    it->second.handle = std::move(handle);
    if (it->second.state == SlotState::Stopping) {
        return false;
    }
    it->second.state = SlotState::Running;
    return true;
}

std::optional<std::shared_ptr<ProcessHandle>> ProcessRegistry::begin_stop(const std::string& job_id) {
    std::lock_guard lock(mutex_);
    auto it = slots_.find(job_id);
    if (it == slots_.end() || it->second.state == SlotState::Stopping) {
        return std::nullopt;
    }
    it->second.state = SlotState::Stopping;
    return it->second.handle;
}

void ProcessRegistry::release(const std::string& job_id, RunToken token) {
    {
        std::lock_guard lock(mutex_);
        auto it = slots_.find(job_id);
        if (it == slots_.end() || it->second.token != token) {
            return;
        }
        slots_.erase(it);
    }
    released_.notify_all();
}

bool ProcessRegistry::is_busy(const std::string& job_id) const {
    std::lock_guard lock(mutex_);
    return slots_.count(job_id) != 0;
}

bool ProcessRegistry::is_running(const std::string& job_id) const {
    std::lock_guard lock(mutex_);
    auto it = slots_.find(job_id);
    return it != slots_.end() && it->second.state == SlotState::Running;
}

bool ProcessRegistry::is_stopping(const std::string& job_id) const {
    std::lock_guard lock(mutex_);
    auto it = slots_.find(job_id);
    return it != slots_.end() && it->second.state == SlotState::Stopping;
}

std::size_t ProcessRegistry::running_count() const {
    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, slot] : slots_) {
        if (slot.state == SlotState::Running) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> ProcessRegistry::busy_jobs() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::shared_ptr<ProcessHandle>> ProcessRegistry::handles() const {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<ProcessHandle>> result;
    for (const auto& [id, slot] : slots_) {
        if (slot.handle) {
            result.push_back(slot.handle);
        }
    }
    return result;
}

bool ProcessRegistry::wait_until_empty(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return released_.wait_for(lock, timeout, [this] { return slots_.empty(); });
}

} // namespace cloudsync::process
