#pragma once

#include "cloudsync/jobs/types.hpp"

#include <nlohmann/json.hpp>

namespace cloudsync::jobs {

// nlohmann ADL hooks. Field names follow the persisted/exported camelCase shape.

void to_json(nlohmann::json& j, const TransferItem& item);
void from_json(const nlohmann::json& j, TransferItem& item);

void to_json(nlohmann::json& j, const JobAnalytics& analytics);
void from_json(const nlohmann::json& j, JobAnalytics& analytics);

void to_json(nlohmann::json& j, const Job& job);
void from_json(const nlohmann::json& j, Job& job);

void to_json(nlohmann::json& j, const ActivityDetails& details);
void from_json(const nlohmann::json& j, ActivityDetails& details);

void to_json(nlohmann::json& j, const ActivityEntry& entry);
void from_json(const nlohmann::json& j, ActivityEntry& entry);

void to_json(nlohmann::json& j, const StorageQuota& quota);
void to_json(nlohmann::json& j, const SyncStats& stats);

} // namespace cloudsync::jobs
