#pragma once

/**
 * @file rclone.hpp
 * @brief Argument vectors for the transfer tool and parsers for its output
 *
 * Locators follow the tool's convention: "name:path" addresses a configured
 * remote, anything without a colon is a local filesystem path.
 */

#include "cloudsync/core/config.hpp"
#include "cloudsync/core/result.hpp"
#include "cloudsync/jobs/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cloudsync::process {

std::vector<std::string> sync_args(const jobs::Job& job, const RcloneSettings& settings);
std::vector<std::string> check_args(const jobs::Job& job);
std::vector<std::string> probe_args(const std::string& remote);
std::vector<std::string> mkdir_args(const std::string& destination);
std::vector<std::string> listremotes_args();
std::vector<std::string> about_args(const std::string& remote);

bool is_local_path(const std::string& locator);

/// "remote1:backup" -> "remote1"; nullopt for local paths
std::optional<std::string> remote_name(const std::string& locator);

/**
 * @brief Parse `listremotes --long` output ("name:   type" per line)
 *
 * Blank lines are skipped; a missing type reads as "unknown".
 */
std::vector<jobs::RemoteInfo> parse_remotes(const std::string& text);

/**
 * @brief Parse `about --json` output into a quota snapshot
 *
 * Fails with Parse if the text is not JSON or carries no total.
 */
Result<jobs::StorageQuota> parse_about(const std::string& text);

} // namespace cloudsync::process
