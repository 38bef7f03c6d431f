#pragma once

#include "cloudsync/core/result.hpp"

#include <filesystem>
#include <string>

namespace cloudsync {

/**
 * @brief Replace the file's contents (write to a sibling temp file, then rename)
 *
 * The parent directory is created when missing.
 */
Result<void> write_file_atomic(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Read a whole file; NotFound when it does not exist
 */
Result<std::string> read_file(const std::filesystem::path& path);

} // namespace cloudsync
