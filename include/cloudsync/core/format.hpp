#pragma once

#include <cstdint>
#include <string>

namespace cloudsync {

/**
 * @brief Compact human duration
 *
 * 42 -> "42s", 125 -> "2m 5s", 3725 -> "1h 2m"
 */
std::string format_duration(std::int64_t seconds);

/**
 * @brief Human byte count: "512 B", "1.5 KB", "12.0 MB", "1.25 GB"
 */
std::string format_bytes(std::uint64_t bytes);

} // namespace cloudsync
