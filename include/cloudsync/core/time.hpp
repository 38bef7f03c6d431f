#pragma once

#include "cloudsync/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace cloudsync {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

std::int64_t to_epoch_millis(Timestamp tp) noexcept;
Timestamp from_epoch_millis(std::int64_t millis) noexcept;

/// "2026-10-17T08:15:42.123Z"
std::string to_iso8601(Timestamp tp);

/// Accepts "YYYY-MM-DDTHH:MM:SS[.fff]Z"; the trailing Z is optional.
Result<Timestamp> parse_iso8601(const std::string& text);

} // namespace cloudsync
