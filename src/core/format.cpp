#include "cloudsync/core/format.hpp"

#include <iomanip>
#include <sstream>

namespace cloudsync {

std::string format_duration(std::int64_t seconds) {
    if (seconds < 0) {
        seconds = 0;
    }
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }
    const auto minutes = seconds / 60;
    const auto secs = seconds % 60;
    if (minutes < 60) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    const auto hours = minutes / 60;
    return std::to_string(hours) + "h " + std::to_string(minutes % 60) + "m";
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t kKiB = 1024;
    constexpr std::uint64_t kMiB = kKiB * 1024;
    constexpr std::uint64_t kGiB = kMiB * 1024;

    if (bytes < kKiB) {
        return std::to_string(bytes) + " B";
    }

    std::ostringstream oss;
    oss << std::fixed;
    if (bytes < kMiB) {
        oss << std::setprecision(1) << static_cast<double>(bytes) / kKiB << " KB";
    } else if (bytes < kGiB) {
        oss << std::setprecision(1) << static_cast<double>(bytes) / kMiB << " MB";
    } else {
        oss << std::setprecision(2) << static_cast<double>(bytes) / kGiB << " GB";
    }
    return oss.str();
}

} // namespace cloudsync
