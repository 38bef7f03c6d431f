#include "cloudsync/core/time.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cloudsync {

std::int64_t to_epoch_millis(Timestamp tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Timestamp from_epoch_millis(std::int64_t millis) noexcept {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

std::string to_iso8601(Timestamp tp) {
    const auto millis = to_epoch_millis(tp);
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    int remainder = static_cast<int>(millis % 1000);
    if (remainder < 0) {
        remainder += 1000;
        --seconds;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << remainder << 'Z';
    return oss.str();
}

Result<Timestamp> parse_iso8601(const std::string& text) {
    std::tm utc{};
    int millis = 0;
    int consumed = 0;
    const int fields = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                                   &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                                   &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &consumed);
    if (fields != 6) {
        return Err<Timestamp>(ErrorCode::Parse, "Invalid timestamp: " + text);
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        while (digits > 0 && digits < 3) {
            millis *= 10;
            ++digits;
        }
    }
    if (pos < text.size() && text[pos] != 'Z') {
        return Err<Timestamp>(ErrorCode::Parse, "Invalid timestamp suffix: " + text);
    }

    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    const std::time_t seconds = timegm(&utc);
    return Ok(from_epoch_millis(static_cast<std::int64_t>(seconds) * 1000 + millis));
}

} // namespace cloudsync
