#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cloudsync::telemetry {

/**
 * @brief Splits a chunked byte stream into complete lines
 *
 * A line that straddles two reads is held back until its newline arrives.
 * Trailing '\r' is stripped and blank lines are dropped.
 */
class LineAssembler {
public:
    std::vector<std::string> feed(std::string_view chunk);

    /// Whatever is left once the stream has closed
    std::string flush();

    const std::string& pending() const noexcept { return fragment_; }

private:
    std::string fragment_;
};

} // namespace cloudsync::telemetry
