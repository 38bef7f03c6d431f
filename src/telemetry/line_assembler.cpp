#include "cloudsync/telemetry/line_assembler.hpp"

namespace cloudsync::telemetry {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

} // namespace

std::vector<std::string> LineAssembler::feed(std::string_view chunk) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        auto newline = chunk.find('\n', start);
        if (newline == std::string_view::npos) {
            fragment_.append(chunk.substr(start));
            break;
        }
        fragment_.append(chunk.substr(start, newline - start));
        if (!fragment_.empty() && fragment_.back() == '\r') {
            fragment_.pop_back();
        }
        if (!is_blank(fragment_)) {
            lines.push_back(std::move(fragment_));
        }
        fragment_.clear();
        start = newline + 1;
    }
    return lines;
}

std::string LineAssembler::flush() {
    std::string rest = std::move(fragment_);
    fragment_.clear();
    if (is_blank(rest)) {
        return "";
    }
    return rest;
}

} // namespace cloudsync::telemetry
