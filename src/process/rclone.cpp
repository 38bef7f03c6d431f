#include "cloudsync/process/rclone.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace cloudsync::process {

namespace {

std::string with_colon(const std::string& remote) {
    if (!remote.empty() && remote.back() == ':') {
        return remote;
    }
    return remote + ":";
}

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

std::uint64_t read_size(const nlohmann::json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_number()) {
        return 0;
    }
    double value = it->get<double>();
    return value > 0 ? static_cast<std::uint64_t>(value) : 0;
}

} // namespace

std::vector<std::string> sync_args(const jobs::Job& job, const RcloneSettings& settings) {
    std::vector<std::string> args{"sync", job.source, job.destination};

    for (const auto& pattern : settings.excludes) {
        args.push_back("--exclude");
        args.push_back(pattern);
    }

    int transfers = std::max(1, job.concurrency);
    int checkers = std::max(16, transfers * 2);

    args.insert(args.end(), {
        "--stats", settings.stats_interval,
        "--use-json-log",
        "--stats-log-level", "info",
        "--fast-list",
        "--transfers", std::to_string(transfers),
        "--checkers", std::to_string(checkers),
        "--ignore-errors",
        "--retries", std::to_string(job.retries),
        "--retries-sleep", "250ms",
        "--low-level-retries", "10",
        "--timeout", std::to_string(job.timeout_seconds) + "s",
        "--contimeout", "10s",
        "-v"
    });
    return args;
}

std::vector<std::string> check_args(const jobs::Job& job) {
    return {"check", job.source, job.destination, "--one-way", "--quiet"};
}

std::vector<std::string> probe_args(const std::string& remote) {
    return {"lsd", with_colon(remote), "--max-depth", "0"};
}

std::vector<std::string> mkdir_args(const std::string& destination) {
    return {"mkdir", destination};
}

std::vector<std::string> listremotes_args() {
    return {"listremotes", "--long"};
}

std::vector<std::string> about_args(const std::string& remote) {
    return {"about", with_colon(remote), "--json", "--timeout", "30s"};
}

bool is_local_path(const std::string& locator) {
    return locator.find(':') == std::string::npos;
}

std::optional<std::string> remote_name(const std::string& locator) {
    auto colon = locator.find(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }
    return locator.substr(0, colon);
}

std::vector<jobs::RemoteInfo> parse_remotes(const std::string& text) {
    std::vector<jobs::RemoteInfo> remotes;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        auto colon = line.find(':');
        jobs::RemoteInfo remote;
        remote.name = trim(line.substr(0, colon));
        remote.type = colon == std::string::npos ? "" : trim(line.substr(colon + 1));
        if (remote.name.empty()) {
            continue;
        }
        if (remote.type.empty()) {
            remote.type = "unknown";
        }
        remotes.push_back(std::move(remote));
    }
    return remotes;
}

Result<jobs::StorageQuota> parse_about(const std::string& text) {
    auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<jobs::StorageQuota>(ErrorCode::Parse, "about output is not a JSON object");
    }

    jobs::StorageQuota quota;
    quota.total = read_size(doc, "total");
    if (quota.total == 0) {
        return Err<jobs::StorageQuota>(ErrorCode::Parse, "about output has no total");
    }
    quota.used = read_size(doc, "used");
    quota.free = read_size(doc, "free");
    quota.percent = static_cast<int>(std::lround(
        static_cast<double>(quota.used) / static_cast<double>(quota.total) * 100.0));
    return Ok(quota);
}

} // namespace cloudsync::process
