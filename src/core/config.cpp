#include "cloudsync/core/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

namespace cloudsync {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template<typename T>
Result<T> read_positive(const json& doc, const char* key, T fallback) {
    if (!doc.contains(key)) {
        return Ok(fallback);
    }
    const auto& value = doc.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 1) {
        return Err<T>(ErrorCode::InvalidArgument, std::string(key) + " must be a positive integer");
    }
    return Ok(static_cast<T>(value.get<long long>()));
}

Result<std::string> read_string(const json& doc, const char* key, std::string fallback) {
    if (!doc.contains(key)) {
        return Ok(std::move(fallback));
    }
    const auto& value = doc.at(key);
    if (!value.is_string()) {
        return Err<std::string>(ErrorCode::InvalidArgument, std::string(key) + " must be a string");
    }
    return Ok(value.get<std::string>());
}

bool is_known_level(const std::string& level) {
    static const char* levels[] = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
    for (const auto* candidate : levels) {
        if (level == candidate) {
            return true;
        }
    }
    return false;
}

} // namespace

const char* to_string(TriggerPolicy policy) noexcept {
    switch (policy) {
        case TriggerPolicy::Interval: return "interval";
        case TriggerPolicy::IntervalOrDiff: return "interval_or_diff";
    }
    return "interval";
}

Result<TriggerPolicy> parse_trigger_policy(const std::string& text) {
    if (text == "interval") {
        return Ok(TriggerPolicy::Interval);
    }
    if (text == "interval_or_diff") {
        return Ok(TriggerPolicy::IntervalOrDiff);
    }
    return Err<TriggerPolicy>(ErrorCode::InvalidArgument, "Unknown trigger_policy: " + text);
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<Config>(ErrorCode::Io, "Cannot open config file: " + path.string());
    }
    auto doc = json::parse(input, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<Config>(ErrorCode::Parse, "Config file is not a JSON object: " + path.string());
    }
    return from_json(doc);
}

Result<Config> Config::from_json(const json& doc) {
    Config config;

    auto data_dir = read_string(doc, "data_dir", config.data_dir.string());
    if (data_dir.is_error()) return Err<Config>(data_dir.error());
    config.data_dir = data_dir.value();

    auto scheduler = read_positive<long long>(doc, "scheduler_interval_seconds", config.scheduler_interval.count());
    if (scheduler.is_error()) return Err<Config>(scheduler.error());
    config.scheduler_interval = std::chrono::seconds(scheduler.value());

    auto connectivity = read_positive<long long>(doc, "connectivity_interval_seconds", config.connectivity_interval.count());
    if (connectivity.is_error()) return Err<Config>(connectivity.error());
    config.connectivity_interval = std::chrono::seconds(connectivity.value());

    auto host = read_string(doc, "connectivity_host", config.connectivity_host);
    if (host.is_error()) return Err<Config>(host.error());
    config.connectivity_host = host.value();

    auto storage = read_positive<long long>(doc, "storage_refresh_seconds", config.storage_refresh_interval.count());
    if (storage.is_error()) return Err<Config>(storage.error());
    config.storage_refresh_interval = std::chrono::seconds(storage.value());

    auto storage_remote = read_string(doc, "storage_remote", config.storage_remote);
    if (storage_remote.is_error()) return Err<Config>(storage_remote.error());
    config.storage_remote = storage_remote.value();

    auto progress = read_positive<long long>(doc, "progress_interval_ms", config.progress_interval.count());
    if (progress.is_error()) return Err<Config>(progress.error());
    config.progress_interval = std::chrono::milliseconds(progress.value());

    auto grace = read_positive<long long>(doc, "shutdown_grace_seconds", config.shutdown_grace.count());
    if (grace.is_error()) return Err<Config>(grace.error());
    config.shutdown_grace = std::chrono::seconds(grace.value());

    auto max_entries = read_positive<std::size_t>(doc, "max_log_entries", config.max_log_entries);
    if (max_entries.is_error()) return Err<Config>(max_entries.error());
    config.max_log_entries = max_entries.value();

    auto policy_text = read_string(doc, "trigger_policy", to_string(config.trigger_policy));
    if (policy_text.is_error()) return Err<Config>(policy_text.error());
    auto policy = parse_trigger_policy(policy_text.value());
    if (policy.is_error()) return Err<Config>(policy.error());
    config.trigger_policy = policy.value();

    auto level = read_string(doc, "log_level", config.log_level);
    if (level.is_error()) return Err<Config>(level.error());
    config.log_level = level.value();

    auto log_file = read_string(doc, "log_file", config.log_file.string());
    if (log_file.is_error()) return Err<Config>(log_file.error());
    config.log_file = log_file.value();

    if (doc.contains("rclone")) {
        const auto& section = doc.at("rclone");
        if (!section.is_object()) {
            return Err<Config>(ErrorCode::InvalidArgument, "rclone must be an object");
        }
        auto& rclone = config.rclone;

        auto binary = read_string(section, "binary", rclone.binary);
        if (binary.is_error()) return Err<Config>(binary.error());
        rclone.binary = binary.value();

        auto command_timeout = read_positive<long long>(section, "command_timeout_seconds", rclone.command_timeout.count());
        if (command_timeout.is_error()) return Err<Config>(command_timeout.error());
        rclone.command_timeout = std::chrono::seconds(command_timeout.value());

        auto probe_timeout = read_positive<long long>(section, "probe_timeout_seconds", rclone.probe_timeout.count());
        if (probe_timeout.is_error()) return Err<Config>(probe_timeout.error());
        rclone.probe_timeout = std::chrono::seconds(probe_timeout.value());

        auto stats_interval = read_string(section, "stats_interval", rclone.stats_interval);
        if (stats_interval.is_error()) return Err<Config>(stats_interval.error());
        rclone.stats_interval = stats_interval.value();

        if (section.contains("excludes")) {
            const auto& excludes = section.at("excludes");
            if (!excludes.is_array()) {
                return Err<Config>(ErrorCode::InvalidArgument, "rclone.excludes must be an array of strings");
            }
            rclone.excludes.clear();
            for (const auto& pattern : excludes) {
                if (!pattern.is_string()) {
                    return Err<Config>(ErrorCode::InvalidArgument, "rclone.excludes must be an array of strings");
                }
                rclone.excludes.push_back(pattern.get<std::string>());
            }
        }
    }

    auto valid = config.validate();
    if (valid.is_error()) {
        return Err<Config>(valid.error());
    }
    return Ok(std::move(config));
}

Result<void> Config::apply_environment() {
    if (const char* dir = std::getenv("CLOUDSYNC_DATA_DIR"); dir != nullptr && *dir != '\0') {
        data_dir = dir;
    }
    if (const char* timeout = std::getenv("RCLONE_TIMEOUT"); timeout != nullptr && *timeout != '\0') {
        char* end = nullptr;
        const long seconds = std::strtol(timeout, &end, 10);
        if (end == timeout || *end != '\0' || seconds < 1) {
            return Err<void>(ErrorCode::InvalidArgument, std::string("RCLONE_TIMEOUT must be a positive integer: ") + timeout);
        }
        rclone.command_timeout = std::chrono::seconds(seconds);
    }
    if (const char* level = std::getenv("LOG_LEVEL"); level != nullptr && *level != '\0') {
        log_level = level;
    }
    return validate();
}

Result<void> Config::validate() const {
    if (data_dir.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "data_dir must not be empty");
    }
    if (rclone.binary.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "rclone.binary must not be empty");
    }
    if (!is_known_level(log_level)) {
        return Err<void>(ErrorCode::InvalidArgument, "Unknown log_level: " + log_level);
    }
    if (max_log_entries == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "max_log_entries must be positive");
    }
    return Ok();
}

} // namespace cloudsync
