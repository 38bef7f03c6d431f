#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace cloudsync::test {

inline std::filesystem::path create_temp_dir() {
    static std::atomic<std::uint64_t> counter{0};
    const auto base = std::filesystem::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = static_cast<std::uint64_t>(timestamp) ^ (counter.fetch_add(1) << 8);
    auto unique = base / std::filesystem::path("cloudsync_test_" + std::to_string(id));
    std::filesystem::create_directories(unique);
    return unique;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

inline std::string read_text(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

} // namespace cloudsync::test
