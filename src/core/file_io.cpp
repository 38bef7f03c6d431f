#include "cloudsync/core/file_io.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace cloudsync {
namespace fs = std::filesystem;

Result<void> write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err<void>(ErrorCode::Io, "Cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path temp = path;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::Io, "Cannot open " + temp.string() + " for writing");
        }
        output << content;
        output.flush();
        if (!output) {
            return Err<void>(ErrorCode::Io, "Short write to " + temp.string());
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        fs::remove(temp, ec);
        return Err<void>(ErrorCode::Io, "Cannot replace " + path.string());
    }
    return Ok();
}

Result<std::string> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Err<std::string>(ErrorCode::NotFound, "File not found: " + path.string());
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::Io, "Cannot open " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return Ok(buffer.str());
}

} // namespace cloudsync
