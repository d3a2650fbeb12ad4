/**
 * LSV Inspector - File Utilities Implementation
 */

#include "lsv/files.hpp"
#include "lsv/logging.hpp"
#include <fstream>
#include <cstdio>

namespace lsv {

Result<std::vector<uint8_t>> read_file(const std::filesystem::path& path, uint64_t max_size) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error::io_error("Cannot stat file: " + ec.message(), path.string());
    }
    if (max_size != 0 && size > max_size) {
        return Error::invalid_argument("File of " + format_file_size(size) + " exceeds the " +
                                       format_file_size(max_size) + " limit", path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error::io_error("Cannot open file", path.string());
    }

    std::vector<uint8_t> data(static_cast<size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (static_cast<size_t>(file.gcount()) != data.size()) {
        return Error::io_error("Short read", path.string());
    }

    LSV_LOG_DEBUG("Files", "Read " << path.string() << " (" << format_file_size(data.size()) << ")");
    return data;
}

Result<void> write_file(const std::filesystem::path& path, std::span<const uint8_t> data) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error::io_error("Cannot create directory: " + ec.message(), path.parent_path().string());
        }
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return Error::io_error("Cannot create file", path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        return Error::io_error("Write failed", path.string());
    }

    LSV_LOG_DEBUG("Files", "Wrote " << path.string() << " (" << format_file_size(data.size()) << ")");
    return Result<void>::success();
}

Result<std::filesystem::path> output_path_for(const std::filesystem::path& root, const std::string& file_name) {
    std::filesystem::path relative(file_name);
    if (relative.is_absolute() || relative.has_root_name()) {
        return Error::invalid_argument("Absolute member path", file_name);
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return Error::invalid_argument("Member path escapes the output directory", file_name);
        }
    }
    return root / relative;
}

std::string format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    int unit = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit < 3) {
        size /= 1024.0;
        unit++;
    }

    char buf[64];
    if (unit == 0) {
        snprintf(buf, sizeof(buf), "%zu B", bytes);
    } else {
        snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
    }
    return buf;
}

} // namespace lsv
