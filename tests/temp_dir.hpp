/**
 * LSV Inspector - Scratch directory for tests that touch the filesystem
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace lsv::test {

class TempDir {
public:
    TempDir() {
        auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() / ("lsv_test_" + std::to_string(ticks));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write_text(const std::string& name, const std::string& text) const {
        auto file_path = path_ / name;
        std::ofstream out(file_path);
        out << text;
        return file_path;
    }

private:
    std::filesystem::path path_;
};

} // namespace lsv::test
