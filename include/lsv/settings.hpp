/**
 * LSV Inspector - Settings
 *
 * JSON settings file shared by the command-line tools.
 */

#pragma once

#include "logging.hpp"
#include "result.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace lsv {

struct Settings {
    // Logging
    LogLevel log_level = LogLevel::Warning;
    std::filesystem::path log_file;      // Empty for no log file
    bool console_log = true;

    // Limits (0 = unlimited)
    uint64_t max_member_size = 512ull * 1024 * 1024;
    uint64_t max_package_size = 0;

    // Output
    std::filesystem::path output_dir = ".";
};

/**
 * Load settings from a JSON file. Missing keys keep their defaults; a missing,
 * malformed or wrongly typed file yields the defaults with a logged warning.
 */
Settings load_settings(const std::filesystem::path& path);

/**
 * Write settings as indented JSON.
 */
Result<void> save_settings(const Settings& settings, const std::filesystem::path& path);

/**
 * Configure the global Logger from settings.
 */
Result<void> apply_logging(const Settings& settings);

} // namespace lsv
