/**
 * LSV Inspector - File utilities
 */

#pragma once

#include "result.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <span>
#include <cstdint>

namespace lsv {

/**
 * Read entire file into memory. `max_size` of 0 means no limit;
 * larger files fail with InvalidArgument before anything is read.
 */
Result<std::vector<uint8_t>> read_file(const std::filesystem::path& path, uint64_t max_size = 0);

/**
 * Write data to file, creating parent directories.
 */
Result<void> write_file(const std::filesystem::path& path, std::span<const uint8_t> data);

/**
 * Write `file_name` (a package member path) under `root`, refusing names that
 * would escape it.
 */
Result<std::filesystem::path> output_path_for(const std::filesystem::path& root, const std::string& file_name);

/**
 * Format file size for display.
 */
std::string format_file_size(size_t bytes);

} // namespace lsv
