/**
 * LSV Inspector - Package Reader
 *
 * Reads LSPK v18 save containers (.lsv): header, LZ4-compressed file table,
 * and member payloads spread over one or more archive parts.
 */

#pragma once

#include "compression.hpp"
#include "result.hpp"
#include "types.hpp"
#include <vector>
#include <string>
#include <memory>
#include <cstdint>
#include <span>

namespace lsv {

/**
 * Supported LSPK container versions.
 */
enum class PackageVersion : uint32_t {
    V18 = 18
};

/**
 * Entry in the package file table.
 */
struct FileEntry {
    std::string name;             // Forward-slash separated path
    uint64_t offset = 0;          // Byte offset within the archive part
    uint32_t size_on_disk = 0;    // Compressed size (or stored size)
    uint32_t uncompressed_size = 0;
    uint8_t archive_part = 0;
    uint8_t flags = 0;            // Raw flags byte (method + level)
    CompressionMethod compression = CompressionMethod::None;

    bool is_compressed() const { return compression != CompressionMethod::None; }

    // Size of the member once read; stored entries record 0 as uncompressed size
    size_t size() const { return is_compressed() ? uncompressed_size : size_on_disk; }
};

/**
 * Parsed package: immutable file table plus shared part buffers.
 */
class Package {
public:
    PackageVersion version() const { return version_; }
    uint8_t flags() const { return flags_; }
    uint8_t priority() const { return priority_; }
    uint16_t part_count() const { return part_count_; }

    const std::vector<FileEntry>& entries() const { return entries_; }
    size_t file_count() const { return entries_.size(); }

    const FileEntry* find_entry(const std::string& name) const;
    const FileEntry* find_entry_nocase(const std::string& name) const;

    size_t total_size() const;
    size_t compressed_size() const;

    /**
     * Buffer backing an archive part, or nullptr if that part was not supplied.
     */
    const SharedBytes& part(size_t index) const;

private:
    friend class PackageReader;

    PackageVersion version_ = PackageVersion::V18;
    uint8_t flags_ = 0;
    uint8_t priority_ = 0;
    uint16_t part_count_ = 1;
    std::vector<FileEntry> entries_;
    std::vector<SharedBytes> parts_;
};

/**
 * Stateless LSPK reader.
 */
class PackageReader {
public:
    /**
     * Parse a package. `data` is archive part 0; `extra_parts[i]` is part i + 1.
     */
    static Result<Package> open(SharedBytes data, std::vector<SharedBytes> extra_parts = {});
    static Result<Package> open(std::vector<uint8_t> data);

    /**
     * Read and decompress one member by exact name.
     */
    static Result<std::vector<uint8_t>> read_member(const Package& package, const std::string& name);
    static Result<std::vector<uint8_t>> read_member(const Package& package, const FileEntry& entry);

    /**
     * Member names in file table order.
     */
    static std::vector<std::string> list_members(const Package& package);

private:
    static Result<Package> parse(SharedBytes data, std::vector<SharedBytes> extra_parts);
    static Result<std::vector<FileEntry>> read_file_list(std::span<const uint8_t> data, uint64_t offset,
                                                         uint64_t& table_end);
    static Result<FileEntry> read_file_entry(std::span<const uint8_t> record);
    static Result<void> validate_entries(const Package& package, uint64_t table_begin, uint64_t table_end);
};

} // namespace lsv
