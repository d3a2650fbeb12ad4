/**
 * LSV Inspector - Package Reader Implementation
 *
 * LSPK v18 layout (little-endian):
 * - Header (40 bytes): "LSPK", version, file list offset (u64), file list size,
 *   flags, priority, MD5[16], part count (u16)
 * - File list at offset: entry count (u32), compressed size (u32), then an LZ4 block
 *   holding entry_count fixed 272-byte records
 * - Record: name[256] (NUL padded), offset low (u32), offset high (u16),
 *   archive part (u8), flags (u8), size on disk (u32), uncompressed size (u32)
 */

#include "lsv/package_reader.hpp"
#include "lsv/binary_reader.hpp"
#include "lsv/logging.hpp"
#include "lsv/text_utils.hpp"

#include <array>
#include <cstring>
#include <unordered_set>

namespace lsv {

// Package format constants
constexpr std::array<uint8_t, 4> LSPK_SIGNATURE = {'L', 'S', 'P', 'K'};
constexpr size_t LSPK_HEADER_SIZE = 40;
constexpr size_t FILE_ENTRY_SIZE = 272;
constexpr size_t FILE_ENTRY_NAME_SIZE = 256;
constexpr size_t MAX_FILE_TABLE_SIZE = 0x7FFFFFFF;

// ============================================================================
// Package
// ============================================================================

const FileEntry* Package::find_entry(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

const FileEntry* Package::find_entry_nocase(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (iequals(entry.name, name)) {
            return &entry;
        }
    }
    return nullptr;
}

size_t Package::total_size() const {
    size_t total = 0;
    for (const auto& entry : entries_) {
        total += entry.size();
    }
    return total;
}

size_t Package::compressed_size() const {
    size_t total = 0;
    for (const auto& entry : entries_) {
        total += entry.size_on_disk;
    }
    return total;
}

const SharedBytes& Package::part(size_t index) const {
    static const SharedBytes missing;
    if (index >= parts_.size()) {
        return missing;
    }
    return parts_[index];
}

// ============================================================================
// PackageReader
// ============================================================================

Result<Package> PackageReader::open(std::vector<uint8_t> data) {
    return open(make_shared_bytes(std::move(data)));
}

Result<Package> PackageReader::open(SharedBytes data, std::vector<SharedBytes> extra_parts) {
    if (!data) {
        return Error::invalid_argument("No package data supplied");
    }

    size_t size = data->size();
    auto result = parse(std::move(data), std::move(extra_parts));
    if (!result) {
        LSV_LOG_ERROR("PackageReader", "Failed to open package (" << size << " bytes): "
                      << error_code_string(result.code()) << ": " << result.error().full_message());
        return result;
    }

    LSV_LOG_INFO("PackageReader", "Opened package: " << result->file_count() << " files, "
                 << result->part_count() << " part(s), " << result->total_size() << " bytes unpacked");
    return result;
}

Result<Package> PackageReader::parse(SharedBytes data, std::vector<SharedBytes> extra_parts) {
    BinaryReader reader(*data, "package header");

    if (data->size() < LSPK_SIGNATURE.size() ||
        std::memcmp(data->data(), LSPK_SIGNATURE.data(), LSPK_SIGNATURE.size()) != 0) {
        return Error::unrecognized_format("Missing LSPK signature");
    }
    if (data->size() < LSPK_HEADER_SIZE) {
        return Error::corrupt_data("Truncated LSPK header", std::to_string(data->size()) + " bytes");
    }

    LSV_TRY(reader.skip(LSPK_SIGNATURE.size()));
    LSV_TRY_ASSIGN(version, reader.read<uint32_t>());
    if (version != static_cast<uint32_t>(PackageVersion::V18)) {
        return Error::unrecognized_format("Unsupported LSPK version " + std::to_string(version));
    }

    LSV_TRY_ASSIGN(file_list_offset, reader.read<uint64_t>());
    LSV_TRY_ASSIGN(file_list_size, reader.read<uint32_t>());
    LSV_TRY_ASSIGN(flags, reader.read<uint8_t>());
    LSV_TRY_ASSIGN(priority, reader.read<uint8_t>());
    LSV_TRY(reader.skip(16));  // MD5, not verified
    LSV_TRY_ASSIGN(num_parts, reader.read<uint16_t>());

    if (num_parts == 0) {
        return Error::corrupt_data("Package declares zero archive parts");
    }
    if (extra_parts.size() + 1 > num_parts) {
        return Error::invalid_argument("Supplied " + std::to_string(extra_parts.size() + 1) +
                                       " archive parts, package declares " + std::to_string(num_parts));
    }

    LSV_LOG_DEBUG("PackageReader", "LSPK v" << version << ": file list @" << file_list_offset
                  << " (" << file_list_size << " bytes), flags=" << static_cast<int>(flags)
                  << ", parts=" << num_parts);

    Package package;
    package.version_ = PackageVersion::V18;
    package.flags_ = flags;
    package.priority_ = priority;
    package.part_count_ = num_parts;

    uint64_t table_end = 0;
    LSV_TRY_ASSIGN(entries, read_file_list(*data, file_list_offset, table_end));
    package.entries_ = std::move(entries);

    package.parts_.reserve(1 + extra_parts.size());
    package.parts_.push_back(std::move(data));
    for (auto& part : extra_parts) {
        package.parts_.push_back(std::move(part));
    }

    LSV_TRY(validate_entries(package, file_list_offset, table_end));
    return package;
}

Result<std::vector<FileEntry>> PackageReader::read_file_list(std::span<const uint8_t> data, uint64_t offset,
                                                             uint64_t& table_end) {
    BinaryReader reader(data, "file list");
    if (offset > data.size()) {
        return Error::corrupt_data("File list offset " + std::to_string(offset) + " is past end of package");
    }
    LSV_TRY(reader.seek(static_cast<size_t>(offset)));

    LSV_TRY_ASSIGN(num_files, reader.read<uint32_t>());
    LSV_TRY_ASSIGN(compressed_size, reader.read<uint32_t>());
    LSV_TRY_ASSIGN(compressed, reader.read_bytes(compressed_size));
    table_end = reader.position();

    std::vector<FileEntry> entries;
    if (num_files == 0) {
        return entries;
    }

    uint64_t table_size = static_cast<uint64_t>(num_files) * FILE_ENTRY_SIZE;
    if (table_size > MAX_FILE_TABLE_SIZE) {
        return Error::corrupt_data("File table of " + std::to_string(num_files) + " entries is too large");
    }

    auto table = decompress(compressed, CompressionMethod::LZ4, static_cast<size_t>(table_size));
    if (!table) {
        return Error::corrupt_data("File table: " + table.error().message, table.error().context);
    }

    entries.reserve(num_files);
    std::span<const uint8_t> records(*table);
    for (size_t i = 0; i < num_files; ++i) {
        LSV_TRY_ASSIGN(entry, read_file_entry(records.subspan(i * FILE_ENTRY_SIZE, FILE_ENTRY_SIZE)));
        entries.push_back(std::move(entry));
    }

    return entries;
}

Result<FileEntry> PackageReader::read_file_entry(std::span<const uint8_t> record) {
    auto name_field = record.first(FILE_ENTRY_NAME_SIZE);
    size_t name_len = 0;
    while (name_len < name_field.size() && name_field[name_len] != 0) {
        ++name_len;
    }

    auto name_bytes = name_field.first(name_len);
    if (name_bytes.empty()) {
        return Error::corrupt_data("File entry has an empty name");
    }
    if (!is_valid_utf8(name_bytes)) {
        return Error::invalid_encoding("File entry name is not valid UTF-8");
    }

    FileEntry entry;
    entry.name = normalize_path(std::string_view(reinterpret_cast<const char*>(name_bytes.data()), name_bytes.size()));

    BinaryReader reader(record.subspan(FILE_ENTRY_NAME_SIZE), entry.name);
    LSV_TRY_ASSIGN(offset_low, reader.read<uint32_t>());
    LSV_TRY_ASSIGN(offset_high, reader.read<uint16_t>());
    LSV_TRY_ASSIGN(archive_part, reader.read<uint8_t>());
    LSV_TRY_ASSIGN(flags, reader.read<uint8_t>());
    LSV_TRY_ASSIGN(size_on_disk, reader.read<uint32_t>());
    LSV_TRY_ASSIGN(uncompressed_size, reader.read<uint32_t>());

    auto method = compression_from_flags(flags, false);
    if (!method) {
        return Error(method.code(), method.error().message, entry.name);
    }

    entry.offset = static_cast<uint64_t>(offset_low) | (static_cast<uint64_t>(offset_high) << 32);
    entry.archive_part = archive_part;
    entry.flags = flags;
    entry.size_on_disk = size_on_disk;
    entry.uncompressed_size = uncompressed_size;
    entry.compression = *method;

    if (!entry.is_compressed() && uncompressed_size != 0 && uncompressed_size != size_on_disk) {
        return Error::corrupt_data("Stored entry sizes disagree (" + std::to_string(size_on_disk) + " on disk, " +
                                   std::to_string(uncompressed_size) + " uncompressed)", entry.name);
    }

    return entry;
}

Result<void> PackageReader::validate_entries(const Package& package, uint64_t table_begin, uint64_t table_end) {
    std::unordered_set<std::string> names;
    names.reserve(package.entries_.size());

    for (const auto& entry : package.entries_) {
        if (!names.insert(entry.name).second) {
            return Error::corrupt_data("Duplicate member name", entry.name);
        }

        if (entry.archive_part >= package.part_count_) {
            return Error::corrupt_data("Archive part " + std::to_string(entry.archive_part) +
                                       " is beyond the declared " + std::to_string(package.part_count_), entry.name);
        }

        uint64_t begin = entry.offset;
        uint64_t end = begin + entry.size_on_disk;

        const auto& part = package.part(entry.archive_part);
        if (part && end > part->size()) {
            return Error::corrupt_data("Member range [" + std::to_string(begin) + ", " + std::to_string(end) +
                                       ") exceeds archive part " + std::to_string(entry.archive_part) +
                                       " of " + std::to_string(part->size()) + " bytes", entry.name);
        }

        if (entry.archive_part == 0 && entry.size_on_disk > 0 && begin < table_end && table_begin < end) {
            return Error::corrupt_data("Member range overlaps the file table", entry.name);
        }
    }

    return Result<void>::success();
}

Result<std::vector<uint8_t>> PackageReader::read_member(const Package& package, const std::string& name) {
    const FileEntry* entry = package.find_entry(name);
    if (!entry) {
        LSV_LOG_DEBUG("PackageReader", "Member not found: " << name);
        return Error::not_found("Package member", name);
    }
    return read_member(package, *entry);
}

Result<std::vector<uint8_t>> PackageReader::read_member(const Package& package, const FileEntry& entry) {
    const auto& part = package.part(entry.archive_part);
    if (!part) {
        LSV_LOG_ERROR("PackageReader", "Archive part " << static_cast<int>(entry.archive_part)
                      << " not loaded for: " << entry.name);
        return Error::invalid_argument("Archive part " + std::to_string(entry.archive_part) + " was not supplied",
                                       entry.name);
    }

    if (entry.offset > part->size() || entry.size_on_disk > part->size() - entry.offset) {
        return Error::corrupt_data("Member range exceeds archive part", entry.name);
    }

    LSV_LOG_DEBUG("PackageReader", "Reading " << entry.name << " (" << compression_method_string(entry.compression)
                  << ", " << entry.size_on_disk << " -> " << entry.size() << ")");

    std::span<const uint8_t> compressed(part->data() + entry.offset, entry.size_on_disk);
    auto data = decompress(compressed, entry.compression, entry.size());
    if (!data) {
        LSV_LOG_ERROR("PackageReader", "Decompression failed for: " << entry.name << " - "
                      << data.error().full_message());
        return Error(data.code(), data.error().message, entry.name);
    }

    return data;
}

std::vector<std::string> PackageReader::list_members(const Package& package) {
    std::vector<std::string> names;
    names.reserve(package.entries().size());
    for (const auto& entry : package.entries()) {
        names.push_back(entry.name);
    }
    return names;
}

} // namespace lsv
