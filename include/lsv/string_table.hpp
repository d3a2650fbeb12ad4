/**
 * LSV Inspector - String Table
 *
 * Deduplicated name pool of an LSOF resource. Strings are grouped into
 * pages (hash buckets) and addressed by (page, index) pairs.
 */

#pragma once

#include "result.hpp"
#include <vector>
#include <string>
#include <span>
#include <cstdint>

namespace lsv {

/**
 * Reference into a StringTable as stored in node and attribute records.
 */
struct NameRef {
    uint16_t page = 0;
    uint16_t index = 0;

    static NameRef from_packed(uint32_t packed) {
        return NameRef{static_cast<uint16_t>(packed >> 16), static_cast<uint16_t>(packed & 0xFFFF)};
    }

    uint32_t packed() const { return (static_cast<uint32_t>(page) << 16) | index; }

    bool operator==(const NameRef&) const = default;
};

class StringTable {
public:
    StringTable() = default;

    /**
     * Parse the strings stream:
     *   u32 page_count
     *   page_count x { u16 string_count; string_count x { u16 length; bytes[length] } }
     */
    static Result<StringTable> parse(std::span<const uint8_t> data);

    /**
     * Resolve a reference; out-of-range pages or indices are CorruptData.
     */
    Result<std::string> lookup(NameRef ref) const;

    /**
     * Resolve a reference already known to be valid. Returns an empty string otherwise.
     */
    const std::string& get(NameRef ref) const;

    bool contains(NameRef ref) const {
        return ref.page < pages_.size() && ref.index < pages_[ref.page].size();
    }

    size_t page_count() const { return pages_.size(); }
    size_t string_count() const;

    const std::vector<std::string>& page(size_t index) const { return pages_.at(index); }

private:
    std::vector<std::vector<std::string>> pages_;
};

} // namespace lsv
