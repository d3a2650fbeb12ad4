/**
 * LSV Inspector - Common types and definitions
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lsv {

/**
 * Immutable byte buffer shared between a package/document and the views into it.
 */
using SharedBytes = std::shared_ptr<const std::vector<uint8_t>>;

inline SharedBytes make_shared_bytes(std::vector<uint8_t> bytes) {
    return std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
}

/**
 * Sentinel for absent node/attribute links.
 */
constexpr size_t npos = std::numeric_limits<size_t>::max();

/**
 * Engine version packed into resource headers.
 */
struct PackedVersion {
    uint32_t major = 0;
    uint32_t minor = 0;
    uint32_t revision = 0;
    uint32_t build = 0;

    // 64-bit form used from LSOF v5 onward
    static PackedVersion from_i64(int64_t packed) {
        return PackedVersion{
            static_cast<uint32_t>((packed >> 55) & 0x7f),
            static_cast<uint32_t>((packed >> 47) & 0xff),
            static_cast<uint32_t>((packed >> 31) & 0xffff),
            static_cast<uint32_t>(packed & 0x7fffffff)
        };
    }

    // 32-bit form of older headers
    static PackedVersion from_i32(int32_t packed) {
        return PackedVersion{
            static_cast<uint32_t>((packed >> 28) & 0x0f),
            static_cast<uint32_t>((packed >> 24) & 0x0f),
            static_cast<uint32_t>((packed >> 16) & 0xff),
            static_cast<uint32_t>(packed & 0xffff)
        };
    }

    std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." +
               std::to_string(revision) + "." + std::to_string(build);
    }

    bool operator==(const PackedVersion&) const = default;
};

} // namespace lsv
