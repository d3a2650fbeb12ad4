/**
 * LSV Inspector - Compression utilities
 */

#pragma once

#include "result.hpp"
#include <vector>
#include <span>
#include <cstdint>
#include <cstddef>

namespace lsv {

/**
 * Compression method of a package member or resource stream.
 */
enum class CompressionMethod {
    None,
    Zlib,
    LZ4,      // Raw LZ4 block
    LZ4Frame  // LZ4 frame format (chunked streams)
};

const char* compression_method_string(CompressionMethod method);

/**
 * Decode the compression flags byte shared by package entries and resource headers.
 *
 * Low nibble selects the method (0 none, 1 zlib, 2 lz4); bits 0x10-0x40 carry the
 * compression level and are ignored. `chunked` selects the frame variant of LZ4.
 */
Result<CompressionMethod> compression_from_flags(uint8_t flags, bool chunked);

/**
 * Decompress `input` to exactly `expected_size` bytes.
 * Any under- or over-production, or truncated input, is CorruptData.
 */
Result<std::vector<uint8_t>> decompress(std::span<const uint8_t> input,
                                        CompressionMethod method,
                                        size_t expected_size);

/**
 * Decompress zlib data.
 */
Result<std::vector<uint8_t>> decompress_zlib(std::span<const uint8_t> input, size_t expected_size);

/**
 * Decompress a raw LZ4 block.
 */
Result<std::vector<uint8_t>> decompress_lz4(std::span<const uint8_t> input, size_t expected_size);

/**
 * Decompress an LZ4 frame. The frame may omit its end mark and checksum.
 */
Result<std::vector<uint8_t>> decompress_lz4_frame(std::span<const uint8_t> input, size_t expected_size);

} // namespace lsv
