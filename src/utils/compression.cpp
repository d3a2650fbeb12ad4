/**
 * LSV Inspector - Compression Implementation
 */

#include "lsv/compression.hpp"
#include <zlib.h>
#include <lz4.h>
#include <lz4frame.h>
#include <limits>
#include <string>

namespace lsv {

namespace {

// Package/resource flag layout
constexpr uint8_t METHOD_MASK = 0x0F;
constexpr uint8_t LEVEL_MASK = 0x70;
constexpr uint8_t METHOD_NONE = 0;
constexpr uint8_t METHOD_ZLIB = 1;
constexpr uint8_t METHOD_LZ4 = 2;
constexpr uint8_t METHOD_ZSTD = 3;

constexpr uint32_t LZ4F_MAGIC = 0x184D2204;

// Helper to convert zlib error code to string
const char* zlib_error_string(int err) {
    switch (err) {
        case Z_OK:            return "Z_OK";
        case Z_STREAM_END:    return "Z_STREAM_END";
        case Z_NEED_DICT:     return "Z_NEED_DICT";
        case Z_ERRNO:         return "Z_ERRNO";
        case Z_STREAM_ERROR:  return "Z_STREAM_ERROR";
        case Z_DATA_ERROR:    return "Z_DATA_ERROR";
        case Z_MEM_ERROR:     return "Z_MEM_ERROR";
        case Z_BUF_ERROR:     return "Z_BUF_ERROR";
        case Z_VERSION_ERROR: return "Z_VERSION_ERROR";
        default:              return "UNKNOWN_ERROR";
    }
}

std::string sizes_context(size_t input, size_t expected) {
    return "input=" + std::to_string(input) + ", expected=" + std::to_string(expected);
}

// RAII owner for an LZ4F decompression context
class Lz4FrameContext {
public:
    Lz4FrameContext() {
        status_ = LZ4F_createDecompressionContext(&ctx_, LZ4F_VERSION);
    }
    ~Lz4FrameContext() {
        if (ctx_) {
            LZ4F_freeDecompressionContext(ctx_);
        }
    }
    Lz4FrameContext(const Lz4FrameContext&) = delete;
    Lz4FrameContext& operator=(const Lz4FrameContext&) = delete;

    bool ok() const { return !LZ4F_isError(status_) && ctx_ != nullptr; }
    LZ4F_dctx* get() const { return ctx_; }

private:
    LZ4F_dctx* ctx_ = nullptr;
    LZ4F_errorCode_t status_ = 0;
};

// Walks the frame's block headers and returns the offset just past the last data block.
// Frames written without an end mark stop exactly at that offset.
Result<size_t> lz4_frame_data_end(std::span<const uint8_t> input) {
    auto read_u32 = [&](size_t pos) {
        return static_cast<uint32_t>(input[pos]) |
               (static_cast<uint32_t>(input[pos + 1]) << 8) |
               (static_cast<uint32_t>(input[pos + 2]) << 16) |
               (static_cast<uint32_t>(input[pos + 3]) << 24);
    };

    if (input.size() < LZ4F_HEADER_SIZE_MIN || read_u32(0) != LZ4F_MAGIC) {
        return Error::corrupt_data("Missing LZ4 frame header");
    }

    uint8_t flg = input[4];
    if ((flg >> 6) != 1) {
        return Error::corrupt_data("Unsupported LZ4 frame version");
    }
    bool block_checksum = (flg & 0x10) != 0;
    size_t pos = 4 + 2 + ((flg & 0x08) ? 8 : 0) + ((flg & 0x01) ? 4 : 0) + 1;
    if (pos > input.size()) {
        return Error::corrupt_data("Truncated LZ4 frame header");
    }

    while (pos < input.size()) {
        if (input.size() - pos < 4) {
            return Error::corrupt_data("Truncated LZ4 block header at " + std::to_string(pos));
        }
        uint32_t block_size = read_u32(pos);
        if (block_size == 0) {
            return pos;  // end mark
        }
        size_t span = 4 + static_cast<size_t>(block_size & 0x7FFFFFFFu) + (block_checksum ? 4 : 0);
        if (span > input.size() - pos) {
            return Error::corrupt_data("Truncated LZ4 block at " + std::to_string(pos));
        }
        pos += span;
    }
    return pos;
}

} // namespace

const char* compression_method_string(CompressionMethod method) {
    switch (method) {
        case CompressionMethod::None:     return "none";
        case CompressionMethod::Zlib:     return "zlib";
        case CompressionMethod::LZ4:      return "lz4";
        case CompressionMethod::LZ4Frame: return "lz4-frame";
        default:                          return "unknown";
    }
}

Result<CompressionMethod> compression_from_flags(uint8_t flags, bool chunked) {
    if ((flags & ~(METHOD_MASK | LEVEL_MASK)) != 0) {
        return Error::unsupported_compression("Unknown compression flag bits " + std::to_string(flags));
    }

    switch (flags & METHOD_MASK) {
        case METHOD_NONE:
            return CompressionMethod::None;
        case METHOD_ZLIB:
            return CompressionMethod::Zlib;
        case METHOD_LZ4:
            return chunked ? CompressionMethod::LZ4Frame : CompressionMethod::LZ4;
        case METHOD_ZSTD:
            return Error::unsupported_compression("ZSTD compression is not supported");
        default:
            return Error::unsupported_compression("Unknown compression method " +
                                                  std::to_string(flags & METHOD_MASK));
    }
}

Result<std::vector<uint8_t>> decompress_zlib(std::span<const uint8_t> input, size_t expected_size) {
    if (input.size() > std::numeric_limits<uInt>::max() ||
        expected_size >= std::numeric_limits<uInt>::max()) {
        return Error::invalid_argument("Zlib buffer exceeds 4GB", sizes_context(input.size(), expected_size));
    }

    // One spare byte so over-production is observable instead of silently clipped
    std::vector<uint8_t> result(expected_size + 1);

    z_stream strm = {};
    strm.next_in = const_cast<Bytef*>(input.data());
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_out = result.data();
    strm.avail_out = static_cast<uInt>(result.size());

    int ret = inflateInit(&strm);
    if (ret != Z_OK) {
        return Error::corrupt_data(std::string("Failed to initialize zlib decompression: ") +
                                   zlib_error_string(ret));
    }

    ret = inflate(&strm, Z_FINISH);
    size_t produced = strm.total_out;
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return Error::corrupt_data(std::string("Zlib decompression failed: ") + zlib_error_string(ret),
                                   sizes_context(input.size(), expected_size));
    }

    if (produced != expected_size) {
        return Error::corrupt_data("Zlib produced " + std::to_string(produced) + " bytes",
                                   sizes_context(input.size(), expected_size));
    }

    result.resize(produced);
    return result;
}

Result<std::vector<uint8_t>> decompress_lz4(std::span<const uint8_t> input, size_t expected_size) {
    if (input.size() > static_cast<size_t>(LZ4_MAX_INPUT_SIZE) ||
        expected_size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Error::invalid_argument("LZ4 block exceeds 2GB", sizes_context(input.size(), expected_size));
    }

    std::vector<uint8_t> result(expected_size);

    int decompressed_size = LZ4_decompress_safe(
        reinterpret_cast<const char*>(input.data()),
        reinterpret_cast<char*>(result.data()),
        static_cast<int>(input.size()),
        static_cast<int>(expected_size)
    );

    if (decompressed_size < 0) {
        return Error::corrupt_data("LZ4 block decompression failed", sizes_context(input.size(), expected_size));
    }

    if (static_cast<size_t>(decompressed_size) != expected_size) {
        return Error::corrupt_data("LZ4 block produced " + std::to_string(decompressed_size) + " bytes",
                                   sizes_context(input.size(), expected_size));
    }

    return result;
}

Result<std::vector<uint8_t>> decompress_lz4_frame(std::span<const uint8_t> input, size_t expected_size) {
    LSV_TRY_ASSIGN(data_end, lz4_frame_data_end(input));
    bool has_trailer = data_end < input.size();
    // End mark present but content checksum left off
    bool checksum_omitted = (input[4] & 0x04) != 0 && input.size() == data_end + 4;

    Lz4FrameContext ctx;
    if (!ctx.ok()) {
        return Error::corrupt_data("Failed to create LZ4 frame context");
    }

    std::vector<uint8_t> result(expected_size);
    uint8_t scratch[256];
    size_t in_pos = 0;
    size_t out_pos = 0;
    size_t hint = 1;

    while (in_pos < input.size() && hint != 0) {
        bool overflow = out_pos >= expected_size;
        uint8_t* dst = overflow ? scratch : result.data() + out_pos;
        size_t dst_size = overflow ? sizeof(scratch) : expected_size - out_pos;
        size_t src_size = input.size() - in_pos;

        hint = LZ4F_decompress(ctx.get(), dst, &dst_size, input.data() + in_pos, &src_size, nullptr);
        if (LZ4F_isError(hint)) {
            return Error::corrupt_data(std::string("LZ4 frame decompression failed: ") + LZ4F_getErrorName(hint),
                                       sizes_context(input.size(), expected_size));
        }
        if (overflow && dst_size != 0) {
            return Error::corrupt_data("LZ4 frame holds more than the expected size",
                                       sizes_context(input.size(), expected_size));
        }
        if (src_size == 0 && dst_size == 0) {
            return Error::corrupt_data("LZ4 frame decoder made no progress",
                                       sizes_context(input.size(), expected_size));
        }

        in_pos += src_size;
        if (!overflow) {
            out_pos += dst_size;
        }
    }

    if (hint != 0 && out_pos == expected_size) {
        // Input is exhausted; anything still buffered in the context is surplus output
        size_t dst_size = sizeof(scratch);
        size_t src_size = 0;
        size_t flushed = LZ4F_decompress(ctx.get(), scratch, &dst_size, nullptr, &src_size, nullptr);
        if (!LZ4F_isError(flushed) && dst_size != 0) {
            return Error::corrupt_data("LZ4 frame holds more than the expected size",
                                       sizes_context(input.size(), expected_size));
        }
    }

    if (out_pos != expected_size) {
        return Error::corrupt_data("LZ4 frame produced " + std::to_string(out_pos) + " bytes",
                                   sizes_context(input.size(), expected_size));
    }
    if (has_trailer && hint != 0 && !(checksum_omitted && in_pos == input.size())) {
        return Error::corrupt_data("LZ4 frame trailer is truncated", sizes_context(input.size(), expected_size));
    }
    if (in_pos != input.size()) {
        return Error::corrupt_data("Unexpected bytes after LZ4 frame end", sizes_context(input.size(), expected_size));
    }

    return result;
}

Result<std::vector<uint8_t>> decompress(std::span<const uint8_t> input,
                                        CompressionMethod method,
                                        size_t expected_size) {
    switch (method) {
        case CompressionMethod::None:
            if (input.size() != expected_size) {
                return Error::corrupt_data("Stored data size mismatch",
                                           sizes_context(input.size(), expected_size));
            }
            return std::vector<uint8_t>(input.begin(), input.end());

        case CompressionMethod::Zlib:
            return decompress_zlib(input, expected_size);

        case CompressionMethod::LZ4:
            return decompress_lz4(input, expected_size);

        case CompressionMethod::LZ4Frame:
            return decompress_lz4_frame(input, expected_size);

        default:
            return Error::unsupported_compression("Unknown compression method");
    }
}

} // namespace lsv
