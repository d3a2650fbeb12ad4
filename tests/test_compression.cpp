/**
 * @file test_compression.cpp
 * @brief Unit tests for the compression codec layer.
 */

#include <catch2/catch.hpp>
#include "lsv/compression.hpp"
#include "test_builders.hpp"

using namespace lsv;
using namespace lsv::test;

namespace {

Bytes sample_text(size_t size) {
    const std::string pattern = "Region Globals / node Party / attribute Data; ";
    Bytes out;
    out.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(static_cast<uint8_t>(pattern[i % pattern.size()] + (i / 997) % 3));
    }
    return out;
}

Bytes drop_last(Bytes bytes, size_t count = 1) {
    bytes.resize(bytes.size() - count);
    return bytes;
}

} // namespace

TEST_CASE("Compression flags decoding", "[compression]") {
    SECTION("method nibble") {
        REQUIRE(*compression_from_flags(0x00, false) == CompressionMethod::None);
        REQUIRE(*compression_from_flags(0x01, false) == CompressionMethod::Zlib);
        REQUIRE(*compression_from_flags(0x02, false) == CompressionMethod::LZ4);
        REQUIRE(*compression_from_flags(0x02, true) == CompressionMethod::LZ4Frame);
        REQUIRE(*compression_from_flags(0x01, true) == CompressionMethod::Zlib);
    }

    SECTION("level bits are ignored") {
        REQUIRE(*compression_from_flags(0x12, false) == CompressionMethod::LZ4);
        REQUIRE(*compression_from_flags(0x21, false) == CompressionMethod::Zlib);
        REQUIRE(*compression_from_flags(0x42, true) == CompressionMethod::LZ4Frame);
    }

    SECTION("unsupported methods and bits") {
        REQUIRE(compression_from_flags(0x03, false).code() == Error::Code::UnsupportedCompression);
        REQUIRE(compression_from_flags(0x04, false).code() == Error::Code::UnsupportedCompression);
        REQUIRE(compression_from_flags(0x0F, false).code() == Error::Code::UnsupportedCompression);
        REQUIRE(compression_from_flags(0x80, false).code() == Error::Code::UnsupportedCompression);
        REQUIRE(compression_from_flags(0x82, true).code() == Error::Code::UnsupportedCompression);
    }
}

TEST_CASE("Stored data", "[compression]") {
    Bytes data = sample_text(100);

    auto ok = decompress(data, CompressionMethod::None, data.size());
    REQUIRE(ok);
    REQUIRE(*ok == data);

    REQUIRE(decompress(data, CompressionMethod::None, data.size() + 1).code() == Error::Code::CorruptData);
    REQUIRE(decompress(data, CompressionMethod::None, data.size() - 1).code() == Error::Code::CorruptData);
}

TEST_CASE("Zlib decompression", "[compression]") {
    Bytes plain = sample_text(5000);
    Bytes packed = compress_zlib(plain);

    SECTION("round trip") {
        auto out = decompress(packed, CompressionMethod::Zlib, plain.size());
        REQUIRE(out);
        REQUIRE(*out == plain);
    }

    SECTION("truncated by one byte") {
        REQUIRE(decompress(drop_last(packed), CompressionMethod::Zlib, plain.size()).code() ==
                Error::Code::CorruptData);
    }

    SECTION("expected size too small") {
        REQUIRE(decompress(packed, CompressionMethod::Zlib, plain.size() - 1).code() == Error::Code::CorruptData);
    }

    SECTION("expected size too large") {
        REQUIRE(decompress(packed, CompressionMethod::Zlib, plain.size() + 1).code() == Error::Code::CorruptData);
    }

    SECTION("garbage input") {
        Bytes garbage(64, 0xAB);
        REQUIRE(decompress(garbage, CompressionMethod::Zlib, 100).code() == Error::Code::CorruptData);
    }
}

TEST_CASE("LZ4 block decompression", "[compression]") {
    Bytes plain = sample_text(5000);
    Bytes packed = compress_lz4_block(plain);

    SECTION("round trip") {
        auto out = decompress(packed, CompressionMethod::LZ4, plain.size());
        REQUIRE(out);
        REQUIRE(*out == plain);
    }

    SECTION("truncated by one byte") {
        REQUIRE(decompress(drop_last(packed), CompressionMethod::LZ4, plain.size()).code() ==
                Error::Code::CorruptData);
    }

    SECTION("expected size too small") {
        REQUIRE(decompress(packed, CompressionMethod::LZ4, plain.size() - 1).code() == Error::Code::CorruptData);
    }

    SECTION("expected size too large") {
        REQUIRE(decompress(packed, CompressionMethod::LZ4, plain.size() + 16).code() == Error::Code::CorruptData);
    }
}

TEST_CASE("LZ4 frame decompression", "[compression]") {
    Bytes plain = sample_text(300000);
    Bytes packed = compress_lz4_frame(plain);

    SECTION("round trip") {
        auto out = decompress(packed, CompressionMethod::LZ4Frame, plain.size());
        REQUIRE(out);
        REQUIRE(*out == plain);
    }

    SECTION("frame without end mark is accepted") {
        auto out = decompress(drop_last(packed, 4), CompressionMethod::LZ4Frame, plain.size());
        REQUIRE(out);
        REQUIRE(*out == plain);
    }

    SECTION("truncated by one byte") {
        REQUIRE(decompress(drop_last(packed), CompressionMethod::LZ4Frame, plain.size()).code() ==
                Error::Code::CorruptData);
    }

    SECTION("truncated inside a data block") {
        REQUIRE(decompress(drop_last(packed, 5), CompressionMethod::LZ4Frame, plain.size()).code() ==
                Error::Code::CorruptData);
    }

    SECTION("expected size too small") {
        REQUIRE(decompress(packed, CompressionMethod::LZ4Frame, plain.size() - 1).code() ==
                Error::Code::CorruptData);
    }

    SECTION("expected size too large") {
        REQUIRE(decompress(packed, CompressionMethod::LZ4Frame, plain.size() + 1).code() ==
                Error::Code::CorruptData);
    }

    SECTION("trailing bytes after the end mark") {
        Bytes extended = packed;
        extended.push_back(0x00);
        REQUIRE(decompress(extended, CompressionMethod::LZ4Frame, plain.size()).code() ==
                Error::Code::CorruptData);
    }

    SECTION("missing frame header") {
        REQUIRE(decompress(compress_lz4_block(plain), CompressionMethod::LZ4Frame, plain.size()).code() ==
                Error::Code::CorruptData);
    }
}

TEST_CASE("LZ4 frame with a content checksum", "[compression]") {
    Bytes plain = sample_text(1000);

    LZ4F_preferences_t prefs = {};
    prefs.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;
    Bytes packed(LZ4F_compressFrameBound(plain.size(), &prefs));
    size_t size = LZ4F_compressFrame(packed.data(), packed.size(), plain.data(), plain.size(), &prefs);
    REQUIRE_FALSE(LZ4F_isError(size));
    packed.resize(size);

    SECTION("full frame") {
        auto out = decompress(packed, CompressionMethod::LZ4Frame, plain.size());
        REQUIRE(out);
        REQUIRE(*out == plain);
    }

    SECTION("checksum left off after the end mark") {
        auto out = decompress(drop_last(packed, 4), CompressionMethod::LZ4Frame, plain.size());
        REQUIRE(out);
        REQUIRE(*out == plain);
    }

    SECTION("partial checksum") {
        for (size_t cut = 1; cut <= 3; ++cut) {
            INFO("cut " << cut);
            REQUIRE(decompress(drop_last(packed, cut), CompressionMethod::LZ4Frame, plain.size()).code() ==
                    Error::Code::CorruptData);
        }
    }

    SECTION("partial end mark") {
        REQUIRE(decompress(drop_last(packed, 5), CompressionMethod::LZ4Frame, plain.size()).code() ==
                Error::Code::CorruptData);
    }
}

TEST_CASE("Small LZ4 frame", "[compression]") {
    Bytes plain = text_bytes("hello");
    Bytes packed = compress_lz4_frame(plain);

    auto out = decompress(packed, CompressionMethod::LZ4Frame, plain.size());
    REQUIRE(out);
    REQUIRE(*out == plain);

    REQUIRE(decompress(drop_last(packed), CompressionMethod::LZ4Frame, plain.size()).code() ==
            Error::Code::CorruptData);
}
