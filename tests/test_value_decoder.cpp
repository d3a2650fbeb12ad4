/**
 * @file test_value_decoder.cpp
 * @brief Unit tests for typed attribute value decoding.
 */

#include <catch2/catch.hpp>
#include "lsv/value_decoder.hpp"
#include "test_builders.hpp"

using namespace lsv;
using namespace lsv::test;

namespace {

constexpr size_t PADDING = 3;

/**
 * Decode `bytes` placed at a non-zero offset inside a larger value stream.
 */
Result<Value> decode(DataType type, const Bytes& bytes, const ResourceFormat& format = ResourceFormat{}) {
    Bytes stream(PADDING, 0xEE);
    put_bytes(stream, bytes);
    stream.push_back(0xEE);

    Attribute attr;
    attr.type = type;
    attr.offset = PADDING;
    attr.length = static_cast<uint32_t>(bytes.size());
    return decode_value(attr, stream, format);
}

template<typename T>
T decode_as(DataType type, const Bytes& bytes, const ResourceFormat& format = ResourceFormat{}) {
    auto value = decode(type, bytes, format);
    REQUIRE(value);
    REQUIRE(value->type == type);
    REQUIRE(value->holds<T>());
    return *value->get_if<T>();
}

ResourceFormat old_translated_format() {
    ResourceFormat format;
    format.lsof_version = 3;
    format.engine_version = PackedVersion{3, 6, 9, 0};
    return format;
}

/**
 * Versioned translated format string nested `depth` levels below the top.
 */
Bytes nested_fs_string(size_t depth) {
    Bytes out = translated_string_value(1, "h" + std::to_string(depth));
    if (depth == 0) {
        put<int32_t>(out, 0);
        return out;
    }
    put<int32_t>(out, 1);
    put_prefixed(out, "key");
    put_bytes(out, nested_fs_string(depth - 1));
    put_prefixed(out, "value");
    return out;
}

} // namespace

TEST_CASE("Scalar values", "[values]") {
    REQUIRE(decode_as<uint8_t>(DataType::Byte, Bytes{0xFE}) == 0xFE);
    REQUIRE(decode_as<int8_t>(DataType::Int8, Bytes{0xFE}) == -2);
    REQUIRE(decode_as<int16_t>(DataType::Short, le<int16_t>(-300)) == -300);
    REQUIRE(decode_as<uint16_t>(DataType::UShort, le<uint16_t>(60000)) == 60000);
    REQUIRE(decode_as<int32_t>(DataType::Int, le<int32_t>(-123456)) == -123456);
    REQUIRE(decode_as<uint32_t>(DataType::UInt, le<uint32_t>(0xDEADBEEF)) == 0xDEADBEEF);
    REQUIRE(decode_as<float>(DataType::Float, le<float>(1.5f)) == 1.5f);
    REQUIRE(decode_as<double>(DataType::Double, le<double>(-2.25)) == -2.25);
    REQUIRE(decode_as<uint64_t>(DataType::ULongLong, le<uint64_t>(0x0123456789ABCDEFull)) == 0x0123456789ABCDEFull);
    REQUIRE(decode_as<int64_t>(DataType::Long, le<int64_t>(-5)) == -5);
    REQUIRE(decode_as<int64_t>(DataType::Int64, le<int64_t>(1LL << 40)) == (1LL << 40));
}

TEST_CASE("Bool values", "[values]") {
    REQUIRE(decode_as<bool>(DataType::Bool, Bytes{0}) == false);
    REQUIRE(decode_as<bool>(DataType::Bool, Bytes{1}) == true);
    REQUIRE(decode_as<bool>(DataType::Bool, Bytes{0x7F}) == true);
}

TEST_CASE("Vector values", "[values]") {
    REQUIRE(decode_as<glm::ivec2>(DataType::IVec2, le_array<int32_t>({1, -2})) == glm::ivec2(1, -2));
    REQUIRE(decode_as<glm::ivec3>(DataType::IVec3, le_array<int32_t>({1, 2, 3})) == glm::ivec3(1, 2, 3));
    REQUIRE(decode_as<glm::ivec4>(DataType::IVec4, le_array<int32_t>({4, 3, 2, 1})) == glm::ivec4(4, 3, 2, 1));
    REQUIRE(decode_as<glm::vec2>(DataType::Vec2, le_array<float>({0.5f, 1.0f})) == glm::vec2(0.5f, 1.0f));
    REQUIRE(decode_as<glm::vec3>(DataType::Vec3, le_array<float>({1.0f, 2.0f, 3.0f})) == glm::vec3(1.0f, 2.0f, 3.0f));
    REQUIRE(decode_as<glm::vec4>(DataType::Vec4, le_array<float>({1.0f, 0.0f, 0.0f, 1.0f})) ==
            glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
}

TEST_CASE("Matrix values keep on-disk rows as columns", "[values]") {
    SECTION("mat2") {
        auto m = decode_as<glm::mat2>(DataType::Mat2, le_array<float>({1, 2, 3, 4}));
        REQUIRE(m[0] == glm::vec2(1, 2));
        REQUIRE(m[1] == glm::vec2(3, 4));
    }

    SECTION("mat3") {
        auto m = decode_as<glm::mat3>(DataType::Mat3, le_array<float>({0, 1, 2, 3, 4, 5, 6, 7, 8}));
        REQUIRE(m[0] == glm::vec3(0, 1, 2));
        REQUIRE(m[2] == glm::vec3(6, 7, 8));
    }

    SECTION("mat3x4") {
        auto m = decode_as<glm::mat3x4>(DataType::Mat3x4, le_array<float>({0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11}));
        REQUIRE(m[0] == glm::vec4(0, 1, 2, 3));
        REQUIRE(m[1] == glm::vec4(4, 5, 6, 7));
        REQUIRE(m[2][3] == 11.0f);
    }

    SECTION("mat4x3") {
        auto m = decode_as<glm::mat4x3>(DataType::Mat4x3, le_array<float>({0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11}));
        REQUIRE(m[0] == glm::vec3(0, 1, 2));
        REQUIRE(m[3] == glm::vec3(9, 10, 11));
    }

    SECTION("mat4") {
        Bytes bytes;
        for (int i = 0; i < 16; ++i) {
            put<float>(bytes, static_cast<float>(i));
        }
        auto m = decode_as<glm::mat4>(DataType::Mat4, bytes);
        REQUIRE(m[0] == glm::vec4(0, 1, 2, 3));
        REQUIRE(m[3] == glm::vec4(12, 13, 14, 15));
    }
}

TEST_CASE("Uuid values", "[values]") {
    Bytes raw{0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88, 0x99, 0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF};
    auto uuid = decode_as<Uuid>(DataType::Uuid, raw);
    REQUIRE(std::equal(uuid.begin(), uuid.end(), raw.begin()));
    REQUIRE(uuid_to_string(uuid) == "00112233-4455-6677-8899-aabbccddeeff");
}

TEST_CASE("Fixed-width length mismatches", "[values]") {
    REQUIRE(decode(DataType::Int, Bytes{1, 2, 3}).code() == Error::Code::CorruptData);
    REQUIRE(decode(DataType::Int, Bytes{1, 2, 3, 4, 5}).code() == Error::Code::CorruptData);
    REQUIRE(decode(DataType::Bool, Bytes{}).code() == Error::Code::CorruptData);
    REQUIRE(decode(DataType::Vec3, le_array<float>({1, 2})).code() == Error::Code::CorruptData);
    REQUIRE(decode(DataType::Uuid, Bytes(15, 0)).code() == Error::Code::CorruptData);
    REQUIRE(decode(DataType::Mat4, Bytes(48, 0)).code() == Error::Code::CorruptData);
}

TEST_CASE("None values", "[values]") {
    auto value = decode(DataType::None, Bytes{});
    REQUIRE(value);
    REQUIRE(value->holds<std::monostate>());
    REQUIRE(value->to_string() == "(none)");

    REQUIRE(decode(DataType::None, Bytes{1}).code() == Error::Code::CorruptData);
}

TEST_CASE("String values", "[values]") {
    SECTION("all string types") {
        for (DataType type : {DataType::String, DataType::Path, DataType::FixedString,
                              DataType::LSString, DataType::WString, DataType::LSWString}) {
            REQUIRE(decode_as<std::string>(type, string_value("Tav")) == "Tav");
        }
    }

    SECTION("UTF-8 text") {
        REQUIRE(decode_as<std::string>(DataType::LSString, string_value("Shadowheart \xC3\xA9t\xC3\xA9")) ==
                "Shadowheart \xC3\xA9t\xC3\xA9");
    }

    SECTION("empty value and lone terminator") {
        REQUIRE(decode_as<std::string>(DataType::FixedString, Bytes{}).empty());
        REQUIRE(decode_as<std::string>(DataType::FixedString, Bytes{0}).empty());
    }

    SECTION("trailing NULs are stripped") {
        Bytes bytes = text_bytes("Karlach");
        bytes.insert(bytes.end(), 4, 0);
        REQUIRE(decode_as<std::string>(DataType::FixedString, bytes) == "Karlach");
    }

    SECTION("missing terminator") {
        REQUIRE(decode(DataType::FixedString, text_bytes("abc")).code() == Error::Code::CorruptData);
    }

    SECTION("invalid UTF-8") {
        Bytes bytes{'a', 0xFF, 'b', 0};
        REQUIRE(decode(DataType::LSString, bytes).code() == Error::Code::InvalidEncoding);
    }
}

TEST_CASE("ScratchBuffer values are copied verbatim", "[values]") {
    Bytes raw;
    for (int i = 0; i < 300; ++i) {
        raw.push_back(static_cast<uint8_t>(i * 7));
    }

    auto blob = decode_as<Blob>(DataType::ScratchBuffer, raw);
    REQUIRE(blob == raw);

    REQUIRE(decode_as<Blob>(DataType::ScratchBuffer, Bytes{}).empty());

    auto value = decode(DataType::ScratchBuffer, Bytes{0xDE, 0xAD, 0xBE, 0xEF});
    REQUIRE(value);
    REQUIRE(value->to_string() == "deadbeef");

    auto long_value = decode(DataType::ScratchBuffer, raw);
    REQUIRE(long_value);
    REQUIRE(long_value->to_string().find("(300 bytes)") != std::string::npos);
}

TEST_CASE("Translated strings", "[values]") {
    SECTION("versioned layout") {
        auto ts = decode_as<TranslatedString>(DataType::TranslatedString,
                                              translated_string_value(3, "h1234abcd"));
        REQUIRE(ts.version == 3);
        REQUIRE_FALSE(ts.value.has_value());
        REQUIRE(ts.handle == "h1234abcd");
    }

    SECTION("value and handle layout") {
        auto ts = decode_as<TranslatedString>(DataType::TranslatedString,
                                              translated_string_value_old("Camp", "hcamp"),
                                              old_translated_format());
        REQUIRE(ts.version == 0);
        REQUIRE(ts.value == std::optional<std::string>("Camp"));
        REQUIRE(ts.handle == "hcamp");
    }

    SECTION("layout selection") {
        ResourceFormat format;
        format.lsof_version = 3;

        format.engine_version = PackedVersion{4, 0, 0, 0x19};
        REQUIRE_FALSE(has_versioned_translated_strings(format));
        format.engine_version = PackedVersion{4, 0, 0, 0x1A};
        REQUIRE(has_versioned_translated_strings(format));
        format.engine_version = PackedVersion{4, 0, 1, 0};
        REQUIRE(has_versioned_translated_strings(format));
        format.engine_version = PackedVersion{5, 0, 0, 0};
        REQUIRE(has_versioned_translated_strings(format));
        format.engine_version = PackedVersion{3, 9, 9, 9};
        REQUIRE_FALSE(has_versioned_translated_strings(format));

        format.lsof_version = 4;
        REQUIRE(has_versioned_translated_strings(format));
    }

    SECTION("format string layout follows the LSOF version only") {
        ResourceFormat format;
        format.lsof_version = 3;
        format.engine_version = PackedVersion{4, 0, 0, 0x1A};
        REQUIRE(has_versioned_translated_strings(format));
        REQUIRE_FALSE(has_versioned_translated_fs_strings(format));

        format.engine_version = PackedVersion{5, 0, 0, 0};
        REQUIRE_FALSE(has_versioned_translated_fs_strings(format));

        format.lsof_version = 4;
        format.engine_version = PackedVersion{3, 6, 9, 0};
        REQUIRE(has_versioned_translated_fs_strings(format));
    }

    SECTION("negative length prefix") {
        Bytes bytes;
        put<uint16_t>(bytes, 1);
        put<int32_t>(bytes, -4);
        REQUIRE(decode(DataType::TranslatedString, bytes).code() == Error::Code::CorruptData);
    }

    SECTION("length prefix past the value") {
        Bytes bytes;
        put<uint16_t>(bytes, 1);
        put<int32_t>(bytes, 100);
        put_bytes(bytes, string_value("h"));
        REQUIRE(decode(DataType::TranslatedString, bytes).code() == Error::Code::CorruptData);
    }

    SECTION("trailing bytes") {
        Bytes bytes = translated_string_value(1, "h1");
        bytes.push_back(0);
        REQUIRE(decode(DataType::TranslatedString, bytes).code() == Error::Code::CorruptData);
    }
}

TEST_CASE("Translated format strings", "[values]") {
    SECTION("no arguments") {
        Bytes bytes = translated_string_value(2, "hbase");
        put<int32_t>(bytes, 0);

        auto fs = decode_as<TranslatedFSString>(DataType::TranslatedFSString, bytes);
        REQUIRE(fs.base.version == 2);
        REQUIRE(fs.base.handle == "hbase");
        REQUIRE(fs.arguments.empty());
    }

    SECTION("arguments with nested strings") {
        Bytes bytes = translated_string_value(1, "hgreeting");
        put<int32_t>(bytes, 2);

        put_prefixed(bytes, "Name");
        put_bytes(bytes, translated_string_value(1, "hname"));
        put<int32_t>(bytes, 0);
        put_prefixed(bytes, "Gale");

        put_prefixed(bytes, "Place");
        put_bytes(bytes, translated_string_value(4, "hplace"));
        put<int32_t>(bytes, 0);
        put_prefixed(bytes, "Waterdeep");

        auto fs = decode_as<TranslatedFSString>(DataType::TranslatedFSString, bytes);
        REQUIRE(fs.base.handle == "hgreeting");
        REQUIRE(fs.arguments.size() == 2);
        REQUIRE(fs.arguments[0].key == "Name");
        REQUIRE(fs.arguments[0].string.base.handle == "hname");
        REQUIRE(fs.arguments[0].value == "Gale");
        REQUIRE(fs.arguments[1].key == "Place");
        REQUIRE(fs.arguments[1].string.base.version == 4);
        REQUIRE(fs.arguments[1].value == "Waterdeep");
    }

    SECTION("old layout") {
        Bytes bytes = translated_string_value_old("Hello", "hhello");
        put<int32_t>(bytes, 0);

        auto fs = decode_as<TranslatedFSString>(DataType::TranslatedFSString, bytes, old_translated_format());
        REQUIRE(fs.base.value == std::optional<std::string>("Hello"));
        REQUIRE(fs.base.handle == "hhello");
    }

    SECTION("LSOF 3 with a newer engine keeps the value and handle layout") {
        ResourceFormat format;
        format.lsof_version = 3;
        format.engine_version = PackedVersion{4, 0, 0, 0x1A};

        Bytes bytes = translated_string_value_old("Hello {Name}", "hhello");
        put<int32_t>(bytes, 1);
        put_prefixed(bytes, "Name");
        put_bytes(bytes, translated_string_value_old("Karlach", "hkarlach"));
        put<int32_t>(bytes, 0);
        put_prefixed(bytes, "Karlach");

        auto fs = decode_as<TranslatedFSString>(DataType::TranslatedFSString, bytes, format);
        REQUIRE(fs.base.value == std::optional<std::string>("Hello {Name}"));
        REQUIRE(fs.base.handle == "hhello");
        REQUIRE(fs.arguments.size() == 1);
        REQUIRE(fs.arguments[0].string.base.value == std::optional<std::string>("Karlach"));
        REQUIRE(fs.arguments[0].string.base.handle == "hkarlach");
        REQUIRE(fs.arguments[0].value == "Karlach");

        // A plain translated string in the same file uses the versioned layout
        auto ts = decode_as<TranslatedString>(DataType::TranslatedString,
                                              translated_string_value(1, "hplain"), format);
        REQUIRE(ts.handle == "hplain");
    }

    SECTION("nesting at the limit") {
        auto fs = decode(DataType::TranslatedFSString, nested_fs_string(MAX_FS_STRING_DEPTH));
        REQUIRE(fs);
    }

    SECTION("nesting past the limit") {
        REQUIRE(decode(DataType::TranslatedFSString, nested_fs_string(MAX_FS_STRING_DEPTH + 1)).code() ==
                Error::Code::CorruptData);
    }

    SECTION("negative argument count") {
        Bytes bytes = translated_string_value(1, "h");
        put<int32_t>(bytes, -1);
        REQUIRE(decode(DataType::TranslatedFSString, bytes).code() == Error::Code::CorruptData);
    }

    SECTION("argument count past the value") {
        Bytes bytes = translated_string_value(1, "h");
        put<int32_t>(bytes, 5);
        REQUIRE(decode(DataType::TranslatedFSString, bytes).code() == Error::Code::CorruptData);
    }
}

TEST_CASE("Attribute ranges outside the value stream", "[values]") {
    Bytes stream = le<int32_t>(7);

    Attribute attr;
    attr.type = DataType::Int;
    attr.length = 4;

    attr.offset = 1;
    REQUIRE(decode_value(attr, stream, ResourceFormat{}).code() == Error::Code::CorruptData);

    attr.offset = 100;
    REQUIRE(decode_value(attr, stream, ResourceFormat{}).code() == Error::Code::CorruptData);

    attr.offset = 0;
    auto value = decode_value(attr, stream, ResourceFormat{});
    REQUIRE(value);
    REQUIRE(*value->get_if<int32_t>() == 7);
}

TEST_CASE("Decoding attributes of a document", "[values]") {
    LsofBuilder b;
    int32_t root = b.add_node("Globals");
    b.add_attribute(root, "Name", DataType::FixedString, string_value("Party"));
    b.add_attribute(root, "Position", DataType::Vec3, le_array<float>({1, 2, 3}));

    auto doc = LsfReader::read(b.build());
    REQUIRE(doc);

    auto name = decode_value(*doc, doc->attributes()[0]);
    REQUIRE(name);
    REQUIRE(*name->get_if<std::string>() == "Party");

    auto position = decode_value(*doc, doc->attributes()[1]);
    REQUIRE(position);
    REQUIRE(*position->get_if<glm::vec3>() == glm::vec3(1, 2, 3));
    REQUIRE(position->to_string().find('1') != std::string::npos);
}
