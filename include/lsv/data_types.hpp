/**
 * LSV Inspector - Attribute data types and decoded values
 */

#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lsv {

/**
 * LSOF attribute type tags (6-bit field of type_and_length).
 */
enum class DataType : uint32_t {
    None = 0,
    Byte = 1,
    Short = 2,
    UShort = 3,
    Int = 4,
    UInt = 5,
    Float = 6,
    Double = 7,
    IVec2 = 8,
    IVec3 = 9,
    IVec4 = 10,
    Vec2 = 11,
    Vec3 = 12,
    Vec4 = 13,
    Mat2 = 14,
    Mat3 = 15,
    Mat3x4 = 16,
    Mat4x3 = 17,
    Mat4 = 18,
    Bool = 19,
    String = 20,
    Path = 21,
    FixedString = 22,
    LSString = 23,
    ULongLong = 24,
    ScratchBuffer = 25,
    Long = 26,
    Int8 = 27,
    TranslatedString = 28,
    WString = 29,
    LSWString = 30,
    Uuid = 31,
    Int64 = 32,
    TranslatedFSString = 33
};

constexpr uint32_t DATA_TYPE_MAX = static_cast<uint32_t>(DataType::TranslatedFSString);

constexpr bool is_known_data_type(uint32_t raw) {
    return raw <= DATA_TYPE_MAX;
}

const char* data_type_string(DataType type);

/**
 * Byte width of fixed-size types, 0 for variable-length ones (strings, blobs,
 * translated strings) and for None.
 */
constexpr size_t fixed_size(DataType type) {
    switch (type) {
        case DataType::Byte:
        case DataType::Int8:
        case DataType::Bool:      return 1;
        case DataType::Short:
        case DataType::UShort:    return 2;
        case DataType::Int:
        case DataType::UInt:
        case DataType::Float:     return 4;
        case DataType::Double:
        case DataType::ULongLong:
        case DataType::Long:
        case DataType::Int64:     return 8;
        case DataType::IVec2:
        case DataType::Vec2:      return 8;
        case DataType::IVec3:
        case DataType::Vec3:      return 12;
        case DataType::IVec4:
        case DataType::Vec4:
        case DataType::Mat2:
        case DataType::Uuid:      return 16;
        case DataType::Mat3:      return 36;
        case DataType::Mat3x4:
        case DataType::Mat4x3:    return 48;
        case DataType::Mat4:      return 64;
        default:                  return 0;
    }
}

constexpr bool is_string_type(DataType type) {
    return type == DataType::String || type == DataType::Path ||
           type == DataType::FixedString || type == DataType::LSString ||
           type == DataType::WString || type == DataType::LSWString;
}

using Uuid = std::array<uint8_t, 16>;
using Blob = std::vector<uint8_t>;

/**
 * Reference to a localizable string. `value` is only present in old-layout files.
 */
struct TranslatedString {
    uint16_t version = 0;
    std::optional<std::string> value;
    std::string handle;

    bool operator==(const TranslatedString&) const = default;
};

struct TranslatedFSStringArgument;

struct TranslatedFSString {
    TranslatedString base;
    std::vector<TranslatedFSStringArgument> arguments;

    bool operator==(const TranslatedFSString& other) const;
};

struct TranslatedFSStringArgument {
    std::string key;
    TranslatedFSString string;
    std::string value;

    bool operator==(const TranslatedFSStringArgument& other) const {
        return key == other.key && string == other.string && value == other.value;
    }
};

inline bool TranslatedFSString::operator==(const TranslatedFSString& other) const {
    return base == other.base && arguments == other.arguments;
}

/**
 * Decoded attribute payload. Matrices keep on-disk row r in glm column r.
 */
using ValueData = std::variant<
    std::monostate,
    uint8_t, int8_t, int16_t, uint16_t, int32_t, uint32_t, int64_t, uint64_t,
    float, double, bool,
    glm::ivec2, glm::ivec3, glm::ivec4,
    glm::vec2, glm::vec3, glm::vec4,
    glm::mat2, glm::mat3, glm::mat3x4, glm::mat4x3, glm::mat4,
    std::string,
    Uuid,
    TranslatedString,
    TranslatedFSString,
    Blob
>;

/**
 * Typed attribute value.
 */
struct Value {
    DataType type = DataType::None;
    ValueData data;

    template<typename T>
    bool holds() const { return std::holds_alternative<T>(data); }

    template<typename T>
    const T* get_if() const { return std::get_if<T>(&data); }

    /**
     * Human-readable rendering for listings. Blobs print as hex, truncated past 64 bytes.
     */
    std::string to_string() const;
};

std::string uuid_to_string(const Uuid& uuid);

} // namespace lsv
