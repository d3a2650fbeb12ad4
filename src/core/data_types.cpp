/**
 * LSV Inspector - Data type names and value formatting
 */

#include "lsv/data_types.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace lsv {

const char* data_type_string(DataType type) {
    switch (type) {
        case DataType::None:               return "None";
        case DataType::Byte:               return "Byte";
        case DataType::Short:              return "Short";
        case DataType::UShort:             return "UShort";
        case DataType::Int:                return "Int";
        case DataType::UInt:               return "UInt";
        case DataType::Float:              return "Float";
        case DataType::Double:             return "Double";
        case DataType::IVec2:              return "IVec2";
        case DataType::IVec3:              return "IVec3";
        case DataType::IVec4:              return "IVec4";
        case DataType::Vec2:               return "Vec2";
        case DataType::Vec3:               return "Vec3";
        case DataType::Vec4:               return "Vec4";
        case DataType::Mat2:               return "Mat2";
        case DataType::Mat3:               return "Mat3";
        case DataType::Mat3x4:             return "Mat3x4";
        case DataType::Mat4x3:             return "Mat4x3";
        case DataType::Mat4:               return "Mat4";
        case DataType::Bool:               return "Bool";
        case DataType::String:             return "String";
        case DataType::Path:               return "Path";
        case DataType::FixedString:        return "FixedString";
        case DataType::LSString:           return "LSString";
        case DataType::ULongLong:          return "ULongLong";
        case DataType::ScratchBuffer:      return "ScratchBuffer";
        case DataType::Long:               return "Long";
        case DataType::Int8:               return "Int8";
        case DataType::TranslatedString:   return "TranslatedString";
        case DataType::WString:            return "WString";
        case DataType::LSWString:          return "LSWString";
        case DataType::Uuid:               return "Uuid";
        case DataType::Int64:              return "Int64";
        case DataType::TranslatedFSString: return "TranslatedFSString";
        default:                           return "Unknown";
    }
}

namespace {

constexpr size_t MAX_BLOB_PREVIEW = 64;

template<typename Vec>
void write_vector(std::ostream& out, const Vec& v) {
    out << '(';
    for (int i = 0; i < Vec::length(); ++i) {
        if (i > 0) out << ", ";
        out << v[i];
    }
    out << ')';
}

template<typename Mat>
void write_matrix(std::ostream& out, const Mat& m) {
    out << '[';
    for (int c = 0; c < Mat::length(); ++c) {
        if (c > 0) out << ", ";
        write_vector(out, m[c]);
    }
    out << ']';
}

void write_translated(std::ostream& out, const TranslatedString& ts) {
    out << ts.handle << ";" << ts.version;
    if (ts.value) {
        out << " \"" << *ts.value << '"';
    }
}

void write_translated_fs(std::ostream& out, const TranslatedFSString& fs) {
    write_translated(out, fs.base);
    if (fs.arguments.empty()) {
        return;
    }
    out << " {";
    for (size_t i = 0; i < fs.arguments.size(); ++i) {
        const auto& arg = fs.arguments[i];
        if (i > 0) out << ", ";
        out << arg.key << "=" << arg.value << " <";
        write_translated_fs(out, arg.string);
        out << '>';
    }
    out << '}';
}

} // anonymous namespace

std::string uuid_to_string(const Uuid& uuid) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::setw(2) << static_cast<int>(uuid[i]);
    }
    return ss.str();
}

std::string Value::to_string() const {
    std::ostringstream out;

    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            out << "(none)";
        } else if constexpr (std::is_same_v<T, bool>) {
            out << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, uint8_t> || std::is_same_v<T, int8_t>) {
            out << static_cast<int>(v);
        } else if constexpr (std::is_arithmetic_v<T>) {
            out << v;
        } else if constexpr (std::is_same_v<T, glm::vec2> || std::is_same_v<T, glm::vec3> ||
                             std::is_same_v<T, glm::vec4> || std::is_same_v<T, glm::ivec2> ||
                             std::is_same_v<T, glm::ivec3> || std::is_same_v<T, glm::ivec4>) {
            write_vector(out, v);
        } else if constexpr (std::is_same_v<T, glm::mat2> || std::is_same_v<T, glm::mat3> ||
                             std::is_same_v<T, glm::mat3x4> || std::is_same_v<T, glm::mat4x3> ||
                             std::is_same_v<T, glm::mat4>) {
            write_matrix(out, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            out << v;
        } else if constexpr (std::is_same_v<T, Uuid>) {
            out << uuid_to_string(v);
        } else if constexpr (std::is_same_v<T, TranslatedString>) {
            write_translated(out, v);
        } else if constexpr (std::is_same_v<T, TranslatedFSString>) {
            write_translated_fs(out, v);
        } else if constexpr (std::is_same_v<T, Blob>) {
            out << std::hex << std::setfill('0');
            size_t shown = std::min(v.size(), MAX_BLOB_PREVIEW);
            for (size_t i = 0; i < shown; ++i) {
                out << std::setw(2) << static_cast<int>(v[i]);
            }
            out << std::dec;
            if (shown < v.size()) {
                out << "... (" << v.size() << " bytes)";
            }
        }
    }, data);

    return out.str();
}

} // namespace lsv
