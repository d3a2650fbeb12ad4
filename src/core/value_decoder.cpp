/**
 * LSV Inspector - Value Decoder Implementation
 */

#include "lsv/value_decoder.hpp"
#include "lsv/binary_reader.hpp"
#include "lsv/logging.hpp"
#include "lsv/text_utils.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>
#include <vector>

namespace lsv {

namespace {

template<typename T>
Value make_value(DataType type, T&& payload) {
    using U = std::decay_t<T>;
    return Value{type, ValueData(std::in_place_type<U>, std::forward<T>(payload))};
}

template<typename Vec>
Result<Vec> read_vector(BinaryReader& reader) {
    using Component = typename Vec::value_type;
    Vec v;
    for (int i = 0; i < Vec::length(); ++i) {
        LSV_TRY_ASSIGN(component, reader.read<Component>());
        v[i] = component;
    }
    return v;
}

// On-disk rows map to glm columns
template<typename Mat>
Result<Mat> read_matrix(BinaryReader& reader) {
    using Column = typename Mat::col_type;
    Mat m;
    for (int c = 0; c < Mat::length(); ++c) {
        LSV_TRY_ASSIGN(column, read_vector<Column>(reader));
        m[c] = column;
    }
    return m;
}

template<typename T>
Result<Value> read_scalar(BinaryReader& reader, DataType type) {
    LSV_TRY_ASSIGN(value, reader.read<T>());
    return make_value(type, value);
}

/**
 * NUL-terminated string of exactly `length` bytes; trailing NULs are stripped.
 */
Result<std::string> read_string(BinaryReader& reader, size_t length) {
    LSV_TRY_ASSIGN(bytes, reader.read_bytes(length));
    if (bytes.empty()) {
        return std::string();
    }
    if (bytes.back() != 0) {
        return Error::corrupt_data("String value is not NUL-terminated");
    }

    size_t end = bytes.size() - 1;
    while (end > 0 && bytes[end - 1] == 0) {
        --end;
    }

    auto text = bytes.first(end);
    if (!is_valid_utf8(text)) {
        return Error::invalid_encoding("String value is not valid UTF-8");
    }
    return std::string(reinterpret_cast<const char*>(text.data()), text.size());
}

Result<std::string> read_prefixed_string(BinaryReader& reader) {
    LSV_TRY_ASSIGN(length, reader.read<int32_t>());
    if (length < 0) {
        return Error::corrupt_data("Negative string length " + std::to_string(length));
    }
    return read_string(reader, static_cast<size_t>(length));
}

Result<TranslatedString> read_translated_string(BinaryReader& reader, bool versioned) {
    TranslatedString ts;
    if (versioned) {
        LSV_TRY_ASSIGN(version, reader.read<uint16_t>());
        ts.version = version;
    } else {
        LSV_TRY_ASSIGN(value, read_prefixed_string(reader));
        ts.value = std::move(value);
    }

    LSV_TRY_ASSIGN(handle, read_prefixed_string(reader));
    ts.handle = std::move(handle);
    return ts;
}

Result<TranslatedFSString> read_translated_fs_string(BinaryReader& reader, bool versioned, size_t depth) {
    if (depth > MAX_FS_STRING_DEPTH) {
        return Error::corrupt_data("Translated format string nesting exceeds " +
                                   std::to_string(MAX_FS_STRING_DEPTH) + " levels");
    }

    TranslatedFSString fs;
    LSV_TRY_ASSIGN(base, read_translated_string(reader, versioned));
    fs.base = std::move(base);

    LSV_TRY_ASSIGN(arg_count, reader.read<int32_t>());
    if (arg_count < 0) {
        return Error::corrupt_data("Negative argument count " + std::to_string(arg_count));
    }

    for (int32_t i = 0; i < arg_count; ++i) {
        TranslatedFSStringArgument arg;
        LSV_TRY_ASSIGN(key, read_prefixed_string(reader));
        LSV_TRY_ASSIGN(nested, read_translated_fs_string(reader, versioned, depth + 1));
        LSV_TRY_ASSIGN(value, read_prefixed_string(reader));
        arg.key = std::move(key);
        arg.string = std::move(nested);
        arg.value = std::move(value);
        fs.arguments.push_back(std::move(arg));
    }

    return fs;
}

Result<Value> read_fixed(BinaryReader& reader, DataType type) {
    switch (type) {
        case DataType::Byte:      return read_scalar<uint8_t>(reader, type);
        case DataType::Int8:      return read_scalar<int8_t>(reader, type);
        case DataType::Short:     return read_scalar<int16_t>(reader, type);
        case DataType::UShort:    return read_scalar<uint16_t>(reader, type);
        case DataType::Int:       return read_scalar<int32_t>(reader, type);
        case DataType::UInt:      return read_scalar<uint32_t>(reader, type);
        case DataType::Float:     return read_scalar<float>(reader, type);
        case DataType::Double:    return read_scalar<double>(reader, type);
        case DataType::ULongLong: return read_scalar<uint64_t>(reader, type);
        case DataType::Long:
        case DataType::Int64:     return read_scalar<int64_t>(reader, type);

        case DataType::Bool: {
            LSV_TRY_ASSIGN(raw, reader.read<uint8_t>());
            return make_value(type, raw != 0);
        }

        case DataType::IVec2: { LSV_TRY_ASSIGN(v, read_vector<glm::ivec2>(reader)); return make_value(type, v); }
        case DataType::IVec3: { LSV_TRY_ASSIGN(v, read_vector<glm::ivec3>(reader)); return make_value(type, v); }
        case DataType::IVec4: { LSV_TRY_ASSIGN(v, read_vector<glm::ivec4>(reader)); return make_value(type, v); }
        case DataType::Vec2:  { LSV_TRY_ASSIGN(v, read_vector<glm::vec2>(reader));  return make_value(type, v); }
        case DataType::Vec3:  { LSV_TRY_ASSIGN(v, read_vector<glm::vec3>(reader));  return make_value(type, v); }
        case DataType::Vec4:  { LSV_TRY_ASSIGN(v, read_vector<glm::vec4>(reader));  return make_value(type, v); }

        case DataType::Mat2:   { LSV_TRY_ASSIGN(m, read_matrix<glm::mat2>(reader));   return make_value(type, m); }
        case DataType::Mat3:   { LSV_TRY_ASSIGN(m, read_matrix<glm::mat3>(reader));   return make_value(type, m); }
        case DataType::Mat3x4: { LSV_TRY_ASSIGN(m, read_matrix<glm::mat3x4>(reader)); return make_value(type, m); }
        case DataType::Mat4x3: { LSV_TRY_ASSIGN(m, read_matrix<glm::mat4x3>(reader)); return make_value(type, m); }
        case DataType::Mat4:   { LSV_TRY_ASSIGN(m, read_matrix<glm::mat4>(reader));   return make_value(type, m); }

        case DataType::Uuid: {
            LSV_TRY_ASSIGN(bytes, reader.read_bytes(16));
            Uuid uuid{};
            std::copy(bytes.begin(), bytes.end(), uuid.begin());
            return make_value(type, uuid);
        }

        default:
            return Error::unsupported_type(static_cast<uint32_t>(type));
    }
}

Result<Value> decode_slice(std::span<const uint8_t> bytes, DataType type, const ResourceFormat& format) {
    BinaryReader reader(bytes, data_type_string(type));
    const size_t length = bytes.size();

    Value value;
    if (type == DataType::None) {
        value = Value{type, std::monostate{}};
    } else if (is_string_type(type)) {
        LSV_TRY_ASSIGN(text, read_string(reader, length));
        value = make_value(type, std::move(text));
    } else if (type == DataType::ScratchBuffer) {
        value = make_value(type, Blob(bytes.begin(), bytes.end()));
        LSV_TRY(reader.skip(length));
    } else if (type == DataType::TranslatedString) {
        LSV_TRY_ASSIGN(ts, read_translated_string(reader, has_versioned_translated_strings(format)));
        value = make_value(type, std::move(ts));
    } else if (type == DataType::TranslatedFSString) {
        LSV_TRY_ASSIGN(fs, read_translated_fs_string(reader, has_versioned_translated_fs_strings(format), 0));
        value = make_value(type, std::move(fs));
    } else {
        size_t width = fixed_size(type);
        if (width == 0) {
            return Error::unsupported_type(static_cast<uint32_t>(type));
        }
        if (length != width) {
            return Error::corrupt_data(std::string(data_type_string(type)) + " value has length " +
                                       std::to_string(length) + ", expected " + std::to_string(width));
        }
        LSV_TRY_ASSIGN(fixed, read_fixed(reader, type));
        value = std::move(fixed);
    }

    if (!reader.at_end()) {
        return Error::corrupt_data(std::to_string(reader.remaining()) + " trailing bytes after " +
                                   data_type_string(type) + " value");
    }
    return value;
}

} // anonymous namespace

bool has_versioned_translated_strings(const ResourceFormat& format) {
    const auto& engine = format.engine_version;
    return format.lsof_version >= static_cast<uint32_t>(LsofVersion::BG3)
        || engine.major > 4
        || (engine.major == 4 && engine.revision > 0)
        || (engine.major == 4 && engine.revision == 0 && engine.build >= 0x1A);
}

bool has_versioned_translated_fs_strings(const ResourceFormat& format) {
    return format.lsof_version >= static_cast<uint32_t>(LsofVersion::BG3);
}

Result<Value> decode_value(const Attribute& attribute, std::span<const uint8_t> values,
                           const ResourceFormat& format) {
    if (attribute.offset > values.size() || attribute.length > values.size() - attribute.offset) {
        LSV_LOG_ERROR("ValueDecoder", "Attribute range [" << attribute.offset << ", +" << attribute.length
                      << ") exceeds value stream of " << values.size() << " bytes");
        return Error::corrupt_data("Attribute range exceeds value stream");
    }

    auto result = decode_slice(values.subspan(attribute.offset, attribute.length), attribute.type, format);
    if (!result) {
        LSV_LOG_ERROR("ValueDecoder", "Failed to decode " << data_type_string(attribute.type) << " at offset "
                      << attribute.offset << ": " << result.error().full_message());
    }
    return result;
}

Result<Value> decode_value(const ResourceDocument& document, const Attribute& attribute) {
    static const std::vector<uint8_t> no_values;
    const auto& values = document.values() ? *document.values() : no_values;
    return decode_value(attribute, values, document.format());
}

} // namespace lsv
