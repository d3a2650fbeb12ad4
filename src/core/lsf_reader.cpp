/**
 * LSV Inspector - LSOF Reader Implementation
 *
 * LSOF layout (little-endian):
 * - "LSOF", version (u32), engine version (i64 from v5, i32 before)
 * - Metadata: stream sizes (uncompressed, on disk) for strings, nodes,
 *   attributes and values, compression flags, has_sibling_data.
 *   v6+ adds a u64 after the string sizes.
 * - Streams in order: strings, nodes, attributes, values
 */

#include "lsv/resource.hpp"
#include "lsv/binary_reader.hpp"
#include "lsv/compression.hpp"
#include "lsv/logging.hpp"

#include <array>
#include <cstring>

namespace lsv {

// LSOF format constants
constexpr std::array<uint8_t, 4> LSOF_SIGNATURE = {'L', 'S', 'O', 'F'};
constexpr size_t WIDE_NODE_SIZE = 16;
constexpr size_t COMPACT_NODE_SIZE = 12;
constexpr size_t WIDE_ATTRIBUTE_SIZE = 16;
constexpr size_t COMPACT_ATTRIBUTE_SIZE = 12;
constexpr uint32_t TYPE_MASK = 0x3F;
constexpr uint32_t LENGTH_SHIFT = 6;

// Fallback for merged files whose 64-bit engine version was never filled in
constexpr PackedVersion DEFAULT_ENGINE_VERSION{4, 0, 9, 0};

const char* node_layout_string(NodeLayout layout) {
    switch (layout) {
        case NodeLayout::Compact: return "compact";
        case NodeLayout::Wide:    return "wide";
        default:                  return "unknown";
    }
}

namespace {

/**
 * Read one stream following the metadata size pair.
 */
Result<std::vector<uint8_t>> read_stream(BinaryReader& reader, const char* name,
                                         uint32_t uncompressed_size, uint32_t size_on_disk,
                                         CompressionMethod method) {
    // Stored raw despite the header compression flags
    if (size_on_disk == 0 && uncompressed_size != 0) {
        LSV_TRY_ASSIGN(raw, reader.read_bytes(uncompressed_size));
        return std::vector<uint8_t>(raw.begin(), raw.end());
    }

    if (size_on_disk == 0 && uncompressed_size == 0) {
        return std::vector<uint8_t>();
    }

    size_t stored = (method == CompressionMethod::None) ? uncompressed_size : size_on_disk;
    auto input = reader.read_bytes(stored);
    if (!input) {
        return Error::corrupt_data(std::string("Truncated ") + name + " stream", input.error().message);
    }

    auto output = decompress(*input, method, uncompressed_size);
    if (!output) {
        return Error(output.code(), std::string(name) + " stream: " + output.error().message,
                     output.error().context);
    }
    return output;
}

} // anonymous namespace

// ============================================================================
// Header
// ============================================================================

Result<LsofHeader> LsfReader::read_header(std::span<const uint8_t> data) {
    BinaryReader reader(data, "LSOF header");
    return parse_header(reader);
}

Result<LsofHeader> LsfReader::parse_header(BinaryReader& reader) {
    LSV_TRY_ASSIGN(magic, reader.read_bytes(LSOF_SIGNATURE.size()));
    if (std::memcmp(magic.data(), LSOF_SIGNATURE.data(), LSOF_SIGNATURE.size()) != 0) {
        return Error::unrecognized_format("Missing LSOF signature");
    }

    LsofHeader header;
    LSV_TRY_ASSIGN(version, reader.read<uint32_t>());
    if (version < LSOF_VERSION_MIN || version > LSOF_VERSION_MAX) {
        return Error::unrecognized_format("Unsupported LSOF version " + std::to_string(version));
    }
    header.format.lsof_version = version;

    if (version >= static_cast<uint32_t>(LsofVersion::BG3ExtendedHeader)) {
        LSV_TRY_ASSIGN(engine, reader.read<int64_t>());
        header.format.engine_version = PackedVersion::from_i64(engine);
        if (header.format.engine_version.major == 0) {
            header.format.engine_version = DEFAULT_ENGINE_VERSION;
        }
    } else {
        LSV_TRY_ASSIGN(engine, reader.read<int32_t>());
        header.format.engine_version = PackedVersion::from_i32(engine);
    }

    auto& meta = header.metadata;
    LSV_TRY_ASSIGN(strings_uncompressed, reader.read<uint32_t>());
    LSV_TRY_ASSIGN(strings_on_disk, reader.read<uint32_t>());
    meta.strings_uncompressed_size = strings_uncompressed;
    meta.strings_size_on_disk = strings_on_disk;

    if (version >= static_cast<uint32_t>(LsofVersion::BG3AdditionalBlob)) {
        LSV_TRY_ASSIGN(unknown, reader.read<uint64_t>());
        meta.unknown = unknown;
    }

    LSV_TRY_ASSIGN(nodes_uncompressed, reader.read<uint32_t>());
    LSV_TRY_ASSIGN(nodes_on_disk, reader.read<uint32_t>());
    LSV_TRY_ASSIGN(attributes_uncompressed, reader.read<uint32_t>());
    LSV_TRY_ASSIGN(attributes_on_disk, reader.read<uint32_t>());
    LSV_TRY_ASSIGN(values_uncompressed, reader.read<uint32_t>());
    LSV_TRY_ASSIGN(values_on_disk, reader.read<uint32_t>());
    LSV_TRY_ASSIGN(compression_flags, reader.read<uint8_t>());
    LSV_TRY_ASSIGN(unknown2, reader.read<uint8_t>());
    LSV_TRY_ASSIGN(unknown3, reader.read<uint16_t>());
    LSV_TRY_ASSIGN(has_sibling_data, reader.read<uint32_t>());

    meta.nodes_uncompressed_size = nodes_uncompressed;
    meta.nodes_size_on_disk = nodes_on_disk;
    meta.attributes_uncompressed_size = attributes_uncompressed;
    meta.attributes_size_on_disk = attributes_on_disk;
    meta.values_uncompressed_size = values_uncompressed;
    meta.values_size_on_disk = values_on_disk;
    meta.compression_flags = compression_flags;
    meta.unknown2 = unknown2;
    meta.unknown3 = unknown3;
    meta.has_sibling_data = has_sibling_data;

    header.format.has_sibling_data = (has_sibling_data == 1);

    // Reject unknown compression up front rather than at the first compressed stream
    LSV_TRY(compression_from_flags(compression_flags, false));

    return header;
}

// ============================================================================
// Whole-file decode
// ============================================================================

Result<ResourceDocument> LsfReader::read(std::span<const uint8_t> data) {
    BinaryReader reader(data, "LSOF");

    auto header_result = parse_header(reader);
    if (!header_result) {
        LSV_LOG_ERROR("LsfReader", "Invalid LSOF header: " << header_result.error().full_message());
        return header_result.error();
    }
    const LsofHeader& header = *header_result;
    const LsofMetadata& meta = header.metadata;
    const ResourceFormat& format = header.format;

    bool chunked = format.lsof_version >= static_cast<uint32_t>(LsofVersion::ChunkedCompress);
    LSV_TRY_ASSIGN(string_method, compression_from_flags(meta.compression_flags, false));
    LSV_TRY_ASSIGN(table_method, compression_from_flags(meta.compression_flags, chunked));

    LSV_LOG_DEBUG("LsfReader", "LSOF v" << format.lsof_version << ", engine " << format.engine_version.to_string()
                  << ", " << compression_method_string(table_method) << ", "
                  << node_layout_string(format.layout()) << " layout");

    auto decode_streams = [&]() -> Result<ResourceDocument> {
        LSV_TRY_ASSIGN(string_bytes, read_stream(reader, "strings", meta.strings_uncompressed_size,
                                                 meta.strings_size_on_disk, string_method));
        LSV_TRY_ASSIGN(node_bytes, read_stream(reader, "nodes", meta.nodes_uncompressed_size,
                                               meta.nodes_size_on_disk, table_method));
        LSV_TRY_ASSIGN(attribute_bytes, read_stream(reader, "attributes", meta.attributes_uncompressed_size,
                                                    meta.attributes_size_on_disk, table_method));
        LSV_TRY_ASSIGN(value_bytes, read_stream(reader, "values", meta.values_uncompressed_size,
                                                meta.values_size_on_disk, table_method));

        LSV_LOG_DEBUG("LsfReader", "Streams: strings=" << string_bytes.size() << " nodes=" << node_bytes.size()
                      << " attributes=" << attribute_bytes.size() << " values=" << value_bytes.size());

        LSV_TRY_ASSIGN(strings, StringTable::parse(string_bytes));
        return decode_tables(node_bytes, attribute_bytes, make_shared_bytes(std::move(value_bytes)),
                             std::move(strings), format);
    };

    auto document = decode_streams();
    if (!document) {
        LSV_LOG_ERROR("LsfReader", "Failed to decode resource: " << error_code_string(document.code())
                      << ": " << document.error().full_message());
        return document;
    }

    LSV_LOG_INFO("LsfReader", "Decoded resource: " << document->node_count() << " nodes, "
                 << document->attribute_count() << " attributes, " << document->roots().size() << " region(s)");
    return document;
}

Result<ResourceDocument> LsfReader::parse_tables(std::span<const uint8_t> node_bytes,
                                                 std::span<const uint8_t> attribute_bytes,
                                                 SharedBytes value_bytes,
                                                 StringTable strings,
                                                 const ResourceFormat& format) {
    auto document = decode_tables(node_bytes, attribute_bytes, std::move(value_bytes), std::move(strings), format);
    if (!document) {
        LSV_LOG_ERROR("LsfReader", "Failed to decode node tables: " << error_code_string(document.code())
                      << ": " << document.error().full_message());
    }
    return document;
}

// ============================================================================
// Tables
// ============================================================================

Result<ResourceDocument> LsfReader::decode_tables(std::span<const uint8_t> node_bytes,
                                                  std::span<const uint8_t> attribute_bytes,
                                                  SharedBytes value_bytes,
                                                  StringTable strings,
                                                  const ResourceFormat& format) {
    ResourceDocument doc;
    doc.format_ = format;
    doc.strings_ = std::move(strings);
    doc.values_ = value_bytes ? std::move(value_bytes) : make_shared_bytes({});

    const NodeLayout layout = format.layout();
    std::vector<int32_t> first_attributes;

    if (layout == NodeLayout::Wide) {
        LSV_TRY(read_nodes_wide(doc, node_bytes, first_attributes));
        LSV_TRY(read_attributes_wide(doc, attribute_bytes, first_attributes));
    } else {
        LSV_TRY(read_nodes_compact(doc, node_bytes, first_attributes));
        LSV_TRY(read_attributes_compact(doc, attribute_bytes, first_attributes));
    }

    LSV_TRY(check_value_ranges(doc));
    return doc;
}

Result<void> LsfReader::add_node(ResourceDocument& doc, uint32_t name, int32_t parent,
                                 std::vector<size_t>& last_child) {
    size_t index = doc.nodes_.size();
    std::string context = "node " + std::to_string(index);

    Node node;
    node.name = NameRef::from_packed(name);
    if (!doc.strings_.contains(node.name)) {
        return Error::corrupt_data("Node name does not resolve in the string table", context);
    }

    if (parent != -1) {
        if (parent < 0 || static_cast<size_t>(parent) >= index) {
            return Error::corrupt_data("Parent index " + std::to_string(parent) +
                                       " does not precede the node", context);
        }
        size_t p = static_cast<size_t>(parent);
        node.parent = p;

        if (last_child[p] == npos) {
            doc.nodes_[p].first_child = index;
        } else {
            doc.nodes_[last_child[p]].next_sibling = index;
        }
        last_child[p] = index;
    }

    doc.nodes_.push_back(node);
    last_child.push_back(npos);
    return Result<void>::success();
}

Result<void> LsfReader::read_nodes_wide(ResourceDocument& doc, std::span<const uint8_t> data,
                                        std::vector<int32_t>& first_attributes) {
    if (data.size() % WIDE_NODE_SIZE != 0) {
        return Error::corrupt_data("Node stream of " + std::to_string(data.size()) +
                                   " bytes is not a whole number of 16-byte records");
    }

    size_t count = data.size() / WIDE_NODE_SIZE;
    BinaryReader reader(data, "nodes");
    std::vector<size_t> last_child;
    doc.nodes_.reserve(count);
    last_child.reserve(count);
    first_attributes.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        LSV_TRY_ASSIGN(name, reader.read<uint32_t>());
        LSV_TRY_ASSIGN(parent, reader.read<int32_t>());
        LSV_TRY(reader.skip(4));  // next sibling; chains are rebuilt from parents
        LSV_TRY_ASSIGN(first_attribute, reader.read<int32_t>());

        LSV_TRY(add_node(doc, name, parent, last_child));
        first_attributes.push_back(first_attribute);
    }

    return Result<void>::success();
}

Result<void> LsfReader::read_nodes_compact(ResourceDocument& doc, std::span<const uint8_t> data,
                                           std::vector<int32_t>& first_attributes) {
    if (data.size() % COMPACT_NODE_SIZE != 0) {
        return Error::corrupt_data("Node stream of " + std::to_string(data.size()) +
                                   " bytes is not a whole number of 12-byte records");
    }

    size_t count = data.size() / COMPACT_NODE_SIZE;
    BinaryReader reader(data, "nodes");
    std::vector<size_t> last_child;
    doc.nodes_.reserve(count);
    last_child.reserve(count);
    first_attributes.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        LSV_TRY_ASSIGN(name, reader.read<uint32_t>());
        LSV_TRY_ASSIGN(first_attribute, reader.read<int32_t>());
        LSV_TRY_ASSIGN(parent, reader.read<int32_t>());

        LSV_TRY(add_node(doc, name, parent, last_child));
        first_attributes.push_back(first_attribute);
    }

    return Result<void>::success();
}

Result<Attribute> LsfReader::make_attribute(const ResourceDocument& doc, size_t index,
                                            uint32_t name, uint32_t type_and_length) {
    std::string context = "attribute " + std::to_string(index);

    uint32_t raw_type = type_and_length & TYPE_MASK;
    if (!is_known_data_type(raw_type)) {
        return Error::unsupported_type(raw_type, context);
    }

    Attribute attr;
    attr.name = NameRef::from_packed(name);
    if (!doc.strings_.contains(attr.name)) {
        return Error::corrupt_data("Attribute name does not resolve in the string table", context);
    }
    attr.type = static_cast<DataType>(raw_type);
    attr.length = type_and_length >> LENGTH_SHIFT;
    return attr;
}

Result<void> LsfReader::read_attributes_wide(ResourceDocument& doc, std::span<const uint8_t> data,
                                             const std::vector<int32_t>& first_attributes) {
    if (data.size() % WIDE_ATTRIBUTE_SIZE != 0) {
        return Error::corrupt_data("Attribute stream of " + std::to_string(data.size()) +
                                   " bytes is not a whole number of 16-byte records");
    }

    size_t count = data.size() / WIDE_ATTRIBUTE_SIZE;
    BinaryReader reader(data, "attributes");
    doc.attributes_.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        LSV_TRY_ASSIGN(name, reader.read<uint32_t>());
        LSV_TRY_ASSIGN(type_and_length, reader.read<uint32_t>());
        LSV_TRY_ASSIGN(next, reader.read<int32_t>());
        LSV_TRY_ASSIGN(offset, reader.read<uint32_t>());

        LSV_TRY_ASSIGN(attr, make_attribute(doc, i, name, type_and_length));
        if (next != -1) {
            if (next < 0 || static_cast<size_t>(next) >= count) {
                return Error::corrupt_data("Next attribute index " + std::to_string(next) + " is out of range",
                                           "attribute " + std::to_string(i));
            }
            attr.next = static_cast<size_t>(next);
        }
        attr.offset = offset;
        doc.attributes_.push_back(attr);
    }

    // Derive owners by walking every node's chain
    for (size_t n = 0; n < doc.nodes_.size(); ++n) {
        int32_t first = first_attributes[n];
        if (first == -1) {
            continue;
        }
        if (first < 0 || static_cast<size_t>(first) >= count) {
            return Error::corrupt_data("First attribute index " + std::to_string(first) + " is out of range",
                                       "node " + std::to_string(n));
        }

        doc.nodes_[n].first_attribute = static_cast<size_t>(first);
        for (size_t a = doc.nodes_[n].first_attribute; a != npos; a = doc.attributes_[a].next) {
            if (doc.attributes_[a].owner != npos) {
                return Error::corrupt_data("Attribute is reached from more than one chain",
                                           "attribute " + std::to_string(a));
            }
            doc.attributes_[a].owner = n;
        }
    }

    return Result<void>::success();
}

Result<void> LsfReader::read_attributes_compact(ResourceDocument& doc, std::span<const uint8_t> data,
                                                const std::vector<int32_t>& first_attributes) {
    if (data.size() % COMPACT_ATTRIBUTE_SIZE != 0) {
        return Error::corrupt_data("Attribute stream of " + std::to_string(data.size()) +
                                   " bytes is not a whole number of 12-byte records");
    }

    size_t count = data.size() / COMPACT_ATTRIBUTE_SIZE;
    BinaryReader reader(data, "attributes");
    doc.attributes_.reserve(count);

    std::vector<size_t> last_attribute(doc.nodes_.size(), npos);
    std::vector<size_t> derived_first(doc.nodes_.size(), npos);
    uint64_t offset = 0;

    for (size_t i = 0; i < count; ++i) {
        LSV_TRY_ASSIGN(name, reader.read<uint32_t>());
        LSV_TRY_ASSIGN(type_and_length, reader.read<uint32_t>());
        LSV_TRY_ASSIGN(node_index, reader.read<int32_t>());

        LSV_TRY_ASSIGN(attr, make_attribute(doc, i, name, type_and_length));
        if (node_index < 0 || static_cast<size_t>(node_index) >= doc.nodes_.size()) {
            return Error::corrupt_data("Owner node index " + std::to_string(node_index) + " is out of range",
                                       "attribute " + std::to_string(i));
        }

        size_t owner = static_cast<size_t>(node_index);
        attr.owner = owner;
        attr.offset = static_cast<size_t>(offset);
        offset += attr.length;

        if (last_attribute[owner] == npos) {
            derived_first[owner] = i;
        } else {
            doc.attributes_[last_attribute[owner]].next = i;
        }
        last_attribute[owner] = i;

        doc.attributes_.push_back(attr);
    }

    for (size_t n = 0; n < doc.nodes_.size(); ++n) {
        int32_t recorded = first_attributes[n];
        size_t expected = derived_first[n];
        bool matches = (recorded == -1) ? (expected == npos)
                                        : (recorded >= 0 && static_cast<size_t>(recorded) == expected);
        if (!matches) {
            return Error::corrupt_data("First attribute index " + std::to_string(recorded) +
                                       " disagrees with the attribute owners", "node " + std::to_string(n));
        }
        doc.nodes_[n].first_attribute = expected;
    }

    return Result<void>::success();
}

Result<void> LsfReader::check_value_ranges(const ResourceDocument& doc) {
    size_t value_size = doc.values_->size();
    for (size_t i = 0; i < doc.attributes_.size(); ++i) {
        const auto& attr = doc.attributes_[i];
        if (attr.offset > value_size || attr.length > value_size - attr.offset) {
            return Error::corrupt_data("Value range [" + std::to_string(attr.offset) + ", +" +
                                       std::to_string(attr.length) + ") exceeds value stream of " +
                                       std::to_string(value_size) + " bytes", "attribute " + std::to_string(i));
        }
    }
    return Result<void>::success();
}

} // namespace lsv
