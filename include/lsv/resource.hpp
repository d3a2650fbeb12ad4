/**
 * LSV Inspector - LSOF resource documents
 *
 * An LSOF resource is a forest of named nodes carrying typed attributes.
 * Nodes and attributes live in flat arrays linked by indices; `npos` marks
 * an absent link. Value bytes stay in one shared buffer owned by the document.
 */

#pragma once

#include "data_types.hpp"
#include "result.hpp"
#include "string_table.hpp"
#include "types.hpp"
#include <vector>
#include <string>
#include <string_view>
#include <span>
#include <cstdint>

namespace lsv {

class BinaryReader;

/**
 * LSOF format revisions.
 */
enum class LsofVersion : uint32_t {
    Initial = 1,
    ChunkedCompress = 2,     // LZ4 frame streams
    ExtendedNodes = 3,       // Wide node/attribute records when sibling data is present
    BG3 = 4,                 // Translated strings carry a u16 version
    BG3ExtendedHeader = 5,   // 64-bit engine version
    BG3AdditionalBlob = 6,   // Extra u64 in the metadata block
    BG3Patch3 = 7
};

constexpr uint32_t LSOF_VERSION_MIN = static_cast<uint32_t>(LsofVersion::Initial);
constexpr uint32_t LSOF_VERSION_MAX = static_cast<uint32_t>(LsofVersion::BG3Patch3);

/**
 * On-disk shape of node and attribute records.
 */
enum class NodeLayout {
    Compact,  // 12-byte records, attributes grouped by owner index
    Wide      // 16-byte records with explicit sibling and next-attribute links
};

const char* node_layout_string(NodeLayout layout);

/**
 * Format parameters that steer table and value decoding.
 */
struct ResourceFormat {
    uint32_t lsof_version = LSOF_VERSION_MAX;
    PackedVersion engine_version;
    bool has_sibling_data = false;

    NodeLayout layout() const {
        return (lsof_version >= static_cast<uint32_t>(LsofVersion::ExtendedNodes) && has_sibling_data)
            ? NodeLayout::Wide : NodeLayout::Compact;
    }
};

/**
 * LSOF metadata block: per-stream sizes plus compression and layout flags.
 */
struct LsofMetadata {
    uint32_t strings_uncompressed_size = 0;
    uint32_t strings_size_on_disk = 0;
    uint64_t unknown = 0;                    // v6+ only
    uint32_t nodes_uncompressed_size = 0;
    uint32_t nodes_size_on_disk = 0;
    uint32_t attributes_uncompressed_size = 0;
    uint32_t attributes_size_on_disk = 0;
    uint32_t values_uncompressed_size = 0;
    uint32_t values_size_on_disk = 0;
    uint8_t compression_flags = 0;
    uint8_t unknown2 = 0;
    uint16_t unknown3 = 0;
    uint32_t has_sibling_data = 0;
};

struct LsofHeader {
    ResourceFormat format;
    LsofMetadata metadata;
};

struct Node {
    NameRef name;
    size_t parent = npos;
    size_t first_attribute = npos;
    size_t first_child = npos;
    size_t next_sibling = npos;

    bool is_root() const { return parent == npos; }
};

struct Attribute {
    NameRef name;
    DataType type = DataType::None;
    uint32_t length = 0;
    size_t next = npos;
    size_t offset = 0;     // Into the value stream
    size_t owner = npos;   // Owning node
};

/**
 * Decoded LSOF resource.
 */
class ResourceDocument {
public:
    ResourceDocument() = default;

    const ResourceFormat& format() const { return format_; }
    const StringTable& strings() const { return strings_; }
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Attribute>& attributes() const { return attributes_; }
    const SharedBytes& values() const { return values_; }

    size_t node_count() const { return nodes_.size(); }
    size_t attribute_count() const { return attributes_.size(); }

    /**
     * Root nodes (regions) in file order.
     */
    std::vector<size_t> roots() const;

    /**
     * First root with the given name, or npos.
     */
    size_t find_region(std::string_view name) const;

    /**
     * First child of `node` with the given name, or npos.
     */
    size_t find_child(size_t node, std::string_view name) const;

    /**
     * First attribute of `node` with the given name, or npos.
     */
    size_t find_attribute(size_t node, std::string_view name) const;

    std::vector<size_t> children(size_t node) const;
    std::vector<size_t> attributes(size_t node) const;

    const std::string& node_name(size_t node) const;
    const std::string& attribute_name(size_t attribute) const;

    /**
     * Raw value bytes of an attribute, borrowed from the shared value buffer.
     */
    std::span<const uint8_t> attribute_bytes(const Attribute& attribute) const;

private:
    friend class LsfReader;

    ResourceFormat format_;
    StringTable strings_;
    std::vector<Node> nodes_;
    std::vector<Attribute> attributes_;
    SharedBytes values_;
};

/**
 * LSOF decoder.
 */
class LsfReader {
public:
    /**
     * Decode a complete LSOF file: header, the four streams, then the tables.
     */
    static Result<ResourceDocument> read(std::span<const uint8_t> data);

    /**
     * Parse the header and metadata block only.
     */
    static Result<LsofHeader> read_header(std::span<const uint8_t> data);

    /**
     * Build a document from already decompressed node, attribute and value streams.
     */
    static Result<ResourceDocument> parse_tables(std::span<const uint8_t> node_bytes,
                                                 std::span<const uint8_t> attribute_bytes,
                                                 SharedBytes value_bytes,
                                                 StringTable strings,
                                                 const ResourceFormat& format);

private:
    static Result<LsofHeader> parse_header(BinaryReader& reader);

    static Result<ResourceDocument> decode_tables(std::span<const uint8_t> node_bytes,
                                                  std::span<const uint8_t> attribute_bytes,
                                                  SharedBytes value_bytes,
                                                  StringTable strings,
                                                  const ResourceFormat& format);

    static Result<void> read_nodes_wide(ResourceDocument& doc, std::span<const uint8_t> data,
                                        std::vector<int32_t>& first_attributes);
    static Result<void> read_nodes_compact(ResourceDocument& doc, std::span<const uint8_t> data,
                                           std::vector<int32_t>& first_attributes);
    static Result<void> read_attributes_wide(ResourceDocument& doc, std::span<const uint8_t> data,
                                             const std::vector<int32_t>& first_attributes);
    static Result<void> read_attributes_compact(ResourceDocument& doc, std::span<const uint8_t> data,
                                                const std::vector<int32_t>& first_attributes);

    static Result<void> add_node(ResourceDocument& doc, uint32_t name, int32_t parent,
                                 std::vector<size_t>& last_child);
    static Result<Attribute> make_attribute(const ResourceDocument& doc, size_t index,
                                            uint32_t name, uint32_t type_and_length);
    static Result<void> check_value_ranges(const ResourceDocument& doc);
};

} // namespace lsv
