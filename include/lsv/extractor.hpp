/**
 * LSV Inspector - Extraction facade
 *
 * Composes the package reader, LSOF reader and value decoder:
 * - package bytes + member name -> ResourceDocument
 * - document + node path + attribute name -> Attribute / Value / blob bytes
 */

#pragma once

#include "lsv/data_types.hpp"
#include "lsv/package_reader.hpp"
#include "lsv/resource.hpp"
#include "lsv/result.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lsv {

/**
 * Name of the save member holding global state.
 */
inline constexpr const char* GLOBALS_MEMBER = "Globals.lsf";

/**
 * Decoded member paired with its package name.
 */
struct NamedDocument {
    std::string name;
    ResourceDocument document;
};

/**
 * Open a package and decode one LSOF member. The bytes are copied into a
 * buffer the package owns; callers already holding a SharedBytes save should
 * use that overload, or open a Package once when extracting several members.
 */
Result<ResourceDocument> extract_document(std::span<const uint8_t> package_bytes, const std::string& member_name);

/**
 * Open a package over a shared buffer (no copy) and decode one LSOF member.
 */
Result<ResourceDocument> extract_document(SharedBytes package_bytes, const std::string& member_name);

/**
 * Decode one LSOF member of an opened package.
 */
Result<ResourceDocument> extract_document(const Package& package, const std::string& member_name);

/**
 * Locate an attribute by node path. path[0] names a region (root node), each
 * further segment a child of the previous node. The first match in file order
 * wins at every step.
 */
Result<Attribute> find_attribute(const ResourceDocument& document,
                                 const std::vector<std::string>& path,
                                 std::string_view attribute_name);

/**
 * find_attribute followed by a decode of the value.
 */
Result<Value> value_at(const ResourceDocument& document,
                       const std::vector<std::string>& path,
                       std::string_view attribute_name);

/**
 * Raw bytes of a ScratchBuffer attribute; TypeMismatch for any other type.
 */
Result<Blob> blob_at(const ResourceDocument& document,
                     const std::vector<std::string>& path,
                     std::string_view attribute_name);

/**
 * Decode Globals.lsf (case-insensitive match).
 */
Result<ResourceDocument> load_globals(const Package& package);

/**
 * Decode every .lsf member in file table order. The first failure aborts.
 */
Result<std::vector<NamedDocument>> load_all_resources(const Package& package);

/**
 * Split "a/b/c" into segments, dropping empty ones.
 */
std::vector<std::string> split_node_path(std::string_view path);

} // namespace lsv
