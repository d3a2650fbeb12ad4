/**
 * LSV Inspector - Attribute value decoder
 *
 * Interprets an attribute's slice of the value stream according to its type tag.
 */

#pragma once

#include "data_types.hpp"
#include "resource.hpp"
#include "result.hpp"
#include <span>
#include <cstdint>

namespace lsv {

/**
 * Maximum nesting of translated format strings inside their own arguments.
 */
constexpr size_t MAX_FS_STRING_DEPTH = 32;

/**
 * Whether translated strings use the versioned layout (u16 version + handle)
 * rather than the older (value, handle) pair.
 */
bool has_versioned_translated_strings(const ResourceFormat& format);

/**
 * Same question for translated format strings and their nested arguments.
 * Only the LSOF version decides here; the engine version is not consulted.
 */
bool has_versioned_translated_fs_strings(const ResourceFormat& format);

/**
 * Decode one attribute against a value stream. The attribute's range must lie
 * inside `values` and its bytes must be consumed exactly.
 */
Result<Value> decode_value(const Attribute& attribute, std::span<const uint8_t> values,
                           const ResourceFormat& format);

/**
 * Decode one attribute of a document.
 */
Result<Value> decode_value(const ResourceDocument& document, const Attribute& attribute);

} // namespace lsv
