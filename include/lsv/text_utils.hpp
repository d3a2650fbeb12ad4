/**
 * LSV Inspector - Text Utilities
 *
 * Path and string helpers shared by the package and resource readers.
 */

#pragma once

#include <string>
#include <string_view>
#include <algorithm>
#include <span>
#include <cstdint>

namespace lsv {

/**
 * Convert backslash separators to forward slashes.
 */
inline std::string normalize_path(std::string_view path) {
    std::string result(path);
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

/**
 * ASCII lowercase copy.
 */
inline std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>((c >= 'A' && c <= 'Z') ? c + ('a' - 'A') : c);
    });
    return result;
}

/**
 * ASCII case-insensitive comparison.
 */
inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    return to_lower(a) == to_lower(b);
}

/**
 * Check if path ends with given suffix (case-insensitive).
 */
inline bool path_ends_with(std::string_view path, std::string_view suffix) {
    if (suffix.size() > path.size()) return false;
    return iequals(path.substr(path.size() - suffix.size()), suffix);
}

/**
 * Strict UTF-8 validation: rejects overlong forms, surrogates and code points above U+10FFFF.
 */
inline bool is_valid_utf8(std::span<const uint8_t> bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        uint8_t c = bytes[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t extra = 0;
        uint32_t min_cp = 0;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) {
            extra = 1; min_cp = 0x80; cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2; min_cp = 0x800; cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3; min_cp = 0x10000; cp = c & 0x07;
        } else {
            return false;
        }

        if (bytes.size() - i <= extra) return false;
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cc = bytes[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += extra + 1;
    }
    return true;
}

inline bool is_valid_utf8(std::string_view text) {
    return is_valid_utf8(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

} // namespace lsv
