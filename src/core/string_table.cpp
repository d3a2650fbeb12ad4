/**
 * LSV Inspector - String Table Implementation
 */

#include "lsv/string_table.hpp"
#include "lsv/binary_reader.hpp"
#include "lsv/text_utils.hpp"

namespace lsv {

Result<StringTable> StringTable::parse(std::span<const uint8_t> data) {
    BinaryReader reader(data, "string table");
    StringTable table;

    LSV_TRY_ASSIGN(page_count, reader.read<uint32_t>());

    // Each page needs at least its 2-byte count
    if (page_count > reader.remaining() / 2) {
        return Error::corrupt_data("String table declares " + std::to_string(page_count) +
                                   " pages in " + std::to_string(data.size()) + " bytes");
    }
    table.pages_.reserve(page_count);

    for (uint32_t p = 0; p < page_count; ++p) {
        LSV_TRY_ASSIGN(string_count, reader.read<uint16_t>());

        std::vector<std::string> page;
        page.reserve(string_count);

        for (uint16_t i = 0; i < string_count; ++i) {
            LSV_TRY_ASSIGN(length, reader.read<uint16_t>());
            LSV_TRY_ASSIGN(bytes, reader.read_bytes(length));

            if (!is_valid_utf8(bytes)) {
                return Error::invalid_encoding("String table entry is not valid UTF-8",
                                               "page " + std::to_string(p) + ", index " + std::to_string(i));
            }
            page.emplace_back(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        }

        table.pages_.push_back(std::move(page));
    }

    return table;
}

Result<std::string> StringTable::lookup(NameRef ref) const {
    if (!contains(ref)) {
        return Error::corrupt_data("Name reference (" + std::to_string(ref.page) + ", " +
                                   std::to_string(ref.index) + ") is outside the string table");
    }
    return pages_[ref.page][ref.index];
}

const std::string& StringTable::get(NameRef ref) const {
    static const std::string empty;
    if (!contains(ref)) {
        return empty;
    }
    return pages_[ref.page][ref.index];
}

size_t StringTable::string_count() const {
    size_t count = 0;
    for (const auto& page : pages_) {
        count += page.size();
    }
    return count;
}

} // namespace lsv
