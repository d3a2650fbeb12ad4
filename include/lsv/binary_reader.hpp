/**
 * LSV Inspector - Bounds-checked little-endian reader
 *
 * Sequential cursor over a borrowed byte buffer. Every read checks the
 * remaining length first and reports a short buffer as CorruptData.
 */

#pragma once

#include "result.hpp"
#include <span>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>

namespace lsv {

class BinaryReader {
public:
    explicit BinaryReader(std::span<const uint8_t> data, std::string context = "")
        : data_(data), context_(std::move(context)) {}

    size_t position() const { return pos_; }
    size_t size() const { return data_.size(); }
    size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ >= data_.size(); }

    Result<void> seek(size_t pos) {
        if (pos > data_.size()) {
            return out_of_bounds(pos, 0);
        }
        pos_ = pos;
        return Result<void>::success();
    }

    Result<void> skip(size_t count) {
        if (count > remaining()) {
            return out_of_bounds(pos_, count);
        }
        pos_ += count;
        return Result<void>::success();
    }

    /**
     * Read a little-endian integer or IEEE float.
     */
    template<typename T>
    Result<T> read() {
        static_assert(std::is_arithmetic_v<T>, "BinaryReader::read needs an arithmetic type");
        if (sizeof(T) > remaining()) {
            return out_of_bounds(pos_, sizeof(T));
        }

        using Bits = std::conditional_t<sizeof(T) == 1, uint8_t,
                     std::conditional_t<sizeof(T) == 2, uint16_t,
                     std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>>;
        Bits bits = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            bits |= static_cast<Bits>(static_cast<Bits>(data_[pos_ + i]) << (8 * i));
        }
        pos_ += sizeof(T);

        T value;
        std::memcpy(&value, &bits, sizeof(T));
        return value;
    }

    /**
     * Borrow the next `count` bytes.
     */
    Result<std::span<const uint8_t>> read_bytes(size_t count) {
        if (count > remaining()) {
            return out_of_bounds(pos_, count);
        }
        auto view = data_.subspan(pos_, count);
        pos_ += count;
        return view;
    }

private:
    Error out_of_bounds(size_t pos, size_t count) const {
        return Error::corrupt_data("Read of " + std::to_string(count) + " bytes at offset " +
                                   std::to_string(pos) + " exceeds buffer of " +
                                   std::to_string(data_.size()) + " bytes", context_);
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
    std::string context_;
};

} // namespace lsv
