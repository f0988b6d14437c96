//
//  byte_view.hpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace formatprobe {

/**
 * @brief Non-owning view over a caller-owned byte buffer.
 *
 * A view never outlives the buffer it was taken from. Sub-views are clamped to the parent
 * range so that slicing can never address memory outside of it.
 */
class ByteView {
   public:
    ByteView() = default;
    ByteView(const uint8_t *data, size_t size) : data_(size ? data : nullptr), size_(size) {}
    ByteView(const std::vector<uint8_t> &buf) : ByteView(buf.data(), buf.size()) {}

    const uint8_t *data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    const uint8_t *begin() const { return data_; }
    const uint8_t *end() const { return data_ + size_; }

    // Unchecked; callers validate the index first.
    uint8_t operator[](size_t i) const { return data_[i]; }

    // Bytes [offset, offset + count), clamped to the view.
    ByteView subview(size_t offset, size_t count = static_cast<size_t>(-1)) const {
        if (offset >= size_) {
            return {};
        }
        const size_t remain = size_ - offset;
        return {data_ + offset, count < remain ? count : remain};
    }

    // Offset of this view's first byte inside `parent`; only meaningful for sub-views.
    size_t offset_in(const ByteView &parent) const {
        return static_cast<size_t>(data_ - parent.data_);
    }

    std::vector<uint8_t> to_vector() const { return std::vector<uint8_t>(begin(), end()); }

    // True when the 4 bytes at `offset` equal `tag`.
    bool matches_at(size_t offset, const char tag[4]) const {
        if (offset > size_ || size_ - offset < 4) {
            return false;
        }
        for (size_t i = 0; i < 4; ++i) {
            if (data_[offset + i] != static_cast<uint8_t>(tag[i])) {
                return false;
            }
        }
        return true;
    }

   private:
    const uint8_t *data_ = nullptr;
    size_t size_ = 0;
};

inline uint32_t read_u32_be(const uint8_t *p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) |
           (uint32_t(p[3]));
}

inline uint64_t read_u64_be(const uint8_t *p) {
    return (uint64_t(read_u32_be(p)) << 32) | uint64_t(read_u32_be(p + 4));
}

inline uint32_t read_u32_le(const uint8_t *p) {
    return (uint32_t(p[3]) << 24) | (uint32_t(p[2]) << 16) | (uint32_t(p[1]) << 8) |
           (uint32_t(p[0]));
}

}  // namespace formatprobe
