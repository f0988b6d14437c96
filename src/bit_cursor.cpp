//
//  bit_cursor.cpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "bit_cursor.hpp"

namespace formatprobe {

namespace {

constexpr unsigned kMaxReadBits = 32;

}  // namespace

std::optional<uint32_t> BitCursor::read(unsigned num_bits) {
    if (num_bits > kMaxReadBits) {
        return std::nullopt;
    }
    uint32_t result = 0;
    for (unsigned i = 0; i < num_bits; ++i) {
        auto bit = read_bit();
        if (!bit) {
            return std::nullopt;
        }
        result = (result << 1) | (*bit ? 1u : 0u);
    }
    return result;
}

std::optional<bool> BitCursor::read_bit() {
    const size_t byte_index = bit_position_ / 8;
    const unsigned bit_index = 7 - static_cast<unsigned>(bit_position_ % 8);
    if (byte_index >= data_.size()) {
        return std::nullopt;
    }
    const bool bit = ((data_[byte_index] >> bit_index) & 0x01) != 0;
    ++bit_position_;
    return bit;
}

bool BitCursor::skip(size_t num_bits) {
    const size_t total_bits = data_.size() * 8;
    if (num_bits > total_bits - bit_position_) {
        // Land on the end so a later read fails as well.
        bit_position_ = total_bits;
        return false;
    }
    bit_position_ += num_bits;
    return true;
}

}  // namespace formatprobe
