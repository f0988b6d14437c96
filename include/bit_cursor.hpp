//
//  bit_cursor.hpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "byte_view.hpp"

namespace formatprobe {

/**
 * @brief MSB-first bit reader over a borrowed byte buffer.
 *
 * The position is a single bit counter that only moves forward. A read that would address a
 * byte past the end fails (nullopt) and leaves the cursor where the failing bit was; callers
 * stop decoding at the first failure.
 */
class BitCursor {
   public:
    explicit BitCursor(ByteView data) : data_(data) {}

    // Read `num_bits` (0..32) bits, first bit read becomes the most significant result bit.
    std::optional<uint32_t> read(unsigned num_bits);

    std::optional<bool> read_bit();

    // Advance by `num_bits`; fails when the new position lies past the end of the buffer.
    bool skip(size_t num_bits);

    size_t bit_position() const { return bit_position_; }
    // Whole bytes touched so far (a partially consumed byte counts).
    size_t bytes_consumed() const { return (bit_position_ + 7) / 8; }

   private:
    ByteView data_;
    size_t bit_position_ = 0;
};

}  // namespace formatprobe
