//
//  chunk_iterator.hpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>

#include "byte_view.hpp"

namespace formatprobe {

enum class ChunkError { None = 0, IncompleteLengthPrefix, IncompleteChunkData };

std::string to_string(ChunkError error);

inline constexpr size_t kChunkLengthPrefixSize = 4;

struct ChunkRecord {
    size_t index = 0;  // position in iteration order
    ByteView payload;
    ChunkError error{ChunkError::None};

    bool ok() const { return error == ChunkError::None; }
};

/**
 * @brief Single-pass splitter of `[u32 little-endian length][payload]` records.
 *
 * A truncated prefix or payload yields one error record and ends the sequence. Trailing
 * bytes are never silently dropped: the sequence only ends cleanly at the exact buffer end.
 */
class ChunkIterator {
   public:
    explicit ChunkIterator(ByteView data) : data_(data) {}

    std::optional<ChunkRecord> next();

    // Input-range adaptor; both share the state of the owning ChunkIterator.
    class Cursor {
       public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ChunkRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const ChunkRecord *;
        using reference = const ChunkRecord &;

        Cursor() = default;
        explicit Cursor(ChunkIterator *owner) : owner_(owner) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        Cursor &operator++() {
            advance();
            return *this;
        }
        bool operator==(const Cursor &other) const { return owner_ == other.owner_; }
        bool operator!=(const Cursor &other) const { return !(*this == other); }

       private:
        void advance() {
            current_ = owner_ ? owner_->next() : std::nullopt;
            if (!current_) {
                owner_ = nullptr;
            }
        }

        ChunkIterator *owner_ = nullptr;
        std::optional<ChunkRecord> current_;
    };

    Cursor begin() { return Cursor(this); }
    Cursor end() { return Cursor(); }

   private:
    ByteView data_;
    size_t pos_ = 0;
    size_t index_ = 0;
    bool done_ = false;
};

}  // namespace formatprobe
