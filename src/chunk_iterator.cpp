//
//  chunk_iterator.cpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "chunk_iterator.hpp"

#include "logging.hpp"

namespace formatprobe {

std::string to_string(ChunkError error) {
    switch (error) {
        case ChunkError::None:
            return "ok";
        case ChunkError::IncompleteLengthPrefix:
            return "incomplete length prefix";
        case ChunkError::IncompleteChunkData:
            return "incomplete chunk data";
    }
    return "unknown";
}

std::optional<ChunkRecord> ChunkIterator::next() {
    if (done_) {
        return std::nullopt;
    }

    ChunkRecord record;
    record.index = index_++;

    const size_t remain = data_.size() - pos_;
    if (remain < kChunkLengthPrefixSize) {
        done_ = true;
        if (remain == 0) {
            return std::nullopt;
        }
        FP_LOG("chunk", "record " << record.index << ": " << remain
                                  << " trailing bytes, prefix truncated");
        record.error = ChunkError::IncompleteLengthPrefix;
        return record;
    }

    const size_t length = read_u32_le(data_.data() + pos_);
    pos_ += kChunkLengthPrefixSize;

    if (length > data_.size() - pos_) {
        done_ = true;
        FP_LOG("chunk", "record " << record.index << ": declared " << length << " bytes, "
                                  << (data_.size() - pos_) << " available");
        record.error = ChunkError::IncompleteChunkData;
        return record;
    }

    record.payload = data_.subview(pos_, length);
    pos_ += length;
    return record;
}

}  // namespace formatprobe
