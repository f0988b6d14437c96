//
//  flac_header.hpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "bit_cursor.hpp"
#include "byte_view.hpp"

namespace formatprobe {

enum class FlacError {
    None = 0,
    InvalidSyncCode,
    InvalidChannelMode,     // error_code holds the channel assignment (11..15)
    InvalidSampleSizeCode,  // error_code holds the sample size code (3)
    InvalidPadding,
    UTF8DecodingError,
    ReservedBlocksizeCode,
    IllegalSampleRateCode,  // error_code holds the sample rate code (15)
    UnexpectedEndOfInput,
};

std::string to_string(FlacError error);

// Stereo decorrelation submodes; independent channels use kFlacChannelModeIndependent.
inline constexpr uint8_t kFlacChannelModeIndependent = 0;
inline constexpr uint8_t kFlacChannelModeLeftSide = 1;
inline constexpr uint8_t kFlacChannelModeRightSide = 2;
inline constexpr uint8_t kFlacChannelModeMidSide = 3;

inline constexpr size_t kFlacStreamInfoSize = 34;

struct FlacFrameInfo {
    bool is_var_size = false;
    uint8_t blocking_strategy = 0;
    uint16_t block_size = 0;
    uint32_t sample_rate = 0;          // 0 = take from STREAMINFO
    uint8_t channel_mode = kFlacChannelModeIndependent;
    uint8_t channels = 0;
    uint8_t bits_per_sample = 0;       // 0 = take from STREAMINFO
    uint64_t frame_or_sample_number = 0;
    uint8_t header_crc8 = 0;           // read, not verified
    size_t header_size = 0;            // bytes up to and including the CRC-8
};

struct FlacHeaderResult {
    FlacError error{FlacError::None};
    uint8_t error_code{0};
    FlacFrameInfo info;

    bool ok() const { return error == FlacError::None; }
};

struct FlacNumberResult {
    FlacError error{FlacError::None};
    uint64_t value{0};

    bool ok() const { return error == FlacError::None; }
};

// Decode the UTF-8 style coded frame/sample number at the cursor position.
FlacNumberResult read_utf8_coded_number(BitCursor &reader);

// True when the first 15 bits carry the frame sync code 0x7FFC.
bool is_flac_frame(ByteView data);

// Decode the frame header at the start of `data`.
FlacHeaderResult decode_frame_header(ByteView data);

/**
 * @brief Split a buffer into frames at every 0xFF 0xF8..0xFB sync pattern.
 *
 * Bytes before the first sync are dropped. This is a best-effort boundary finder: sync-like
 * bytes inside a compressed frame payload start a new (bogus) frame.
 */
std::vector<ByteView> split_flac_frames(ByteView data);

// Slice starting at the first sync pattern; empty when there is none.
ByteView find_first_flac_frame(ByteView data);

// Build a 34-byte STREAMINFO body describing a stream of frames like `info`.
std::vector<uint8_t> create_streaminfo(const FlacFrameInfo &info);

}  // namespace formatprobe
