//
//  aac_extractor.hpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "byte_view.hpp"

namespace formatprobe {

// Profile codes accepted by build_adts_header().
inline constexpr uint8_t kAdtsProfileAacLc = 0x66;
inline constexpr uint8_t kAdtsProfileHeAacV1 = 0x67;
inline constexpr uint8_t kAdtsProfileHeAacV2 = 0x68;

inline constexpr size_t kAdtsHeaderNoCrc = 7;
inline constexpr size_t kAdtsHeaderWithCrc = 9;
inline constexpr uint8_t kAdtsForbiddenSamplingIndex = 0x0F;
inline constexpr size_t kAdtsMaxFrameLength = 0x1FFF;

struct AdtsHeader {
    bool protection_absent = true;  // false: a 2-byte CRC follows the fixed header
    uint8_t profile = 0;            // 2-bit object type minus one (1 = AAC LC)
    uint8_t sampling_index = 0;     // 0..11
    uint32_t sample_rate = 0;
    uint8_t channel_config = 0;     // 0..7
    uint16_t frame_length = 0;      // 13 bits, header included

    size_t header_size() const { return protection_absent ? kAdtsHeaderNoCrc : kAdtsHeaderWithCrc; }
};

struct AdtsStream {
    std::vector<ByteView> frames;  // raw AAC frames (ADTS header stripped)

    uint32_t sample_rate = 0;
    uint8_t sampling_index = 0;
    uint8_t channel_config = 0;
    uint8_t audio_object_type = 0;  // e.g. 2 = AAC LC
};

// Structural plausibility check of an ADTS fixed header at the start of `data`.
bool is_adts_like(ByteView data);

// Decode the fixed + variable header fields at the start of `data`.
std::optional<AdtsHeader> parse_adts_header(ByteView data);

// Raw frame payload between the header and the declared frame length.
std::optional<ByteView> extract_adts_payload(ByteView data);

/**
 * @brief Return `payload` as an ADTS frame, synthesizing a header when it has none.
 *
 * Input without a parsable ADTS header is treated as a 2-byte AudioSpecificConfig followed by
 * raw AAC data; the config bytes are dropped and replaced by a 7-byte header. Unknown object
 * types fall back to AAC-LC. Never fails.
 */
std::vector<uint8_t> ensure_adts_header(ByteView payload, uint8_t channels, uint32_t sample_rate);

// Build a 7-byte (or 9-byte with zeroed CRC) ADTS header for `aac_frame_length` payload bytes.
// The frame length field is 13 bits: payload plus header must not exceed 0x1FFF bytes, longer
// frames are written with the length masked and do not parse back.
std::vector<uint8_t> build_adts_header(uint8_t profile_code, uint8_t channels,
                                       uint32_t sample_rate, size_t aac_frame_length,
                                       bool has_crc);

// Sampling frequency index of `sample_rate`, kAdtsForbiddenSamplingIndex when not standard.
uint8_t adts_sampling_index(uint32_t sample_rate);

// Sample rate for an index; 0 for reserved/forbidden indices.
uint32_t adts_sample_rate(uint8_t sampling_index);

// Walk concatenated ADTS frames, skipping bytes that do not start a plausible frame.
AdtsStream split_adts_frames(ByteView data);

}  // namespace formatprobe
