//
//  aac_extractor.cpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "aac_extractor.hpp"

#include <algorithm>
#include <array>

#include "logging.hpp"

namespace formatprobe {

namespace {

constexpr uint8_t kAdtsSyncByte = 0xFF;
constexpr uint8_t kAdtsSyncMask = 0xF0;
constexpr uint8_t kAdtsSyncPattern = 0xF0;
constexpr uint8_t kAdtsReservedProfile = 0x03;
constexpr uint8_t kAdtsMaxSamplingIndex = 11;
constexpr uint8_t kAdtsMaxChannels = 7;
constexpr uint8_t kAdtsBufferFullness = 0xFC;
constexpr uint8_t kAdtsFrameLengthPadding = 0x1F;
constexpr size_t kAscSize = 2;

constexpr std::array<uint32_t, 13> kSampleRateTable = {96000, 88200, 64000, 48000, 44100,
                                                       32000, 24000, 22050, 16000, 12000,
                                                       11025, 8000,  7350};

bool has_sync(ByteView data) {
    return data.size() >= 2 && data[0] == kAdtsSyncByte &&
           (data[1] & kAdtsSyncMask) == kAdtsSyncPattern;
}

uint16_t frame_length_field(ByteView data) {
    return static_cast<uint16_t>(((data[3] & 0x03) << 11) | (data[4] << 3) |
                                 ((data[5] & 0xE0) >> 5));
}

uint8_t object_type_bits(uint8_t profile_code) {
    switch (profile_code) {
        case kAdtsProfileAacLc:
            return 1;
        case kAdtsProfileHeAacV1:
            return 2;
        case kAdtsProfileHeAacV2:
            return 3;
        default:
            return 1;
    }
}

// AudioSpecificConfig object type -> profile code.
uint8_t profile_code_for_object_type(uint8_t audio_object_type) {
    switch (audio_object_type) {
        case 1:
            return kAdtsProfileAacLc;
        case 2:
            return kAdtsProfileHeAacV1;
        case 5:
            return kAdtsProfileHeAacV2;
        default:
            return kAdtsProfileAacLc;
    }
}

}  // namespace

uint8_t adts_sampling_index(uint32_t sample_rate) {
    for (size_t i = 0; i < kSampleRateTable.size(); ++i) {
        if (kSampleRateTable[i] == sample_rate) {
            return static_cast<uint8_t>(i);
        }
    }
    return kAdtsForbiddenSamplingIndex;
}

uint32_t adts_sample_rate(uint8_t sampling_index) {
    return sampling_index < kSampleRateTable.size() ? kSampleRateTable[sampling_index] : 0;
}

bool is_adts_like(ByteView data) {
    if (data.size() < kAdtsHeaderNoCrc || !has_sync(data)) {
        return false;
    }
    // Layer must be '00' for AAC.
    const uint8_t layer = (data[1] & 0x06) >> 1;
    if (layer != 0) {
        return false;
    }
    const uint8_t profile = (data[2] & 0xC0) >> 6;
    if (profile == kAdtsReservedProfile) {
        return false;
    }
    const uint8_t sampling_index = (data[2] & 0x3C) >> 2;
    return sampling_index <= kAdtsMaxSamplingIndex;
}

std::optional<AdtsHeader> parse_adts_header(ByteView data) {
    if (data.size() < kAdtsHeaderNoCrc || !has_sync(data)) {
        return std::nullopt;
    }
    AdtsHeader h;
    h.protection_absent = (data[1] & 0x01) != 0;
    if (data.size() < h.header_size()) {
        return std::nullopt;
    }
    h.profile = (data[2] >> 6) & 0x03;
    h.sampling_index = (data[2] >> 2) & 0x0F;
    if (h.sampling_index > kAdtsMaxSamplingIndex) {
        return std::nullopt;
    }
    h.sample_rate = adts_sample_rate(h.sampling_index);
    h.channel_config = static_cast<uint8_t>(((data[2] & 0x01) << 2) | ((data[3] >> 6) & 0x03));
    h.frame_length = frame_length_field(data);
    if (h.frame_length < h.header_size()) {
        return std::nullopt;
    }
    return h;
}

std::optional<ByteView> extract_adts_payload(ByteView data) {
    if (data.size() < kAdtsHeaderNoCrc || !has_sync(data)) {
        return std::nullopt;
    }
    const bool protection_absent = (data[1] & 0x01) != 0;
    const size_t header_size = protection_absent ? kAdtsHeaderNoCrc : kAdtsHeaderWithCrc;
    if (data.size() < header_size) {
        return std::nullopt;
    }
    const size_t frame_length = frame_length_field(data);
    if (frame_length < header_size || data.size() < frame_length) {
        return std::nullopt;
    }
    return data.subview(header_size, frame_length - header_size);
}

std::vector<uint8_t> ensure_adts_header(ByteView payload, uint8_t channels, uint32_t sample_rate) {
    if (extract_adts_payload(payload)) {
        return payload.to_vector();
    }

    // Not ADTS: assume a leading 2-byte AudioSpecificConfig. The first 5 bits carry the
    // object type.
    // TODO: derive the config length from the object type instead of assuming 2 bytes
    // (explicit SBR/PS signalling makes it longer).
    const uint8_t audio_object_type = payload.empty() ? 0 : static_cast<uint8_t>(payload[0] >> 3);
    const uint8_t profile = profile_code_for_object_type(audio_object_type);
    const ByteView raw = payload.subview(kAscSize);
    if (payload.size() < kAscSize) {
        FP_LOG("adts", "payload shorter than config (" << payload.size()
                                                       << " bytes); emitting bare header");
    }

    std::vector<uint8_t> out = build_adts_header(profile, channels, sample_rate, raw.size(), false);
    out.insert(out.end(), raw.begin(), raw.end());
    return out;
}

std::vector<uint8_t> build_adts_header(uint8_t profile_code, uint8_t channels,
                                       uint32_t sample_rate, size_t aac_frame_length,
                                       bool has_crc) {
    const uint8_t object_type = object_type_bits(profile_code);
    const uint8_t sampling_index = adts_sampling_index(sample_rate);
    const uint8_t channel_config = std::min(channels, kAdtsMaxChannels);
    const size_t header_length = has_crc ? kAdtsHeaderWithCrc : kAdtsHeaderNoCrc;
    const size_t frame_length = aac_frame_length + header_length;
    if (frame_length > kAdtsMaxFrameLength) {
        FP_LOG("adts", "frame length " << frame_length << " exceeds 13 bits; truncated");
    }

    std::vector<uint8_t> header;
    header.reserve(header_length);
    const uint8_t protection_absent = has_crc ? 0 : 1;

    header.push_back(kAdtsSyncByte);
    header.push_back(static_cast<uint8_t>(kAdtsSyncPattern | protection_absent));
    header.push_back(
        static_cast<uint8_t>((object_type << 6) | (sampling_index << 2) | (channel_config >> 2)));
    header.push_back(
        static_cast<uint8_t>(((channel_config & 0x03) << 6) | ((frame_length >> 11) & 0x03)));
    header.push_back(static_cast<uint8_t>((frame_length >> 3) & 0xFF));
    header.push_back(static_cast<uint8_t>(((frame_length & 0x07) << 5) | kAdtsFrameLengthPadding));
    header.push_back(kAdtsBufferFullness);

    if (has_crc) {
        header.push_back(0x00);
        header.push_back(0x00);
    }
    return header;
}

AdtsStream split_adts_frames(ByteView data) {
    AdtsStream out;

    size_t i = 0;
    while (i + kAdtsHeaderNoCrc <= data.size()) {
        const ByteView at = data.subview(i);
        if (!has_sync(at)) {
            i++;
            continue;
        }
        const size_t len = frame_length_field(at);
        if (len < kAdtsHeaderNoCrc || len > at.size()) {
            i++;
            continue;
        }

        // Stream config from the first frame.
        if (out.frames.empty()) {
            const uint8_t profile = (at[2] >> 6) & 0x03;
            out.audio_object_type = profile + 1;  // 1=MAIN,2=LC,...
            out.sampling_index = (at[2] >> 2) & 0x0F;
            out.channel_config =
                static_cast<uint8_t>(((at[2] & 0x01) << 2) | ((at[3] >> 6) & 0x03));
            out.sample_rate = adts_sample_rate(out.sampling_index);
        }

        // Strip ADTS header (7 or 9 bytes depending on CRC).
        const bool protection_absent = (at[1] & 0x01) != 0;
        const size_t header_size = protection_absent ? kAdtsHeaderNoCrc : kAdtsHeaderWithCrc;
        if (len <= header_size) {
            i++;
            continue;
        }

        out.frames.push_back(at.subview(header_size, len - header_size));
        i += len;
    }

    FP_LOG("adts", "split " << out.frames.size() << " frames, rate=" << out.sample_rate
                            << " channels=" << static_cast<int>(out.channel_config));
    return out;
}

}  // namespace formatprobe
