//
//  mp3_header.cpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "mp3_header.hpp"

#include <array>

#include "logging.hpp"

namespace formatprobe {

namespace {

using BitrateTable = std::array<uint16_t, 14>;

// Bitrates in kbps for indices 1..14.
constexpr BitrateTable kBitrateV1L1 = {32,  64,  96,  128, 160, 192, 224,
                                       256, 288, 320, 352, 384, 416, 448};
constexpr BitrateTable kBitrateV1L2 = {32,  48,  56,  64,  80,  96,  112,
                                       128, 160, 192, 224, 256, 320, 384};
constexpr BitrateTable kBitrateV1L3 = {32, 40, 48,  56,  64,  80,  96,
                                       112, 128, 160, 192, 224, 256, 320};
constexpr BitrateTable kBitrateV2L1 = {32,  48,  56,  64,  80,  96,  112,
                                       128, 144, 160, 176, 192, 224, 256};
constexpr BitrateTable kBitrateV2L2L3 = {8,  16, 24, 32,  40,  48,  56,
                                         64, 80, 96, 112, 128, 144, 160};

constexpr std::array<uint32_t, 3> kSampleRateV1 = {44100, 48000, 32000};
constexpr std::array<uint32_t, 3> kSampleRateV2 = {22050, 24000, 16000};
constexpr std::array<uint32_t, 3> kSampleRateV25 = {11025, 12000, 8000};

constexpr uint8_t kReservedEmphasis = 0x02;

const BitrateTable &bitrate_table(MpegVersion version, MpegLayer layer) {
    if (version == MpegVersion::V1) {
        switch (layer) {
            case MpegLayer::LayerI:
                return kBitrateV1L1;
            case MpegLayer::LayerII:
                return kBitrateV1L2;
            case MpegLayer::LayerIII:
                return kBitrateV1L3;
        }
    }
    return layer == MpegLayer::LayerI ? kBitrateV2L1 : kBitrateV2L2L3;
}

const std::array<uint32_t, 3> &sample_rate_table(MpegVersion version) {
    switch (version) {
        case MpegVersion::V1:
            return kSampleRateV1;
        case MpegVersion::V2:
            return kSampleRateV2;
        case MpegVersion::V25:
            break;
    }
    return kSampleRateV25;
}

uint16_t samples_per_frame(MpegVersion version, MpegLayer layer) {
    switch (layer) {
        case MpegLayer::LayerI:
            return 384;
        case MpegLayer::LayerII:
            return 1152;
        case MpegLayer::LayerIII:
            break;
    }
    return version == MpegVersion::V1 ? 1152 : 576;
}

size_t frame_length_bytes(uint16_t samples, uint16_t bitrate_kbps, uint32_t sample_rate,
                          MpegLayer layer, bool padding) {
    const uint64_t bits = static_cast<uint64_t>(samples) * bitrate_kbps * 1000;
    uint64_t length = bits / (static_cast<uint64_t>(sample_rate) * 8);
    if (padding) {
        length += layer == MpegLayer::LayerI ? 4 : 1;
    }
    return static_cast<size_t>(length);
}

Mp3HeaderResult fail(Mp3HeaderError error) {
    Mp3HeaderResult out;
    out.error = error;
    return out;
}

}  // namespace

std::string to_string(Mp3HeaderError error) {
    switch (error) {
        case Mp3HeaderError::None:
            return "ok";
        case Mp3HeaderError::TooShort:
            return "too short";
        case Mp3HeaderError::InvalidSync:
            return "invalid sync";
        case Mp3HeaderError::ReservedVersion:
            return "reserved version";
        case Mp3HeaderError::ReservedLayer:
            return "reserved layer";
        case Mp3HeaderError::BadBitrate:
            return "bad bitrate";
        case Mp3HeaderError::BadSampleRate:
            return "bad sample rate";
        case Mp3HeaderError::ReservedEmphasis:
            return "reserved emphasis";
    }
    return "unknown";
}

std::string to_string(MpegVersion version) {
    switch (version) {
        case MpegVersion::V1:
            return "MPEG-1";
        case MpegVersion::V2:
            return "MPEG-2";
        case MpegVersion::V25:
            return "MPEG-2.5";
    }
    return "unknown";
}

std::string to_string(MpegLayer layer) {
    switch (layer) {
        case MpegLayer::LayerI:
            return "Layer I";
        case MpegLayer::LayerII:
            return "Layer II";
        case MpegLayer::LayerIII:
            return "Layer III";
    }
    return "unknown";
}

std::string to_string(Mp3ChannelMode mode) {
    switch (mode) {
        case Mp3ChannelMode::Stereo:
            return "stereo";
        case Mp3ChannelMode::JointStereo:
            return "joint stereo";
        case Mp3ChannelMode::DualChannel:
            return "dual channel";
        case Mp3ChannelMode::Mono:
            return "mono";
    }
    return "unknown";
}

Mp3HeaderResult parse_mp3_header(ByteView data) {
    if (data.size() < kMp3HeaderSize) {
        return fail(Mp3HeaderError::TooShort);
    }
    const uint8_t b1 = data[1];
    const uint8_t b2 = data[2];
    const uint8_t b3 = data[3];

    if (data[0] != 0xFF || (b1 & 0xE0) != 0xE0) {
        return fail(Mp3HeaderError::InvalidSync);
    }

    Mp3HeaderResult result;
    Mp3FrameHeader &h = result.header;

    switch ((b1 >> 3) & 0x03) {
        case 0x00:
            h.version = MpegVersion::V25;
            break;
        case 0x02:
            h.version = MpegVersion::V2;
            break;
        case 0x03:
            h.version = MpegVersion::V1;
            break;
        default:
            return fail(Mp3HeaderError::ReservedVersion);
    }

    switch ((b1 >> 1) & 0x03) {
        case 0x01:
            h.layer = MpegLayer::LayerIII;
            break;
        case 0x02:
            h.layer = MpegLayer::LayerII;
            break;
        case 0x03:
            h.layer = MpegLayer::LayerI;
            break;
        default:
            return fail(Mp3HeaderError::ReservedLayer);
    }

    // Index 0 is "free format", 15 is forbidden.
    const uint8_t bitrate_index = (b2 >> 4) & 0x0F;
    if (bitrate_index == 0 || bitrate_index == 0x0F) {
        return fail(Mp3HeaderError::BadBitrate);
    }
    h.bitrate_kbps = bitrate_table(h.version, h.layer)[bitrate_index - 1];

    const uint8_t sample_rate_index = (b2 >> 2) & 0x03;
    const auto &rates = sample_rate_table(h.version);
    if (sample_rate_index >= rates.size()) {
        return fail(Mp3HeaderError::BadSampleRate);
    }
    h.sample_rate = rates[sample_rate_index];

    h.padding = ((b2 >> 1) & 0x01) == 1;

    switch ((b3 >> 6) & 0x03) {
        case 0x00:
            h.channel_mode = Mp3ChannelMode::Stereo;
            break;
        case 0x01:
            h.channel_mode = Mp3ChannelMode::JointStereo;
            break;
        case 0x02:
            h.channel_mode = Mp3ChannelMode::DualChannel;
            break;
        default:
            h.channel_mode = Mp3ChannelMode::Mono;
            break;
    }

    if ((b3 & 0x03) == kReservedEmphasis) {
        return fail(Mp3HeaderError::ReservedEmphasis);
    }

    h.samples_per_frame = samples_per_frame(h.version, h.layer);
    h.frame_length =
        frame_length_bytes(h.samples_per_frame, h.bitrate_kbps, h.sample_rate, h.layer, h.padding);
    return result;
}

std::optional<Mp3ScanResult> scan_mp3(ByteView data) {
    if (data.size() < kMp3HeaderSize) {
        return std::nullopt;
    }
    for (size_t offset = 0; offset + kMp3HeaderSize <= data.size(); ++offset) {
        auto parsed = parse_mp3_header(data.subview(offset));
        if (parsed.ok() && parsed.header.frame_length >= kMp3MinScanFrameLength) {
            FP_LOG("mp3", "frame header at offset " << offset << " length="
                                                    << parsed.header.frame_length);
            return Mp3ScanResult{offset, parsed.header};
        }
    }
    return std::nullopt;
}

}  // namespace formatprobe
