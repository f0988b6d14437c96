//
//  mp3_header.hpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "byte_view.hpp"

namespace formatprobe {

enum class MpegVersion { V1, V2, V25 };

enum class MpegLayer { LayerI, LayerII, LayerIII };

enum class Mp3ChannelMode { Stereo, JointStereo, DualChannel, Mono };

enum class Mp3HeaderError {
    None = 0,
    TooShort,
    InvalidSync,
    ReservedVersion,
    ReservedLayer,
    BadBitrate,
    BadSampleRate,
    ReservedEmphasis,
};

std::string to_string(Mp3HeaderError error);
std::string to_string(MpegVersion version);
std::string to_string(MpegLayer layer);
std::string to_string(Mp3ChannelMode mode);

inline constexpr size_t kMp3HeaderSize = 4;
// Shortest frame scan() accepts; shorter configurations are coincidental sync patterns.
inline constexpr size_t kMp3MinScanFrameLength = 16;

struct Mp3FrameHeader {
    MpegVersion version = MpegVersion::V1;
    MpegLayer layer = MpegLayer::LayerIII;
    uint16_t bitrate_kbps = 0;
    uint32_t sample_rate = 0;
    bool padding = false;
    Mp3ChannelMode channel_mode = Mp3ChannelMode::Stereo;
    uint16_t samples_per_frame = 0;
    size_t frame_length = 0;  // bytes, header included
};

struct Mp3HeaderResult {
    Mp3HeaderError error{Mp3HeaderError::None};
    Mp3FrameHeader header;

    bool ok() const { return error == Mp3HeaderError::None; }
};

struct Mp3ScanResult {
    size_t offset = 0;
    Mp3FrameHeader header;
};

// Decode the 4-byte frame header at the start of `data`.
Mp3HeaderResult parse_mp3_header(ByteView data);

/**
 * @brief Find the first offset holding a parsable header with a frame of at least 16 bytes.
 *
 * Tries every offset; any byte run that happens to look like a header is accepted, so junk
 * (or ID3 data) ahead of the audio can produce a false hit.
 */
std::optional<Mp3ScanResult> scan_mp3(ByteView data);

inline bool is_mp3(ByteView data) { return scan_mp3(data).has_value(); }

}  // namespace formatprobe
