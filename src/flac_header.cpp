//
//  flac_header.cpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "flac_header.hpp"

#include <array>

#include "logging.hpp"

namespace formatprobe {

namespace {

constexpr uint32_t kFlacSyncCode = 0x7FFC;
constexpr unsigned kFlacSyncBits = 15;
constexpr uint8_t kSyncByte = 0xFF;
constexpr uint8_t kSyncMask = 0xFC;
constexpr uint8_t kSyncPattern = 0xF8;

constexpr uint8_t kReservedSampleSizeCode = 3;
constexpr uint8_t kFirstStereoChannelCode = 8;
constexpr uint8_t kFirstInvalidChannelCode = 11;
constexpr unsigned kUtf8ShiftCeiling = 36;

constexpr std::array<uint8_t, 8> kSampleSizeTable = {0, 8, 12, 0, 16, 20, 24, 32};

// Codes 6 and 7 read the block size from the header tail.
constexpr std::array<uint16_t, 16> kBlockSizeTable = {0,    192,  576,  1152, 2304,  4608,
                                                      0,    0,    256,  512,  1024,  2048,
                                                      4096, 8192, 16384, 32768};

constexpr std::array<uint32_t, 12> kSampleRateTable = {0,     88200, 176400, 192000,
                                                       8000,  16000, 22050,  24000,
                                                       32000, 44100, 48000,  96000};

bool is_sync_at(ByteView data, size_t i) {
    return i + 1 < data.size() && data[i] == kSyncByte && (data[i + 1] & kSyncMask) == kSyncPattern;
}

FlacHeaderResult fail(FlacError error, uint8_t code = 0) {
    FlacHeaderResult out;
    out.error = error;
    out.error_code = code;
    return out;
}

}  // namespace

std::string to_string(FlacError error) {
    switch (error) {
        case FlacError::None:
            return "ok";
        case FlacError::InvalidSyncCode:
            return "invalid sync code";
        case FlacError::InvalidChannelMode:
            return "invalid channel mode";
        case FlacError::InvalidSampleSizeCode:
            return "invalid sample size code";
        case FlacError::InvalidPadding:
            return "invalid padding";
        case FlacError::UTF8DecodingError:
            return "UTF-8 decoding error";
        case FlacError::ReservedBlocksizeCode:
            return "reserved blocksize code";
        case FlacError::IllegalSampleRateCode:
            return "illegal sample rate code";
        case FlacError::UnexpectedEndOfInput:
            return "unexpected end of input";
    }
    return "unknown";
}

FlacNumberResult read_utf8_coded_number(BitCursor &reader) {
    FlacNumberResult out;
    unsigned shift = 0;

    while (true) {
        auto byte = reader.read(8);
        if (!byte) {
            out.error = FlacError::UnexpectedEndOfInput;
            return out;
        }
        const uint8_t b = static_cast<uint8_t>(*byte);
        // Past 36 bits only a final group of three value bits is allowed.
        if (shift >= kUtf8ShiftCeiling && (b & 0xF8) != 0) {
            out.error = FlacError::UTF8DecodingError;
            return out;
        }
        out.value |= static_cast<uint64_t>(b & 0x7F) << shift;
        shift += 7;
        if ((b & 0x80) == 0) {
            break;
        }
    }
    return out;
}

bool is_flac_frame(ByteView data) {
    BitCursor reader(data);
    auto sync = reader.read(kFlacSyncBits);
    return sync && *sync == kFlacSyncCode;
}

FlacHeaderResult decode_frame_header(ByteView data) {
    BitCursor reader(data);
    FlacHeaderResult result;
    FlacFrameInfo &fi = result.info;

    auto sync = reader.read(kFlacSyncBits);
    if (!sync) {
        return fail(FlacError::UnexpectedEndOfInput);
    }
    if (*sync != kFlacSyncCode) {
        return fail(FlacError::InvalidSyncCode);
    }

    auto var_size = reader.read_bit();
    auto bs_code = reader.read(4);
    auto sr_code = reader.read(4);
    auto ch_code = reader.read(4);
    if (!var_size || !bs_code || !sr_code || !ch_code) {
        return fail(FlacError::UnexpectedEndOfInput);
    }
    fi.is_var_size = *var_size;
    fi.blocking_strategy = fi.is_var_size ? 1 : 0;

    const uint8_t channel_code = static_cast<uint8_t>(*ch_code);
    if (channel_code < kFirstStereoChannelCode) {
        fi.channels = static_cast<uint8_t>(channel_code + 1);
        fi.channel_mode = kFlacChannelModeIndependent;
    } else if (channel_code < kFirstInvalidChannelCode) {
        fi.channels = 2;
        fi.channel_mode = static_cast<uint8_t>(channel_code - 7);
    } else {
        return fail(FlacError::InvalidChannelMode, channel_code);
    }

    auto bps_code = reader.read(3);
    if (!bps_code) {
        return fail(FlacError::UnexpectedEndOfInput);
    }
    if (*bps_code == kReservedSampleSizeCode) {
        return fail(FlacError::InvalidSampleSizeCode, static_cast<uint8_t>(*bps_code));
    }
    fi.bits_per_sample = kSampleSizeTable[*bps_code];

    auto reserved = reader.read_bit();
    if (!reserved) {
        return fail(FlacError::UnexpectedEndOfInput);
    }
    if (*reserved) {
        return fail(FlacError::InvalidPadding);
    }

    auto number = read_utf8_coded_number(reader);
    if (!number.ok()) {
        return fail(number.error);
    }
    fi.frame_or_sample_number = number.value;

    switch (*bs_code) {
        case 0:
            return fail(FlacError::ReservedBlocksizeCode);
        case 6: {
            auto v = reader.read(8);
            if (!v) {
                return fail(FlacError::UnexpectedEndOfInput);
            }
            fi.block_size = static_cast<uint16_t>(*v + 1);
            break;
        }
        case 7: {
            auto v = reader.read(16);
            if (!v) {
                return fail(FlacError::UnexpectedEndOfInput);
            }
            // 0xFFFF + 1 wraps, matching the 16-bit block size field.
            fi.block_size = static_cast<uint16_t>(*v + 1);
            break;
        }
        default:
            fi.block_size = kBlockSizeTable[*bs_code];
            break;
    }

    const uint8_t rate_code = static_cast<uint8_t>(*sr_code);
    if (rate_code < kSampleRateTable.size()) {
        fi.sample_rate = kSampleRateTable[rate_code];
    } else if (rate_code == 12) {
        auto v = reader.read(8);
        if (!v) {
            return fail(FlacError::UnexpectedEndOfInput);
        }
        fi.sample_rate = *v * 1000;
    } else if (rate_code == 13) {
        auto v = reader.read(16);
        if (!v) {
            return fail(FlacError::UnexpectedEndOfInput);
        }
        fi.sample_rate = *v;
    } else if (rate_code == 14) {
        auto v = reader.read(16);
        if (!v) {
            return fail(FlacError::UnexpectedEndOfInput);
        }
        fi.sample_rate = *v * 10;
    } else {
        return fail(FlacError::IllegalSampleRateCode, rate_code);
    }

    // CRC-8 over the header; kept as read.
    auto crc = reader.read(8);
    if (!crc) {
        return fail(FlacError::UnexpectedEndOfInput);
    }
    fi.header_crc8 = static_cast<uint8_t>(*crc);
    fi.header_size = reader.bytes_consumed();
    return result;
}

std::vector<ByteView> split_flac_frames(ByteView data) {
    std::vector<ByteView> frames;
    size_t start = 0;

    while (start < data.size()) {
        if (!is_sync_at(data, start)) {
            ++start;
            continue;
        }
        size_t end = start + 1;
        while (end < data.size() && !is_sync_at(data, end)) {
            ++end;
        }
        frames.push_back(data.subview(start, end - start));
        start = end;
    }
    FP_LOG("flac", "split " << data.size() << " bytes into " << frames.size() << " frames");
    return frames;
}

ByteView find_first_flac_frame(ByteView data) {
    for (size_t i = 0; i + 1 < data.size(); ++i) {
        if (is_sync_at(data, i)) {
            return data.subview(i);
        }
    }
    return {};
}

std::vector<uint8_t> create_streaminfo(const FlacFrameInfo &info) {
    std::vector<uint8_t> out;
    out.reserve(kFlacStreamInfoSize);

    // Min and max block size.
    for (int i = 0; i < 2; ++i) {
        out.push_back(static_cast<uint8_t>(info.block_size >> 8));
        out.push_back(static_cast<uint8_t>(info.block_size & 0xFF));
    }
    // Min and max frame size (24 bits each), unknown.
    out.insert(out.end(), 6, uint8_t{0});

    const uint32_t packed = ((info.sample_rate & 0xFFFFF) << 12) |
                            ((static_cast<uint32_t>(info.channels - 1) & 0x7) << 9) |
                            ((static_cast<uint32_t>(info.bits_per_sample - 1) & 0x1F) << 4) |
                            static_cast<uint32_t>((info.frame_or_sample_number >> 32) & 0xF);
    const uint32_t total_low = static_cast<uint32_t>(info.frame_or_sample_number & 0xFFFFFFFF);
    for (uint32_t v : {packed, total_low}) {
        out.push_back(static_cast<uint8_t>(v >> 24));
        out.push_back(static_cast<uint8_t>(v >> 16));
        out.push_back(static_cast<uint8_t>(v >> 8));
        out.push_back(static_cast<uint8_t>(v));
    }

    // MD5 signature unknown.
    out.insert(out.end(), 16, uint8_t{0});
    return out;
}

}  // namespace formatprobe
