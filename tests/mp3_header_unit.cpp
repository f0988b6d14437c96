// Unit coverage for MPEG audio frame header decoding and the sync scanner.
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "mp3_header.hpp"

using namespace formatprobe;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[mp3_header_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

Mp3HeaderResult parse(std::vector<uint8_t> bytes) { return parse_mp3_header(bytes); }

bool test_reference_header() {
    auto res = parse({0xFF, 0xFB, 0x90, 0x00});
    bool ok = check(res.ok(), "FF FB 90 00 parses");
    const auto &h = res.header;
    ok &= check(h.version == MpegVersion::V1 && h.layer == MpegLayer::LayerIII,
                "MPEG-1 Layer III");
    ok &= check(h.bitrate_kbps == 128, "128 kbps");
    ok &= check(h.sample_rate == 44100, "44.1 kHz");
    ok &= check(!h.padding, "no padding");
    ok &= check(h.channel_mode == Mp3ChannelMode::Stereo, "stereo");
    ok &= check(h.samples_per_frame == 1152, "1152 samples");
    ok &= check(h.frame_length == 417, "417-byte frame");

    auto padded = parse({0xFF, 0xFB, 0x92, 0xC0});
    ok &= check(padded.ok() && padded.header.padding && padded.header.frame_length == 418,
                "padding adds one byte");
    ok &= check(padded.header.channel_mode == Mp3ChannelMode::Mono, "mono");
    ok &= check(to_string(padded.header.channel_mode) == "mono", "channel mode name");
    return ok;
}

bool test_other_versions() {
    auto v2 = parse({0xFF, 0xF3, 0x80, 0x40});
    bool ok = check(v2.ok() && v2.header.version == MpegVersion::V2, "MPEG-2");
    ok &= check(v2.header.bitrate_kbps == 64 && v2.header.sample_rate == 22050,
                "MPEG-2 bitrate and rate tables");
    ok &= check(v2.header.samples_per_frame == 576 && v2.header.frame_length == 208,
                "MPEG-2 Layer III frame");
    ok &= check(v2.header.channel_mode == Mp3ChannelMode::JointStereo, "joint stereo");

    auto v25 = parse({0xFF, 0xE3, 0x18, 0x80});
    ok &= check(v25.ok() && v25.header.version == MpegVersion::V25, "MPEG-2.5");
    ok &= check(v25.header.bitrate_kbps == 8 && v25.header.sample_rate == 8000,
                "MPEG-2.5 8 kbps at 8 kHz");
    ok &= check(v25.header.frame_length == 72, "MPEG-2.5 frame length");
    ok &= check(v25.header.channel_mode == Mp3ChannelMode::DualChannel, "dual channel");

    auto l1 = parse({0xFF, 0xFF, 0x92, 0x00});
    ok &= check(l1.ok() && l1.header.layer == MpegLayer::LayerI, "Layer I");
    ok &= check(l1.header.bitrate_kbps == 288 && l1.header.samples_per_frame == 384,
                "Layer I bitrate and samples");
    ok &= check(l1.header.frame_length == 317, "Layer I padding is four bytes");

    auto l2 = parse({0xFF, 0xFD, 0x94, 0x00});
    ok &= check(l2.ok() && l2.header.layer == MpegLayer::LayerII, "Layer II");
    ok &= check(l2.header.bitrate_kbps == 160 && l2.header.sample_rate == 48000,
                "Layer II bitrate and rate");
    ok &= check(l2.header.samples_per_frame == 1152 && l2.header.frame_length == 480,
                "Layer II frame length");
    return ok;
}

bool test_rejects() {
    bool ok = check(parse({0xFF, 0xFB, 0x90}).error == Mp3HeaderError::TooShort, "too short");
    ok &= check(parse({0xFF, 0x1B, 0x90, 0x00}).error == Mp3HeaderError::InvalidSync,
                "eleven sync bits required");
    ok &= check(parse({0xFE, 0xFB, 0x90, 0x00}).error == Mp3HeaderError::InvalidSync,
                "first byte must be 0xFF");
    ok &= check(parse({0xFF, 0xEB, 0x90, 0x00}).error == Mp3HeaderError::ReservedVersion,
                "reserved version");
    ok &= check(parse({0xFF, 0xF9, 0x90, 0x00}).error == Mp3HeaderError::ReservedLayer,
                "reserved layer");
    ok &= check(parse({0xFF, 0xFB, 0x00, 0x00}).error == Mp3HeaderError::BadBitrate,
                "free-format bitrate rejected");
    ok &= check(parse({0xFF, 0xFB, 0xF0, 0x00}).error == Mp3HeaderError::BadBitrate,
                "bitrate index 15 rejected");
    ok &= check(parse({0xFF, 0xFB, 0x9C, 0x00}).error == Mp3HeaderError::BadSampleRate,
                "reserved sample rate");
    ok &= check(parse({0xFF, 0xFB, 0x90, 0x02}).error == Mp3HeaderError::ReservedEmphasis,
                "reserved emphasis");
    ok &= check(parse({0xFF, 0xFB, 0x90, 0x01}).ok(), "50/15 us emphasis accepted");
    ok &= check(to_string(Mp3HeaderError::ReservedEmphasis) == "reserved emphasis",
                "error name");
    return ok;
}

bool test_scan() {
    std::vector<uint8_t> data = {0x00, 0x11, 0x22, 0x33, 0x44, 0xFF, 0xFB, 0x90, 0x00};
    data.insert(data.end(), 32, 0x00);
    auto found = scan_mp3(data);
    bool ok = check(found.has_value(), "header found after junk");
    ok &= check(found && found->offset == 5, "header at offset 5");
    ok &= check(found && found->header.frame_length == 417, "scanned header decoded");
    ok &= check(is_mp3(data), "is_mp3 agrees with scan");

    // An invalid candidate ahead of the real header is skipped.
    std::vector<uint8_t> noisy = {0xFF, 0xFB, 0x00, 0x00, 0xFF, 0xFB, 0x90, 0x00};
    auto second = scan_mp3(noisy);
    ok &= check(second && second->offset == 4, "free-format candidate skipped");

    ok &= check(!scan_mp3(std::vector<uint8_t>(64, 0x00)), "silence has no header");
    ok &= check(!scan_mp3(std::vector<uint8_t>{0xFF, 0xFB, 0x90}), "three bytes too short");
    ok &= check(!is_mp3(ByteView{}), "empty buffer");
    return ok;
}

// Every valid header describes a frame at least as long as the header itself.
bool test_all_headers_frame_length() {
    size_t valid = 0;
    size_t too_short = 0;
    uint8_t bytes[4] = {0xFF, 0, 0, 0};
    for (unsigned b1 = 0; b1 < 256; ++b1) {
        for (unsigned b2 = 0; b2 < 256; ++b2) {
            for (unsigned b3 = 0; b3 < 256; ++b3) {
                bytes[1] = static_cast<uint8_t>(b1);
                bytes[2] = static_cast<uint8_t>(b2);
                bytes[3] = static_cast<uint8_t>(b3);
                auto res = parse_mp3_header(ByteView(bytes, sizeof(bytes)));
                if (!res.ok()) {
                    continue;
                }
                ++valid;
                if (res.header.frame_length < kMp3HeaderSize) {
                    ++too_short;
                }
            }
        }
    }
    bool ok = check(valid > 0, "some headers decode");
    ok &= check(too_short == 0, std::to_string(too_short) + " headers shorter than 4 bytes");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_reference_header();
    ok &= test_other_versions();
    ok &= test_rejects();
    ok &= test_scan();
    ok &= test_all_headers_frame_length();
    return ok ? 0 : 1;
}
