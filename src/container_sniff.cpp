//
//  container_sniff.cpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "container_sniff.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>

namespace formatprobe {

namespace {

constexpr uint8_t kEbmlMagic[4] = {0x1A, 0x45, 0xDF, 0xA3};
constexpr size_t kDocTypeSearchWindow = 64;
constexpr size_t kWavHeaderSize = 12;

bool contains(ByteView data, const char *needle) {
    const size_t len = std::strlen(needle);
    if (len == 0 || data.size() < len) {
        return false;
    }
    const auto *first = reinterpret_cast<const uint8_t *>(needle);
    return std::search(data.begin(), data.end(), first, first + len) != data.end();
}

}  // namespace

bool is_wav(ByteView data) {
    return data.size() >= kWavHeaderSize && data.matches_at(0, "RIFF") &&
           data.matches_at(8, "WAVE");
}

bool is_ogg_opus(ByteView data) { return data.matches_at(0, "OggS") && is_opus_head(data); }

bool is_opus_head(ByteView data) { return contains(data, "OpusHead"); }

bool is_ebml(ByteView data) {
    return data.size() >= sizeof(kEbmlMagic) &&
           std::equal(std::begin(kEbmlMagic), std::end(kEbmlMagic), data.begin());
}

bool is_webm(ByteView data) {
    return is_ebml(data) && contains(data.subview(0, kDocTypeSearchWindow), "webm");
}

bool is_matroska(ByteView data) {
    return is_ebml(data) && contains(data.subview(0, kDocTypeSearchWindow), "matroska");
}

bool is_annexb_h264(ByteView data) {
    // A 4-byte start code contains the 3-byte one. A 00 00 00 run elsewhere combined with
    // data[3] == 0x01 is not treated as a start code.
    for (size_t i = 0; i + 3 <= data.size(); ++i) {
        if (data[i] == 0x00 && data[i + 1] == 0x00 && data[i + 2] == 0x01) {
            return true;
        }
    }
    return false;
}

}  // namespace formatprobe
