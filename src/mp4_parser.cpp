//
//  mp4_parser.cpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "mp4_parser.hpp"

#include "fourcc_utils.hpp"
#include "logging.hpp"

namespace formatprobe {

namespace {

constexpr uint64_t kLargeSizeMarker = 1;
constexpr uint64_t kToEndSizeMarker = 0;
constexpr size_t kFullBoxHeader = 4;         // version + flags
constexpr size_t kHdlrTypeOffset = 8;        // version/flags + pre_defined
constexpr size_t kStsdHeaderSize = 8;        // version/flags + entry_count
constexpr size_t kSampleEntryPrefix = 8;     // size + format

std::string describe(uint32_t type) {
    if (is_printable_fourcc(type)) {
        return fourcc_to_string(type);
    }
    std::ostringstream oss;
    oss << "0x" << std::hex << type;
    return oss.str();
}

// hdlr full box: version/flags (4), pre_defined (4), handler_type (4).
bool is_audio_handler(ByteView mdia) {
    auto hdlr = find_child(mdia, fourcc("hdlr"));
    if (!hdlr) {
        FP_LOG("mp4", "mdia without hdlr");
        return false;
    }
    if (hdlr->size() < kHdlrTypeOffset + 4) {
        return false;
    }
    const uint32_t handler = fourcc_at(*hdlr, kHdlrTypeOffset);
    FP_LOG("mp4", " hdlr=" << describe(handler));
    return handler == fourcc("soun");
}

// Sample entry format at `offset`; advances `offset` past the entry.
std::optional<uint32_t> parse_stsd_entry(ByteView stsd, size_t &offset) {
    if (offset > stsd.size() || stsd.size() - offset < kSampleEntryPrefix) {
        return std::nullopt;
    }
    const uint64_t size = read_u32_be(stsd.data() + offset);
    if (size < kSampleEntryPrefix || size > stsd.size() - offset) {
        FP_LOG("mp4", " stsd entry size=" << size << " invalid at offset " << offset);
        return std::nullopt;
    }
    const uint32_t format = fourcc_at(stsd, offset + 4);
    offset += static_cast<size_t>(size);
    return format;
}

std::optional<AudioType> parse_stsd(ByteView stsd) {
    if (stsd.size() < kStsdHeaderSize) {
        return std::nullopt;
    }
    const uint32_t entry_count = read_u32_be(stsd.data() + kFullBoxHeader);
    size_t offset = kStsdHeaderSize;

    for (uint32_t i = 0; i < entry_count; ++i) {
        auto format = parse_stsd_entry(stsd, offset);
        if (!format) {
            return std::nullopt;
        }
        const AudioType type = audio_type_for_sample_entry(*format);
        FP_LOG("mp4", " stsd entry " << i << " format=" << describe(*format));
        if (type != AudioType::Unknown) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<AudioType> parse_trak(ByteView trak) {
    auto mdia = find_child(trak, fourcc("mdia"));
    if (!mdia || !is_audio_handler(*mdia)) {
        return std::nullopt;
    }
    auto minf = find_child(*mdia, fourcc("minf"));
    if (!minf) {
        return std::nullopt;
    }
    auto stbl = find_child(*minf, fourcc("stbl"));
    if (!stbl) {
        return std::nullopt;
    }
    auto stsd = find_child(*stbl, fourcc("stsd"));
    if (!stsd) {
        return std::nullopt;
    }
    return parse_stsd(*stsd);
}

}  // namespace

std::optional<Mp4Box> next_box(ByteView buffer, size_t offset) {
    if (offset > buffer.size() || buffer.size() - offset < kBoxHeaderSize) {
        return std::nullopt;
    }
    const size_t remain = buffer.size() - offset;
    uint64_t size = read_u32_be(buffer.data() + offset);
    size_t header_len = kBoxHeaderSize;

    if (size == kLargeSizeMarker) {
        if (remain < kLargeBoxHeaderSize) {
            return std::nullopt;
        }
        size = read_u64_be(buffer.data() + offset + kBoxHeaderSize);
        header_len = kLargeBoxHeaderSize;
    } else if (size == kToEndSizeMarker) {
        size = remain;
    }

    if (size < header_len || size > remain) {
        return std::nullopt;
    }

    Mp4Box box;
    box.type = fourcc_at(buffer, offset + 4);
    box.content = buffer.subview(offset + header_len, static_cast<size_t>(size) - header_len);
    box.next_offset = offset + static_cast<size_t>(size);
    return box;
}

std::optional<ByteView> find_child(ByteView buffer, uint32_t type) {
    size_t offset = 0;
    while (auto box = next_box(buffer, offset)) {
        if (box->type == type) {
            return box->content;
        }
        offset = box->next_offset;
    }
    return std::nullopt;
}

bool is_mp4(ByteView data) {
    auto box = next_box(data, 0);
    return box && box->type == fourcc("ftyp");
}

AudioType audio_type_for_sample_entry(uint32_t format) {
    switch (format) {
        case fourcc("mp4a"):
            return AudioType::AAC;
        case fourcc("fLaC"):
        case fourcc("FLAC"):
            return AudioType::FLAC;
        case fourcc("Opus"):
        case fourcc("opus"):
            return AudioType::Opus;
        case fourcc("mp3 "):
        case fourcc(".mp3"):
            return AudioType::MP3;
        default:
            return AudioType::Unknown;
    }
}

std::optional<AudioType> detect_audio_track(ByteView data) {
    if (!is_mp4(data)) {
        return std::nullopt;
    }
    auto moov = find_child(data, fourcc("moov"));
    if (!moov) {
        FP_LOG("mp4", "ftyp present but no moov in " << data.size() << " bytes");
        return std::nullopt;
    }

    size_t offset = 0;
    while (auto child = next_box(*moov, offset)) {
        FP_LOG("mp4", "moov child=" << describe(child->type) << " size="
                                    << child->content.size());
        if (child->type == fourcc("trak")) {
            if (auto type = parse_trak(child->content)) {
                return type;
            }
        }
        offset = child->next_offset;
    }
    return std::nullopt;
}

#ifdef FORMATPROBE_TESTING
std::optional<AudioType> parse_trak_for_test(ByteView trak) { return parse_trak(trak); }

std::optional<AudioType> parse_stsd_for_test(ByteView stsd) { return parse_stsd(stsd); }

bool is_audio_handler_for_test(ByteView mdia) { return is_audio_handler(mdia); }
#endif

}  // namespace formatprobe
