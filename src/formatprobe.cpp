//
//  formatprobe.cpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//
#include "formatprobe.hpp"
#include "formatprobe_version.hpp"

#include "aac_extractor.hpp"
#include "chunk_iterator.hpp"
#include "container_sniff.hpp"
#include "flac_header.hpp"
#include "logging.hpp"
#include "mp3_header.hpp"
#include "mp4_parser.hpp"

using json = nlohmann::json;

namespace formatprobe {

std::string version_string() { return FORMATPROBE_VERSION_DISPLAY; }

std::string audio_type_name(AudioType type) {
    switch (type) {
        case AudioType::Unknown:
            return "unknown";
        case AudioType::AAC:
            return "aac";
        case AudioType::FLAC:
            return "flac";
        case AudioType::Opus:
            return "opus";
        case AudioType::MP3:
            return "mp3";
        case AudioType::WAV:
            return "wav";
        case AudioType::WebM:
            return "webm";
        case AudioType::Matroska:
            return "matroska";
    }
    return "unknown";
}

AudioType detect_audio_type(ByteView data) {
    FP_LOG("probe", "probing " << data.size() << " bytes: " << hex_prefix(data));

    // MP4 first: it is the most specific container.
    if (auto type = detect_audio_track(data)) {
        return *type;
    }
    if (is_flac_frame(data)) {
        return AudioType::FLAC;
    }
    if (is_adts_like(data)) {
        return AudioType::AAC;
    }
    if (is_webm(data)) {
        return AudioType::WebM;
    }
    if (is_matroska(data)) {
        return AudioType::Matroska;
    }
    if (is_ogg_opus(data) || is_opus_head(data)) {
        return AudioType::Opus;
    }
    if (is_wav(data)) {
        return AudioType::WAV;
    }
    if (is_mp3(data)) {
        return AudioType::MP3;
    }
    return AudioType::Unknown;
}

}  // namespace formatprobe

namespace {

using namespace formatprobe;

json frame_entry(ByteView frame, ByteView parent) {
    return json{{"offset", frame.offset_in(parent)}, {"size", frame.size()}};
}

json flac_section(ByteView data, const ProbeOptions &options) {
    json j;
    const ByteView first = find_first_flac_frame(data);
    j["offset"] = first.empty() ? 0 : first.offset_in(data);
    auto res = decode_frame_header(first);
    if (!res.ok()) {
        j["error"] = to_string(res.error);
        if (res.error_code != 0) {
            j["error_code"] = res.error_code;
        }
    } else {
        const auto &fi = res.info;
        j["variable_block_size"] = fi.is_var_size;
        j["block_size"] = fi.block_size;
        j["sample_rate"] = fi.sample_rate;
        j["channels"] = fi.channels;
        j["channel_mode"] = fi.channel_mode;
        j["bits_per_sample"] = fi.bits_per_sample;
        j[fi.is_var_size ? "sample_number" : "frame_number"] = fi.frame_or_sample_number;
        j["header_size"] = fi.header_size;
        j["header_crc8"] = fi.header_crc8;
    }
    if (options.list_frames) {
        json frames = json::array();
        for (const auto &frame : split_flac_frames(data)) {
            frames.push_back(frame_entry(frame, data));
        }
        j["frames"] = frames;
    }
    return j;
}

json adts_section(ByteView data, const ProbeOptions &options) {
    json j;
    auto header = parse_adts_header(data);
    if (!header) {
        j["error"] = "no decodable ADTS header";
    } else {
        j["profile"] = header->profile;
        j["sampling_index"] = header->sampling_index;
        j["sample_rate"] = header->sample_rate;
        j["channel_config"] = header->channel_config;
        j["frame_length"] = header->frame_length;
        j["crc"] = !header->protection_absent;
    }
    if (options.list_frames) {
        const AdtsStream stream = split_adts_frames(data);
        json frames = json::array();
        for (const auto &frame : stream.frames) {
            frames.push_back(frame_entry(frame, data));
        }
        j["frames"] = frames;
    }
    return j;
}

json mp3_section(ByteView data, const ProbeOptions &options) {
    json j;
    auto found = scan_mp3(data);
    if (!found) {
        j["error"] = "no MPEG audio frame header";
        return j;
    }
    const auto &h = found->header;
    j["offset"] = found->offset;
    j["version"] = to_string(h.version);
    j["layer"] = to_string(h.layer);
    j["bitrate_kbps"] = h.bitrate_kbps;
    j["sample_rate"] = h.sample_rate;
    j["channel_mode"] = to_string(h.channel_mode);
    j["padding"] = h.padding;
    j["samples_per_frame"] = h.samples_per_frame;
    j["frame_length"] = h.frame_length;

    if (options.list_frames) {
        // Follow declared frame lengths until a header no longer parses.
        json frames = json::array();
        size_t offset = found->offset;
        while (offset < data.size()) {
            auto parsed = parse_mp3_header(data.subview(offset));
            if (!parsed.ok() || parsed.header.frame_length == 0 ||
                parsed.header.frame_length > data.size() - offset) {
                break;
            }
            frames.push_back(
                json{{"offset", offset}, {"size", parsed.header.frame_length}});
            offset += parsed.header.frame_length;
        }
        j["frames"] = frames;
    }
    return j;
}

json chunk_section(ByteView data) {
    json chunks = json::array();
    ChunkIterator it(data);
    for (const auto &record : it) {
        json c{{"index", record.index}};
        if (record.ok()) {
            c["offset"] = record.payload.empty() ? 0 : record.payload.offset_in(data);
            c["size"] = record.payload.size();
        } else {
            c["error"] = to_string(record.error);
        }
        chunks.push_back(c);
    }
    return chunks;
}

}  // namespace

namespace formatprobe {

json probe_report(ByteView data, const ProbeOptions &options) {
    json j;
    const AudioType type = detect_audio_type(data);
    j["size"] = data.size();
    j["type"] = audio_type_name(type);
    j["mp4"] = is_mp4(data);
    j["h264_annexb"] = is_annexb_h264(data);

    // MP4 payloads are not decoded further; only the sample entry codec is reported.
    if (!j["mp4"].get<bool>()) {
        switch (type) {
            case AudioType::FLAC:
                j["flac"] = flac_section(data, options);
                break;
            case AudioType::AAC:
                j["adts"] = adts_section(data, options);
                break;
            case AudioType::MP3:
                j["mp3"] = mp3_section(data, options);
                break;
            default:
                break;
        }
    }
    if (options.list_chunks) {
        j["chunks"] = chunk_section(data);
    }
    FP_LOG("probe", "detected " << j["type"].get<std::string>());
    return j;
}

}  // namespace formatprobe
