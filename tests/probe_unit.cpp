// Format dispatch order and probe report contents.
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "aac_extractor.hpp"
#include "box_test_utils.hpp"
#include "formatprobe.hpp"

using namespace formatprobe;
using namespace box_test_utils;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[probe_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

std::vector<uint8_t> text(const std::string &s) { return std::vector<uint8_t>(s.begin(), s.end()); }

std::vector<uint8_t> flac_frames(size_t count) {
    std::vector<uint8_t> out;
    for (size_t i = 0; i < count; ++i) {
        out.insert(out.end(), {0xFF, 0xF8, 0xC9, 0xA8, static_cast<uint8_t>(i), 0x00});
        out.insert(out.end(), 20, 0x00);
    }
    return out;
}

std::vector<uint8_t> adts_frames(size_t count) {
    std::vector<uint8_t> out;
    for (size_t i = 0; i < count; ++i) {
        auto h = build_adts_header(kAdtsProfileAacLc, 2, 44100, 32, false);
        out.insert(out.end(), h.begin(), h.end());
        out.insert(out.end(), 32, 0x00);
    }
    return out;
}

std::vector<uint8_t> mp3_frames(size_t count) {
    std::vector<uint8_t> out;
    for (size_t i = 0; i < count; ++i) {
        out.insert(out.end(), {0xFF, 0xFB, 0x90, 0x00});
        out.insert(out.end(), 413, 0x00);
    }
    return out;
}

std::vector<uint8_t> ebml(const std::string &doctype) {
    std::vector<uint8_t> out = {0x1A, 0x45, 0xDF, 0xA3, 0x9F, 0x42, 0x82, 0x84};
    out.insert(out.end(), doctype.begin(), doctype.end());
    out.resize(48, 0x00);
    return out;
}

bool test_detect_order() {
    bool ok = check(detect_audio_type(make_mp4({make_track(fourcc("soun"), {fourcc("mp4a")})})) ==
                        AudioType::AAC,
                    "MP4 AAC track");
    ok &= check(detect_audio_type(flac_frames(1)) == AudioType::FLAC, "FLAC frame");
    ok &= check(detect_audio_type(adts_frames(1)) == AudioType::AAC, "ADTS frame");

    // FF F9 50 ... satisfies both the FLAC sync and the ADTS checks; FLAC runs first.
    const std::vector<uint8_t> ambiguous = {0xFF, 0xF9, 0x50, 0x80, 0x0D, 0x7F, 0xFC, 0x00};
    ok &= check(detect_audio_type(ambiguous) == AudioType::FLAC, "FLAC before ADTS");

    ok &= check(detect_audio_type(ebml("webm")) == AudioType::WebM, "WebM");
    ok &= check(detect_audio_type(ebml("matroska")) == AudioType::Matroska, "Matroska");

    auto ogg = text("OggS");
    ogg.resize(28, 0x00);
    auto head = text("OpusHead");
    ogg.insert(ogg.end(), head.begin(), head.end());
    ok &= check(detect_audio_type(ogg) == AudioType::Opus, "Ogg Opus");

    auto wav = text("RIFF");
    wav.insert(wav.end(), {0x24, 0x00, 0x00, 0x00});
    auto form = text("WAVE");
    wav.insert(wav.end(), form.begin(), form.end());
    wav.resize(44, 0x00);
    ok &= check(detect_audio_type(wav) == AudioType::WAV, "WAV");

    ok &= check(detect_audio_type(mp3_frames(1)) == AudioType::MP3, "MP3");

    // An MP4 with only a video track is not reported as MP4 audio; nothing else matches.
    auto video = make_mp4({make_track(fourcc("vide"), {fourcc("avc1")})});
    ok &= check(detect_audio_type(video) == AudioType::Unknown, "video-only MP4");
    ok &= check(detect_audio_type(std::vector<uint8_t>(64, 0x00)) == AudioType::Unknown,
                "silence");
    ok &= check(detect_audio_type(ByteView{}) == AudioType::Unknown, "empty buffer");
    ok &= check(audio_type_name(AudioType::Matroska) == "matroska", "type name");
    return ok;
}

bool test_report() {
    auto flac = probe_report(flac_frames(3), ProbeOptions{true, false});
    bool ok = check(flac["type"] == "flac" && flac["size"] == 78, "FLAC report type and size");
    ok &= check(flac.contains("flac") && flac["flac"]["block_size"] == 4096 &&
                    flac["flac"]["sample_rate"] == 44100 && flac["flac"]["channels"] == 2,
                "FLAC header fields");
    ok &= check(flac["flac"]["frames"].size() == 3 && flac["flac"]["frames"][1]["offset"] == 26,
                "FLAC frame list");
    ok &= check(!flac.contains("chunks"), "chunks only on request");

    auto adts = probe_report(adts_frames(2), ProbeOptions{true, false});
    ok &= check(adts["type"] == "aac" && adts.contains("adts"), "ADTS report");
    ok &= check(adts["adts"]["sample_rate"] == 44100 && adts["adts"]["frame_length"] == 39,
                "ADTS header fields");
    ok &= check(adts["adts"]["frames"].size() == 2 &&
                    adts["adts"]["frames"][1]["offset"] == 46,
                "ADTS frame payloads");

    auto mp3 = probe_report(mp3_frames(2), ProbeOptions{true, false});
    ok &= check(mp3["type"] == "mp3" && mp3["mp3"]["bitrate_kbps"] == 128, "MP3 report");
    ok &= check(mp3["mp3"]["frames"].size() == 2 && mp3["mp3"]["frames"][1]["offset"] == 417,
                "MP3 frames follow declared lengths");

    auto mp4 = probe_report(make_mp4({make_track(fourcc("soun"), {fourcc("fLaC")})}));
    ok &= check(mp4["type"] == "flac" && mp4["mp4"] == true, "MP4 FLAC track");
    ok &= check(!mp4.contains("flac"), "MP4 payload not decoded as raw FLAC");

    const std::vector<uint8_t> chunked = {0x03, 0x00, 0x00, 0x00, 'A', 'B', 'C'};
    auto chunks = probe_report(chunked, ProbeOptions{false, true});
    ok &= check(chunks["type"] == "unknown", "chunked buffer has no audio type");
    ok &= check(chunks["chunks"].size() == 1 && chunks["chunks"][0]["offset"] == 4 &&
                    chunks["chunks"][0]["size"] == 3,
                "single chunk listed");

    auto annexb = probe_report(std::vector<uint8_t>{0x00, 0x00, 0x00, 0x01, 0x67, 0x42});
    ok &= check(annexb["h264_annexb"] == true && annexb["type"] == "unknown",
                "Annex-B flagged separately");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= check(version_string().rfind("v", 0) == 0, "version string");
    ok &= test_detect_order();
    ok &= test_report();
    return ok ? 0 : 1;
}
