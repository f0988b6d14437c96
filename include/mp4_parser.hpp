//
//  mp4_parser.hpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "audio_type.hpp"
#include "byte_view.hpp"

namespace formatprobe {

inline constexpr size_t kBoxHeaderSize = 8;
inline constexpr size_t kLargeBoxHeaderSize = 16;

// One ISO-BMFF box inside a parent buffer.
struct Mp4Box {
    uint32_t type = 0;        // FourCC
    ByteView content;         // payload, header excluded
    size_t next_offset = 0;   // end of this box in the parent buffer
};

/**
 * @brief Read the box header at `offset` of `buffer`.
 *
 * Size 1 selects a 64-bit size after the type, size 0 extends the box to the end of the
 * buffer. Returns nullopt when the header does not fit, the declared size is smaller than the
 * header, or the box would end past the buffer; callers treat that as end of iteration.
 */
std::optional<Mp4Box> next_box(ByteView buffer, size_t offset);

// Content of the first sibling box of `type` in `buffer`.
std::optional<ByteView> find_child(ByteView buffer, uint32_t type);

// True when the first box is `ftyp`.
bool is_mp4(ByteView data);

// Codec of a sample entry fourCC (mp4a, fLaC, Opus, ...); Unknown when not recognized.
AudioType audio_type_for_sample_entry(uint32_t format);

/**
 * @brief Walk moov/trak/mdia/minf/stbl/stsd for the first sound track with a known codec.
 *
 * Tracks whose hdlr is not 'soun' are ignored. nullopt means no audio track was identified.
 */
std::optional<AudioType> detect_audio_track(ByteView data);

#ifdef FORMATPROBE_TESTING
// Test-only wrappers that allow unit tests to exercise the per-level parsing.
std::optional<AudioType> parse_trak_for_test(ByteView trak);
std::optional<AudioType> parse_stsd_for_test(ByteView stsd);
bool is_audio_handler_for_test(ByteView mdia);
#endif

}  // namespace formatprobe
