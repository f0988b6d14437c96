//
//  container_sniff.hpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "byte_view.hpp"

namespace formatprobe {

// Magic-byte checks for containers that need no structural decode.

// 'RIFF' at 0 and 'WAVE' at 8.
bool is_wav(ByteView data);

// 'OggS' page capture pattern at 0 and an 'OpusHead' packet anywhere in the buffer.
bool is_ogg_opus(ByteView data);

// 'OpusHead' anywhere in the buffer (Opus ID header without Ogg framing).
bool is_opus_head(ByteView data);

// EBML magic 1A 45 DF A3 at 0.
bool is_ebml(ByteView data);

// EBML magic plus the DocType string within the first 64 bytes.
bool is_webm(ByteView data);
bool is_matroska(ByteView data);

// H.264 Annex-B start code (00 00 01 or 00 00 00 01) anywhere in the buffer.
bool is_annexb_h264(ByteView data);

}  // namespace formatprobe
