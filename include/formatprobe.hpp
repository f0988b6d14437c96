//
//  formatprobe.hpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "audio_type.hpp"
#include "byte_view.hpp"

namespace formatprobe {

/// @defgroup api FormatProbe Public API
/// Format detection and header inspection of in-memory buffers.
/// @{

/**
 * @brief Return the FormatProbe library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Classify a buffer without any format hint.
 *
 * Detectors run in a fixed priority order: MP4 audio track, FLAC frame sync, ADTS, EBML
 * (WebM/Matroska), Ogg Opus, raw OpusHead, RIFF/WAVE, MPEG audio scan. The first match wins.
 */
AudioType detect_audio_type(ByteView data);  ///< @ingroup api

/// Report options.
struct ProbeOptions {
    bool list_frames = false;  ///< include frame boundaries for FLAC/ADTS/MP3 payloads
    bool list_chunks = false;  ///< split the buffer as length-prefixed chunks
};

/**
 * @brief Build a JSON report: detected type plus the decoded header of the first frame or
 * audio sample entry, and optionally frame/chunk listings.
 */
nlohmann::json probe_report(ByteView data, const ProbeOptions &options = {});  ///< @ingroup api

/// @}

}  // namespace formatprobe
