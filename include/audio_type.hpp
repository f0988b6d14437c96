//
//  audio_type.hpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace formatprobe {

// Classification result of a probe; containers are reported when their codec is not known.
enum class AudioType { Unknown, AAC, FLAC, Opus, MP3, WAV, WebM, Matroska };

// Stable lowercase name ("aac", "flac", ...), used in reports.
std::string audio_type_name(AudioType type);

}  // namespace formatprobe
