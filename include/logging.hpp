//
//  logging.hpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "byte_view.hpp"

namespace formatprobe {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI level name; unknown names map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Hex-preview helper used in debug logs to dump a short prefix of a probed buffer.
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(ByteView data, size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, data.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

}  // namespace formatprobe

inline constexpr formatprobe::LogVerbosity fp_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return formatprobe::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return formatprobe::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return formatprobe::LogVerbosity::Info;
    }
    // Component tags (mp4/flac/adts/probe/...) are debug-level.
    return formatprobe::LogVerbosity::Debug;
}

inline bool fp_should_log(const char *level) {
    const auto current = formatprobe::get_log_verbosity();
    const auto sev = fp_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void fp_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[FormatProbe][" << lvl << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[FormatProbe][" << lvl << "] " << msg << std::endl;
    }
}

#define FP_LOG(level, message)                                              \
    do {                                                                    \
        if (fp_should_log(level)) {                                         \
            std::ostringstream _fp_log_ss;                                  \
            _fp_log_ss << message;                                          \
            fp_log_impl(level, _fp_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
