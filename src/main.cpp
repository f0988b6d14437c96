//
//  main.cpp
//  FormatProbe
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "formatprobe.hpp"
#include "formatprobe_version.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>

namespace {

constexpr size_t kReadChunkSize = 64 * 1024;

// Read until EOF or `max_bytes` (0 = everything) from a stream that cannot seek.
bool read_stream(std::istream &f, const std::string &path, size_t max_bytes,
                 std::vector<uint8_t> &out) {
    std::vector<char> buf(kReadChunkSize);
    while (max_bytes == 0 || out.size() < max_bytes) {
        size_t want = buf.size();
        if (max_bytes != 0) {
            want = std::min(want, max_bytes - out.size());
        }
        f.read(buf.data(), static_cast<std::streamsize>(want));
        const size_t got = static_cast<size_t>(f.gcount());
        out.insert(out.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(got));
        if (got < want) {
            break;
        }
    }
    if (f.bad()) {
        FP_LOG("error", "read failed for " << path << " after " << out.size() << " bytes");
        return false;
    }
    return true;
}

// Read at most `max_bytes` (0 = everything) from the start of `path`.
bool read_prefix(const std::string &path, size_t max_bytes, std::vector<uint8_t> &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        FP_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    f.seekg(0, std::ios::end);
    const std::streamoff end = f.tellg();
    if (end < 0) {
        // Pipes and FIFOs report no size.
        f.clear();
        out.clear();
        return read_stream(f, path, max_bytes, out);
    }
    size_t sz = static_cast<size_t>(end);
    f.seekg(0, std::ios::beg);
    if (max_bytes != 0 && max_bytes < sz) {
        sz = max_bytes;
    }
    out.resize(sz);
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(sz));
    if (f.gcount() != static_cast<std::streamsize>(sz)) {
        FP_LOG("error", "short read for " << path << ": " << f.gcount() << " of " << sz);
        return false;
    }
    return true;
}

bool parse_size(const std::string &s, size_t &out) {
    if (s.empty()) return false;
    char *end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') return false;
    out = static_cast<size_t>(v);
    return true;
}

void print_usage() {
    std::cerr << "FormatProbe " << FORMATPROBE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2026 Till Toenshoff\n\n"
              << "usage:\n"
              << "  formatprobe <input> [--max-bytes N] [--frames] [--chunks] "
              << "[--log-level error|warn|info|debug]\n"
              << "Options:\n"
              << "  --max-bytes N       Probe only the first N bytes of the input.\n"
              << "  --frames            List FLAC/ADTS/MP3 frame boundaries.\n"
              << "  --chunks            Split the input as u32le length-prefixed chunks.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "The JSON report is written to stdout.\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "FormatProbe " << FORMATPROBE_VERSION_DISPLAY << "\n";
        return 0;
    }

    std::vector<std::string> positional;
    formatprobe::ProbeOptions options;
    size_t max_bytes = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--frames") {
            options.list_frames = true;
        } else if (arg == "--chunks") {
            options.list_chunks = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            formatprobe::set_log_verbosity(formatprobe::parse_log_verbosity(argv[i + 1]));
            ++i;
        } else if (arg == "--max-bytes" && i + 1 < argc) {
            if (!parse_size(argv[++i], max_bytes)) {
                std::cerr << "Invalid --max-bytes value: " << argv[i] << "\n";
                return 2;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.size() != 1) {
        print_usage();
        return 2;
    }

    std::vector<uint8_t> data;
    if (!read_prefix(positional[0], max_bytes, data)) {
        FP_LOG("error", "formatprobe: failed to read " << positional[0]);
        return 1;
    }

    nlohmann::json report = formatprobe::probe_report(data, options);
    report["input"] = positional[0];
    std::cout << report.dump(2) << "\n";
    return 0;
}
