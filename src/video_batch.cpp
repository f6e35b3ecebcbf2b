//
//  video_batch.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "video_batch.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>

#include "identifier_codec.hpp"
#include "logging.hpp"

namespace fs = std::filesystem;

namespace autovideo {

namespace {

// "30" or "30fps" -> 30.
std::optional<uint32_t> parse_frame_rate_suffix(std::string s) {
    if (s.size() > 3 && s.compare(s.size() - 3, 3, "fps") == 0) {
        s.resize(s.size() - 3);
    }
    if (s.empty() || s.size() > 9) {
        return std::nullopt;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    return static_cast<uint32_t>(std::stoul(s));
}

}  // namespace

VideoEntry derive_video_entry(const fs::path &path, uint32_t default_frame_rate,
                              bool short_names) {
    VideoEntry e;
    e.path = path;
    e.frame_rate = default_frame_rate;
    std::string name = path.stem().string();

    const auto dot = name.rfind('.');
    if (dot != std::string::npos) {
        if (auto fps = parse_frame_rate_suffix(name.substr(dot + 1))) {
            e.frame_rate = *fps;
            name.resize(dot);
            std::replace(name.begin(), name.end(), '.', '_');
        }
    }
    if (short_names && name.size() > kIdentifierLength) {
        name.resize(kIdentifierLength);
    }
    std::replace(name.begin(), name.end(), ' ', '_');
    e.name = std::move(name);
    return e;
}

std::vector<VideoEntry> collect_video_entries(const std::vector<fs::path> &paths,
                                              uint32_t default_frame_rate, bool short_names,
                                              const std::optional<std::string> &video_name) {
    std::vector<VideoEntry> entries;
    entries.reserve(paths.size());
    for (const auto &p : paths) {
        entries.push_back(derive_video_entry(p, default_frame_rate, short_names));
    }
    if (entries.size() == 1 && video_name) {
        entries.front().name = *video_name;
    } else if (video_name) {
        AV_LOG("warn", "--video-name ignored for " << entries.size() << " inputs");
    }
    return entries;
}

BuildStatus validate_video_entries(const std::vector<VideoEntry> &entries) {
    std::set<std::string> seen;
    for (const auto &e : entries) {
        if (e.name.size() > kIdentifierLength) {
            return make_error(ErrorKind::Validation,
                              "Name " + e.name + " is too long. Max 10 characters! Rename the "
                              "video / use --video-name when using a single video / use "
                              "--short-names.");
        }
        if (e.name.empty()) {
            return make_error(ErrorKind::Validation,
                              "Video " + e.path.string() + " has an empty name");
        }
        if (!seen.insert(e.name).second) {
            return make_error(ErrorKind::Validation,
                              "Cannot have two videos with the same name: " + e.name);
        }
        if (e.frame_rate == 0) {
            return make_error(ErrorKind::Validation,
                              "Frame rate of " + e.name + " must be positive");
        }
    }
    return make_ok();
}

BuildStatus validate_frame_size(uint32_t frame_size) {
    if (frame_size == 0 || (frame_size & (frame_size - 1)) != 0) {
        return make_error(ErrorKind::Validation,
                          std::to_string(frame_size) +
                              " is not a power of 2 (e.g. 128, 256, 512)");
    }
    if (frame_size > kMaxFrameSize) {
        return make_error(ErrorKind::Validation,
                          "It is not recommended to have a frame size over " +
                              std::to_string(kMaxFrameSize));
    }
    return make_ok();
}

BuildStatus scan_video_inputs(const fs::path &input, std::vector<fs::path> &out) {
    std::error_code ec;
    if (!fs::exists(input, ec)) {
        return make_error(ErrorKind::Validation,
                          "File or folder does not exist: " + input.string());
    }
    if (fs::is_regular_file(input, ec)) {
        out.push_back(input);
        return make_ok();
    }
    if (!fs::is_directory(input, ec)) {
        return make_error(ErrorKind::Validation, "Not a file or folder: " + input.string());
    }
    fs::directory_iterator it(input, ec);
    if (ec) {
        return make_error(ErrorKind::Io,
                          "cannot list " + input.string() + ": " + ec.message());
    }
    std::vector<fs::path> found;
    for (const auto &entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        if (entry.path().extension() == ".json") {
            continue;
        }
        found.push_back(entry.path());
    }
    std::sort(found.begin(), found.end());
    AV_LOG("debug", "scanned " << input.string() << ": " << found.size() << " videos");
    out.insert(out.end(), found.begin(), found.end());
    return make_ok();
}

}  // namespace autovideo
