//
//  video_batch.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "build_status.hpp"

namespace autovideo {

inline constexpr uint32_t kMaxFrameSize = 1024;

struct VideoEntry {
    std::string name;  ///< in-game name, at most 10 characters once validated
    std::filesystem::path path;
    uint32_t frame_rate = 10;
};

/**
 * @brief Derive name and frame rate from a video path.
 *
 * "Intro.30.mp4" and "Intro.30fps.mp4" play at 30 fps; remaining dots and spaces turn into
 * underscores. With `short_names`, names longer than 10 characters are truncated.
 */
VideoEntry derive_video_entry(const std::filesystem::path &path, uint32_t default_frame_rate,
                              bool short_names);

// A single input may be renamed through `video_name`; it is ignored for several inputs.
std::vector<VideoEntry> collect_video_entries(const std::vector<std::filesystem::path> &paths,
                                              uint32_t default_frame_rate, bool short_names,
                                              const std::optional<std::string> &video_name);

// Names at most 10 characters and unique, frame rates non-zero.
BuildStatus validate_video_entries(const std::vector<VideoEntry> &entries);

// Power of two, non-zero, at most kMaxFrameSize.
BuildStatus validate_frame_size(uint32_t frame_size);

// A file yields itself; a directory yields its regular files sorted by name, without
// .json sidecars.
BuildStatus scan_video_inputs(const std::filesystem::path &input,
                              std::vector<std::filesystem::path> &out);

}  // namespace autovideo
