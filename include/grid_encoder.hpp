//
//  grid_encoder.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "build_status.hpp"

namespace autovideo {

class Confirmer;

struct GridEncodeRequest {
    std::filesystem::path video_path;
    std::string mod_token;    ///< 'X'-padded mod identifier
    std::string video_token;  ///< 'X'-padded video identifier
    uint32_t frame_size = 512;
    bool keep_aspect_ratio = false;
    bool high_quality = false;
    uint32_t frame_rate = 10;
    std::filesystem::path texture_dir;  ///< output/textures/Videos/<modToken>
    Confirmer *confirmer = nullptr;
};

struct GridEncodeResult {
    BuildStatus status;
    uint32_t grid_amount = 0;   ///< 1..24
    float last_stop_time = 0;   ///< seconds
    std::string audio_name;     ///< sound asset referenced by the plugin
};

/**
 * @brief Splits a video into texture-atlas grids.
 *
 * Implementations write the compressed atlases to `texture_dir` and report how many grids
 * the video occupies, where playback of the last grid stops, and the audio asset name.
 */
class VideoGridEncoder {
   public:
    virtual ~VideoGridEncoder() = default;
    virtual GridEncodeResult encode(const GridEncodeRequest &request) = 0;
};

// Sidecar suffix read by ManifestGridEncoder ("clip.mp4" -> "clip.mp4.grid.json").
inline constexpr const char *kGridManifestSuffix = ".grid.json";

/**
 * @brief Encoder backed by a JSON sidecar written by an external frame extractor.
 *
 * The sidecar carries `grid_amount`, `last_stop_time`, `audio_name` and an optional
 * `textures` array of atlas files (relative to the sidecar) that are copied into the
 * texture directory.
 */
class ManifestGridEncoder : public VideoGridEncoder {
   public:
    GridEncodeResult encode(const GridEncodeRequest &request) override;
};

}  // namespace autovideo
