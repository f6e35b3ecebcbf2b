//
//  autovideo.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "build_status.hpp"
#include "script_writer.hpp"
#include "template_set.hpp"
#include "video_batch.hpp"

namespace autovideo {

class Confirmer;
class VideoGridEncoder;

/// @defgroup api AutoVideo Public API
/// Turns videos into VotW plugin, mesh and texture assets.
/// @{

/**
 * @brief One invocation of the tool: a mod and the videos added to it.
 */
struct BatchRequest {
    std::string mod_name;             ///< at most 10 characters
    std::vector<VideoEntry> videos;   ///< unique names, at most 10 characters each
    std::optional<std::filesystem::path> plugin_override;          ///< existing .esp to extend
    std::optional<std::filesystem::path> drive_in_plugin_override; ///< existing drive-in .esp
    uint32_t frame_size = 512;        ///< power of two, at most 1024
    bool keep_aspect_ratio = false;
    bool high_quality = false;
    bool generate_script = false;     ///< emit an xEdit script instead of plugins
    std::optional<ScriptInfo> script_info;
    std::filesystem::path output_dir = "output";
    /// Called after every finished video with (finished, total).
    std::function<void(size_t, size_t)> on_video_done;
};

struct VideoReport {
    std::string name;
    std::string token;
    uint32_t grid_amount = 0;
    float last_stop_time = 0;
    std::string audio_name;
    bool drive_in = false;
    std::vector<std::filesystem::path> meshes;
};

struct BatchReport {
    BuildStatus status;
    std::vector<VideoReport> videos;
    std::vector<std::filesystem::path> plugins;
    std::optional<std::filesystem::path> script;
};

/// Return the AutoVideo version string (e.g. `v0.4.0`).
std::string version_string();  ///< @ingroup api

/**
 * @brief Build all assets of a batch.
 *
 * Validates the whole request before writing anything, then encodes each video, writes its
 * meshes, and finally writes the plugins (or the xEdit script in script mode). Meshes of
 * videos finished before a failure stay on disk.
 *
 * @param request What to build.
 * @param templates Default template buffers; copied before mutation.
 * @param encoder Produces grid amount, stop time and audio name per video.
 * @param confirmer Resolves the plugin capacity soft limit.
 */
BatchReport process_videos(const BatchRequest &request, TemplateSet templates,
                           VideoGridEncoder &encoder, Confirmer &confirmer);  ///< @ingroup api

/// output/VotW_<mod>.esp or output/VotW_<mod>_DriveIn.esp
std::filesystem::path plugin_output_path(const std::filesystem::path &output_dir,
                                         const std::string &mod_name, bool drive_in);

/// output/meshes/Videos/<role>/<modToken>/<videoToken>.nif
std::filesystem::path mesh_output_path(const std::filesystem::path &output_dir, MeshKind kind,
                                       const std::string &mod_token,
                                       const std::string &video_token);

/// output/textures/Videos/<modToken>
std::filesystem::path texture_output_dir(const std::filesystem::path &output_dir,
                                         const std::string &mod_token);

/// @}

}  // namespace autovideo
