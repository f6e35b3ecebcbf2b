//
//  autovideo_config.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "build_status.hpp"
#include "logging.hpp"
#include "script_writer.hpp"

namespace autovideo {

/**
 * @brief Tool defaults, optionally read from a JSON file.
 *
 * Example:
 * @code
 * { "frame_rate": 15, "frame_size": 256, "output_dir": "out",
 *   "script": { "esp_name": "MyVideos.esp", "tv_record": "MyTV" } }
 * @endcode
 * Command-line flags override every field.
 */
struct AutoVideoConfig {
    uint32_t frame_rate = 10;
    uint32_t frame_size = 512;
    bool keep_aspect_ratio = false;
    bool short_names = false;
    bool high_quality = false;
    std::string assets_dir;
    std::string output_dir = "output";
    LogVerbosity log_level = LogVerbosity::Info;
    std::optional<ScriptInfo> script;
};

// Merge the JSON document at `path` into `config`. Unknown keys are ignored with a warning.
BuildStatus load_config_file(const std::string &path, AutoVideoConfig &config);

// Same, from a string (used by tests).
BuildStatus load_config_json(const std::string &text, AutoVideoConfig &config);

}  // namespace autovideo
