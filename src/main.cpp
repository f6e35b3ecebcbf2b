//
//  main.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "autovideo.hpp"
#include "autovideo_config.hpp"
#include "autovideo_version.hpp"
#include "confirmer.hpp"
#include "grid_encoder.hpp"
#include "logging.hpp"
#include "template_set.hpp"
#include "video_batch.hpp"

namespace {

void print_usage() {
    std::cerr << "AutoVideo " << AUTOVIDEO_VERSION_DISPLAY << "\n"
              << "Makes textures, .esp and .nif files for a VotW mod.\n\n"
              << "usage:\n"
              << "  autovideo <mod_name> --input <video|folder> [options]\n"
              << "Options:\n"
              << "  -i, --input PATH       Video or folder of videos to convert.\n"
              << "  -n, --video-name NAME  Name for a single video (max 10 characters).\n"
              << "  --esp FILE             Existing esp to append to (copied, not edited).\n"
              << "  --desp FILE            Existing DriveIn esp to append to.\n"
              << "  -s, --size N           Frame size, power of 2 up to 1024 (default 512).\n"
              << "  -k, --keep-aspect-ratio\n"
              << "                         Refit input to 4:3.\n"
              << "  --short-names          Cut names longer than 10 characters.\n"
              << "  -g, --generate-script  Write an xEdit script instead of esp files.\n"
              << "  -y, --yes              Answer yes to all warnings.\n"
              << "  -r, --framerate N      In-game frame rate (default 10); video.30.mp4 or\n"
              << "                         video.30fps.mp4 overrides it per video.\n"
              << "  -q, --quality          High quality textures (larger, slower).\n"
              << "  --config FILE          JSON defaults for the options above.\n"
              << "  --assets DIR           Folder holding the template .esp/.nif files.\n"
              << "  --output DIR           Output folder (default: output).\n"
              << "  --log-level LEVEL      error|warn|info|debug (default: info).\n"
              << "  -v, --version          Print the version.\n";
}

bool parse_u32(const std::string &s, uint32_t &out) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 9) {
        return false;
    }
    out = static_cast<uint32_t>(std::stoul(s));
    return true;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "AutoVideo " << AUTOVIDEO_VERSION_DISPLAY << "\n";
        return 0;
    }

    // First pass: config file, so flags can override it.
    autovideo::AutoVideoConfig config;
    config.assets_dir = AUTOVIDEO_DEFAULT_ASSET_DIR;
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            auto st = autovideo::load_config_file(argv[i + 1], config);
            if (!st.ok) {
                std::cerr << "Invalid config: " << st.message << "\n";
                return 2;
            }
        }
    }
    autovideo::set_log_verbosity(config.log_level);

    std::vector<std::string> positional;
    std::optional<std::string> input;
    std::optional<std::string> video_name;
    std::optional<std::filesystem::path> esp;
    std::optional<std::filesystem::path> desp;
    bool generate_script = false;
    bool yes = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string &out) {
            if (i + 1 >= argc) {
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string value;
        if ((arg == "--input" || arg == "-i") && next(value)) {
            input = value;
        } else if ((arg == "--video-name" || arg == "-n") && next(value)) {
            video_name = value;
        } else if (arg == "--esp" && next(value)) {
            esp = value;
        } else if (arg == "--desp" && next(value)) {
            desp = value;
        } else if ((arg == "--size" || arg == "-s") && next(value)) {
            if (!parse_u32(value, config.frame_size)) {
                std::cerr << "Invalid size: " << value << "\n";
                return 2;
            }
        } else if ((arg == "--framerate" || arg == "-r") && next(value)) {
            if (!parse_u32(value, config.frame_rate) || config.frame_rate == 0) {
                std::cerr << "Invalid framerate: " << value << "\n";
                return 2;
            }
        } else if (arg == "--keep-aspect-ratio" || arg == "-k") {
            config.keep_aspect_ratio = true;
        } else if (arg == "--short-names") {
            config.short_names = true;
        } else if (arg == "--generate-script" || arg == "-g") {
            generate_script = true;
        } else if (arg == "--yes" || arg == "-y") {
            yes = true;
        } else if (arg == "--quality" || arg == "-q") {
            config.high_quality = true;
        } else if (arg == "--config" && next(value)) {
            // Already applied.
        } else if (arg == "--assets" && next(value)) {
            config.assets_dir = value;
        } else if (arg == "--output" && next(value)) {
            config.output_dir = value;
        } else if (arg == "--log-level" && next(value)) {
            autovideo::set_log_verbosity(autovideo::parse_log_verbosity(value));
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.size() != 1 || !input) {
        print_usage();
        return 2;
    }

    std::vector<std::filesystem::path> inputs;
    auto st = autovideo::scan_video_inputs(*input, inputs);
    if (!st.ok) {
        AV_LOG("error", "autovideo: " << st.message);
        return 1;
    }

    autovideo::TemplateSet templates;
    st = autovideo::load_template_set(config.assets_dir, templates);
    if (!st.ok) {
        AV_LOG("error", "autovideo: " << st.message);
        return 1;
    }

    autovideo::BatchRequest request;
    request.mod_name = positional[0];
    request.videos = autovideo::collect_video_entries(inputs, config.frame_rate,
                                                      config.short_names, video_name);
    request.plugin_override = esp;
    request.drive_in_plugin_override = desp;
    request.frame_size = config.frame_size;
    request.keep_aspect_ratio = config.keep_aspect_ratio;
    request.high_quality = config.high_quality;
    request.generate_script = generate_script;
    request.script_info = config.script;
    request.output_dir = config.output_dir;
    request.on_video_done = [](size_t done, size_t total) {
        std::cout << "Finished video " << done << " of " << total << "\n";
    };

    std::unique_ptr<autovideo::Confirmer> confirmer;
    if (yes) {
        confirmer = std::make_unique<autovideo::FixedConfirmer>(true, &std::cout);
    } else {
        confirmer = std::make_unique<autovideo::InteractiveConfirmer>(std::cin, std::cout);
    }
    autovideo::ManifestGridEncoder encoder;

    auto report = autovideo::process_videos(request, std::move(templates), encoder, *confirmer);
    if (!report.status.ok) {
        AV_LOG("error", "autovideo: " << report.status.message);
        return 1;
    }
    for (const auto &p : report.plugins) {
        std::cout << "Wrote: " << p.string() << "\n";
    }
    if (report.script) {
        std::cout << "Wrote: " << report.script->string() << "\n";
    }
    std::cout << "\nFinished!\n";
    return 0;
}
