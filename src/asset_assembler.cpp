//
//  asset_assembler.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "autovideo.hpp"
#include "autovideo_version.hpp"

#include <chrono>
#include <utility>

#include "asset_writer.hpp"
#include "byte_patcher.hpp"
#include "confirmer.hpp"
#include "grid_encoder.hpp"
#include "grid_timing.hpp"
#include "identifier_codec.hpp"
#include "logging.hpp"
#include "placeholder_map.hpp"

namespace fs = std::filesystem;

namespace autovideo {

std::string version_string() { return AUTOVIDEO_VERSION_DISPLAY; }

fs::path plugin_output_path(const fs::path &output_dir, const std::string &mod_name,
                            bool drive_in) {
    return output_dir / ("VotW_" + mod_name + (drive_in ? "_DriveIn" : "") + kPluginExtension);
}

fs::path mesh_output_path(const fs::path &output_dir, MeshKind kind, const std::string &mod_token,
                          const std::string &video_token) {
    return output_dir / "meshes" / "Videos" / mesh_kind_dir(kind) / mod_token /
           (video_token + kMeshExtension);
}

fs::path texture_output_dir(const fs::path &output_dir, const std::string &mod_token) {
    return output_dir / "textures" / "Videos" / mod_token;
}

namespace {

// Width of the audio name placeholder in plugin templates.
constexpr size_t kAudioTokenLength = 14;

BatchReport fail(BatchReport report, BuildStatus status) {
    AV_LOG("error", "[" << error_kind_name(status.kind) << "] " << status.message);
    report.status = std::move(status);
    return report;
}

BuildStatus load_plugin(const std::optional<fs::path> &override_path, const TemplateSet &templates,
                        TemplateRole role, std::vector<uint8_t> &out) {
    if (override_path) {
        AV_LOG("info", "extending existing plugin " << override_path->string());
        return load_plugin_override(*override_path, out);
    }
    out = templates.get(role);
    if (out.empty()) {
        return make_error(ErrorKind::Validation,
                          std::string("template not loaded: ") + template_file_name(role));
    }
    return make_ok();
}

// Resolve the plugin capacity soft limit through the confirmer.
BuildStatus check_capacity(const BatchRequest &request, Confirmer &confirmer) {
    if (request.generate_script || request.videos.size() <= kPluginCapacity) {
        return make_ok();
    }
    const std::string count = std::to_string(request.videos.size());
    const std::string prompt = "You provided " + count + " videos but an esp can only support " +
                               std::to_string(kPluginCapacity) + ", continue? (y/N) ";
    if (confirmer.confirm(prompt)) {
        AV_LOG("warn", "plugin capacity exceeded; videos past slot " << kPluginCapacity
                                                                    << " get meshes only");
        return make_ok();
    }
    if (const char *hint = confirmer.refusal_hint()) {
        return make_error(ErrorKind::Validation,
                          "You provided " + count + " videos but an esp can only support " +
                              std::to_string(kPluginCapacity) + ", " + hint + ".");
    }
    return make_error(ErrorKind::Declined, "Too many videos");
}

// The audio name only has a fixed-width field when it is patched into a plugin; the xEdit
// script takes it verbatim.
BuildStatus check_encoder_result(const VideoEntry &video, const GridEncodeResult &res,
                                 bool fixed_audio_field) {
    if (!res.status.ok) {
        BuildStatus st = res.status;
        if (st.kind == ErrorKind::None) {
            st.kind = ErrorKind::Encoder;
        }
        st.message = "Failed to encode " + video.path.string() + ": " + st.message;
        return st;
    }
    if (res.grid_amount < 1 || res.grid_amount > kGridSlots) {
        return make_error(ErrorKind::Encoder,
                          "Encoder returned " + std::to_string(res.grid_amount) + " grids for " +
                              video.name + "; expected 1.." + std::to_string(kGridSlots));
    }
    if (fixed_audio_field && res.audio_name.size() > kAudioTokenLength) {
        return make_error(ErrorKind::Encoder, "Audio asset name " + res.audio_name +
                                                  " is longer than " +
                                                  std::to_string(kAudioTokenLength) +
                                                  " characters");
    }
    return make_ok();
}

BuildStatus patch_plugin(std::vector<uint8_t> &plugin, const char *label,
                         const PlaceholderValues &values) {
    if (count_tokens(plugin, "AUTOVIDENT") == 0) {
        AV_LOG("warn", label << " plugin has no free video slot left; " << values.video->name
                             << " gets meshes only");
    }
    if (!apply_placeholders(plugin, plugin_placeholder_rules(), values)) {
        return make_error(ErrorKind::Validation,
                          std::string("cannot patch ") + label + " plugin for " +
                              values.video->name);
    }
    return make_ok();
}

BuildStatus build_meshes(const BatchRequest &request, const TemplateSet &templates,
                         const PlaceholderValues &values, const VideoEntry &video,
                         const GridEncodeResult &enc, VideoReport &report) {
    for (MeshKind kind : mesh_kinds_for(enc.grid_amount)) {
        const TemplateRole role = mesh_template_role(kind, enc.grid_amount);
        std::vector<uint8_t> mesh = templates.get(role);
        if (mesh.empty()) {
            return make_error(ErrorKind::Validation,
                              std::string("template not loaded: ") + template_file_name(role));
        }
        if (!apply_placeholders(mesh, mesh_placeholder_rules(), values)) {
            return make_error(ErrorKind::Validation,
                              std::string("cannot patch ") + template_file_name(role) +
                                  " for " + video.name);
        }
        apply_grid_timing(mesh, enc.grid_amount, enc.last_stop_time, video.frame_rate);

        const fs::path out = mesh_output_path(request.output_dir, kind, values.mod->slug,
                                              values.video->slug);
        auto st = write_file_atomic(out, mesh);
        if (!st.ok) {
            return st;
        }
        report.meshes.push_back(out);
    }
    return make_ok();
}

}  // namespace

BatchReport process_videos(const BatchRequest &request, TemplateSet templates,
                           VideoGridEncoder &encoder, Confirmer &confirmer) {
    const auto t0 = std::chrono::steady_clock::now();
    BatchReport report;

    // --- validation: nothing is written before all of it passes ---
    if (request.mod_name.empty()) {
        return fail(std::move(report), make_error(ErrorKind::Validation, "Mod name is empty"));
    }
    auto mod = make_mod_identifiers(request.mod_name);
    if (!mod) {
        return fail(std::move(report),
                    make_error(ErrorKind::Validation,
                               request.mod_name + " is too long, should be at most " +
                                   std::to_string(kIdentifierLength) + " characters"));
    }
    if (request.videos.empty()) {
        return fail(std::move(report), make_error(ErrorKind::Validation, "No videos given"));
    }
    auto st = check_capacity(request, confirmer);
    if (!st.ok) {
        return fail(std::move(report), std::move(st));
    }
    st = validate_video_entries(request.videos);
    if (!st.ok) {
        return fail(std::move(report), std::move(st));
    }
    st = validate_frame_size(request.frame_size);
    if (!st.ok) {
        return fail(std::move(report), std::move(st));
    }

    std::vector<uint8_t> tv_plugin;
    std::vector<uint8_t> di_plugin;
    st = load_plugin(request.plugin_override, templates, TemplateRole::PluginPrimary, tv_plugin);
    if (!st.ok) {
        return fail(std::move(report), std::move(st));
    }
    st = load_plugin(request.drive_in_plugin_override, templates, TemplateRole::PluginDriveIn,
                     di_plugin);
    if (!st.ok) {
        return fail(std::move(report), std::move(st));
    }
    for (const auto &literal : reused_literals()) {
        AV_LOG("debug", "token " << literal << " means different things in plugins and meshes");
    }

    // --- per video ---
    bool write_drive_in = false;
    std::vector<ScriptVideo> script_videos;
    const fs::path textures = texture_output_dir(request.output_dir, mod->slug);

    for (size_t i = 0; i < request.videos.size(); ++i) {
        const VideoEntry &video = request.videos[i];
        auto ids = make_video_identifiers(video.name);
        if (!ids) {
            return fail(std::move(report),
                        make_error(ErrorKind::Validation, "Name " + video.name + " is too long"));
        }
        AV_LOG("info", "[" << (i + 1) << "/" << request.videos.size() << "] " << video.name
                           << " @" << video.frame_rate << "fps");

        GridEncodeRequest enc_req;
        enc_req.video_path = video.path;
        enc_req.mod_token = mod->slug;
        enc_req.video_token = ids->slug;
        enc_req.frame_size = request.frame_size;
        enc_req.keep_aspect_ratio = request.keep_aspect_ratio;
        enc_req.high_quality = request.high_quality;
        enc_req.frame_rate = video.frame_rate;
        enc_req.texture_dir = textures;
        enc_req.confirmer = &confirmer;
        const GridEncodeResult enc = encoder.encode(enc_req);
        st = check_encoder_result(video, enc, !request.generate_script);
        if (!st.ok) {
            return fail(std::move(report), std::move(st));
        }

        const bool compact = is_compact(enc.grid_amount);
        write_drive_in |= compact;

        VideoReport vr;
        vr.name = video.name;
        vr.token = ids->slug;
        vr.grid_amount = enc.grid_amount;
        vr.last_stop_time = enc.last_stop_time;
        vr.audio_name = enc.audio_name;
        vr.drive_in = compact;

        PlaceholderValues values;
        values.mod = &*mod;
        values.video = &*ids;
        values.audio_name = enc.audio_name;

        if (request.generate_script) {
            script_videos.push_back({ids->slug, video.name, enc.audio_name, compact});
        } else {
            st = patch_plugin(tv_plugin, "primary", values);
            if (st.ok && compact) {
                st = patch_plugin(di_plugin, "drive-in", values);
            }
            if (!st.ok) {
                return fail(std::move(report), std::move(st));
            }
        }

        st = build_meshes(request, templates, values, video, enc, vr);
        if (!st.ok) {
            return fail(std::move(report), std::move(st));
        }
        report.videos.push_back(std::move(vr));
        if (request.on_video_done) {
            request.on_video_done(i + 1, request.videos.size());
        }
    }

    // --- batch outputs ---
    if (request.generate_script) {
        const ScriptInfo info = request.script_info.value_or(default_script_info(request.mod_name));
        const std::string text = render_xedit_script(*mod, info, script_videos);
        const fs::path out = request.output_dir / script_file_name(request.mod_name);
        st = write_file_atomic(out, std::vector<uint8_t>(text.begin(), text.end()));
        if (!st.ok) {
            return fail(std::move(report), std::move(st));
        }
        report.script = out;
    } else {
        const fs::path tv_out = plugin_output_path(request.output_dir, request.mod_name, false);
        st = write_file_atomic(tv_out, tv_plugin);
        if (!st.ok) {
            return fail(std::move(report), std::move(st));
        }
        report.plugins.push_back(tv_out);
        if (write_drive_in) {
            const fs::path di_out = plugin_output_path(request.output_dir, request.mod_name, true);
            st = write_file_atomic(di_out, di_plugin);
            if (!st.ok) {
                return fail(std::move(report), std::move(st));
            }
            report.plugins.push_back(di_out);
        }
    }

    const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - t0)
                              .count();
    AV_LOG("debug", "process_videos videos=" << report.videos.size()
                                             << " plugins=" << report.plugins.size()
                                             << " total_ms=" << total_ms);
    report.status = make_ok();
    return report;
}

}  // namespace autovideo
