//
//  template_set.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "template_set.hpp"

#include <cctype>
#include <string>
#include <system_error>

#include "asset_writer.hpp"
#include "grid_timing.hpp"
#include "logging.hpp"

namespace fs = std::filesystem;

namespace autovideo {

const char *mesh_kind_dir(MeshKind kind) {
    switch (kind) {
        case MeshKind::Television:
            return "Television";
        case MeshKind::Projector:
            return "Projector";
        case MeshKind::DriveIn:
            return "DriveIn";
    }
    return "";
}

const char *template_file_name(TemplateRole role) {
    switch (role) {
        case TemplateRole::PluginPrimary:
            return "TemplateVideos_10.esp";
        case TemplateRole::PluginDriveIn:
            return "TemplateDriveIn_10.esp";
        case TemplateRole::TelevisionMesh8:
            return "TV 8 Grids.nif";
        case TemplateRole::TelevisionMesh24:
            return "TV 24 Grids.nif";
        case TemplateRole::ProjectorMesh8:
            return "PR 8 Grids.nif";
        case TemplateRole::ProjectorMesh24:
            return "PR 24 Grids.nif";
        case TemplateRole::DriveInMesh8:
            return "DI 8 Grids.nif";
    }
    return "";
}

BuildStatus load_template_set(const fs::path &asset_dir, TemplateSet &out) {
    for (size_t i = 0; i < kTemplateRoleCount; ++i) {
        const auto role = static_cast<TemplateRole>(i);
        const fs::path p = asset_dir / template_file_name(role);
        std::vector<uint8_t> bytes;
        auto st = read_file_bytes(p, bytes);
        if (!st.ok) {
            return make_error(ErrorKind::Io, "missing default template " + p.string() + " (" +
                                                 st.message + ")");
        }
        if (bytes.empty()) {
            return make_error(ErrorKind::Validation, "default template is empty: " + p.string());
        }
        AV_LOG("debug", "template " << template_file_name(role) << " bytes=" << bytes.size()
                                    << " head=" << hex_window(bytes, 0));
        out.set(role, std::move(bytes));
    }
    return make_ok();
}

BuildStatus load_plugin_override(const fs::path &path, std::vector<uint8_t> &out) {
    std::error_code ec;
    if (!fs::exists(path, ec) || !fs::is_regular_file(path, ec)) {
        return make_error(ErrorKind::Validation, "Given esp file does not exist: " + path.string());
    }
    std::string ext = path.extension().string();
    for (auto &c : ext) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    if (ext != kPluginExtension) {
        return make_error(ErrorKind::Validation,
                          "Given plugin is not an " + std::string(kPluginExtension) +
                              " file: " + path.string());
    }
    return read_file_bytes(path, out);
}

TemplateRole mesh_template_role(MeshKind kind, uint32_t grid_amount) {
    const bool compact = is_compact(grid_amount);
    switch (kind) {
        case MeshKind::Television:
            return compact ? TemplateRole::TelevisionMesh8 : TemplateRole::TelevisionMesh24;
        case MeshKind::Projector:
            return compact ? TemplateRole::ProjectorMesh8 : TemplateRole::ProjectorMesh24;
        case MeshKind::DriveIn:
            return TemplateRole::DriveInMesh8;
    }
    return TemplateRole::TelevisionMesh24;
}

std::vector<MeshKind> mesh_kinds_for(uint32_t grid_amount) {
    std::vector<MeshKind> kinds = {MeshKind::Television, MeshKind::Projector};
    if (is_compact(grid_amount)) {
        kinds.push_back(MeshKind::DriveIn);
    }
    return kinds;
}

}  // namespace autovideo
