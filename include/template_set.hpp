//
//  template_set.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>

#include "build_status.hpp"

namespace autovideo {

// Videos a single plugin template can declare.
inline constexpr size_t kPluginCapacity = 10;

inline constexpr const char *kPluginExtension = ".esp";
inline constexpr const char *kMeshExtension = ".nif";

enum class TemplateRole {
    PluginPrimary,
    PluginDriveIn,
    TelevisionMesh8,
    TelevisionMesh24,
    ProjectorMesh8,
    ProjectorMesh24,
    DriveInMesh8,
};

inline constexpr size_t kTemplateRoleCount = 7;

// Display surfaces a mesh is produced for.
enum class MeshKind { Television, Projector, DriveIn };

// Directory name under output/meshes/Videos/.
const char *mesh_kind_dir(MeshKind kind);

// Default asset file name of a role (e.g. "TV 8 Grids.nif").
const char *template_file_name(TemplateRole role);

/**
 * @brief Known-good template buffers, one per role.
 *
 * Loaded once at startup and handed to the assembler by value; buffers are copied before
 * they are mutated.
 */
struct TemplateSet {
    std::array<std::vector<uint8_t>, kTemplateRoleCount> buffers;

    const std::vector<uint8_t> &get(TemplateRole role) const {
        return buffers[static_cast<size_t>(role)];
    }
    void set(TemplateRole role, std::vector<uint8_t> bytes) {
        buffers[static_cast<size_t>(role)] = std::move(bytes);
    }
};

// Load every default template from `asset_dir`.
BuildStatus load_template_set(const std::filesystem::path &asset_dir, TemplateSet &out);

// Validate and load a user-supplied plugin (existing file, case-insensitive .esp).
BuildStatus load_plugin_override(const std::filesystem::path &path, std::vector<uint8_t> &out);

// Pick the 8- or 24-grid template for a mesh kind. Drive-in only exists in the 8-grid family.
TemplateRole mesh_template_role(MeshKind kind, uint32_t grid_amount);

// Mesh kinds produced for a video occupying `grid_amount` grids.
std::vector<MeshKind> mesh_kinds_for(uint32_t grid_amount);

}  // namespace autovideo
