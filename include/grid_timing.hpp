//
//  grid_timing.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace autovideo {

// Animation grid slots present in every mesh template.
inline constexpr uint32_t kGridSlots = 24;
// Videos up to this many grids use the compact 8-grid family (and the drive-in variant).
inline constexpr uint32_t kCompactGridLimit = 8;
// Duration held by every fully occupied, non-final grid.
inline constexpr float kMidGridDuration = 25.6f;
// Frame rate the template timelines are authored for.
inline constexpr uint32_t kNativeFrameRate = 10;

// Sentinel families baked into the mesh templates; slot is 1-based.
inline constexpr float kTextKeySentinelBase = 121200.0f;
inline constexpr float kControllerSentinelBase = 141400.0f;
inline constexpr float kSpeedSentinel = 1313.0f;

inline bool is_compact(uint32_t grid_amount) { return grid_amount <= kCompactGridLimit; }

struct GridTiming {
    float controller = 0.0f;  ///< replaces 141400+slot
    float text_key = 0.0f;    ///< replaces 121200+slot
};

/**
 * @brief Timing floats for one grid slot.
 *
 * Slots before the last occupied grid hold kMidGridDuration, the last occupied grid ends at
 * `last_stop_time`, and unused slots are driven to zero. Text keys are rescaled from the
 * native 10 fps timeline to `frame_rate`.
 */
GridTiming compute_grid_timing(uint32_t slot, uint32_t grid_amount, float last_stop_time,
                               uint32_t frame_rate);

// Playback speed that replaces kSpeedSentinel.
inline float compute_speed(uint32_t frame_rate) {
    return static_cast<float>(frame_rate) / static_cast<float>(kNativeFrameRate);
}

struct GridPatchReport {
    std::array<size_t, kGridSlots> text_key_sites{};
    std::array<size_t, kGridSlots> controller_sites{};
    size_t speed_sites = 0;

    size_t total() const;
};

// Patch all 24 slots plus the speed sentinel of a mesh buffer.
GridPatchReport apply_grid_timing(std::vector<uint8_t> &mesh, uint32_t grid_amount,
                                  float last_stop_time, uint32_t frame_rate);

}  // namespace autovideo
