//
//  grid_timing.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "grid_timing.hpp"

#include "byte_patcher.hpp"
#include "logging.hpp"

namespace autovideo {

GridTiming compute_grid_timing(uint32_t slot, uint32_t grid_amount, float last_stop_time,
                               uint32_t frame_rate) {
    GridTiming t;
    if (slot < grid_amount) {
        t.controller = kMidGridDuration;
    } else if (slot == grid_amount) {
        t.controller = last_stop_time;
    } else {
        t.controller = 0.0f;
    }
    if (t.controller == 0.0f || frame_rate == kNativeFrameRate) {
        t.text_key = t.controller;
    } else {
        t.text_key = t.controller / static_cast<float>(frame_rate) * 10.0f;
    }
    return t;
}

size_t GridPatchReport::total() const {
    size_t n = speed_sites;
    for (uint32_t i = 0; i < kGridSlots; ++i) {
        n += text_key_sites[i] + controller_sites[i];
    }
    return n;
}

GridPatchReport apply_grid_timing(std::vector<uint8_t> &mesh, uint32_t grid_amount,
                                  float last_stop_time, uint32_t frame_rate) {
    GridPatchReport report;
    for (uint32_t slot = 1; slot <= kGridSlots; ++slot) {
        const GridTiming t = compute_grid_timing(slot, grid_amount, last_stop_time, frame_rate);
        report.text_key_sites[slot - 1] = patch_sentinel_float(
            mesh, kTextKeySentinelBase + static_cast<float>(slot), t.text_key);
        report.controller_sites[slot - 1] = patch_sentinel_float(
            mesh, kControllerSentinelBase + static_cast<float>(slot), t.controller);
    }
    report.speed_sites = patch_sentinel_float(mesh, kSpeedSentinel, compute_speed(frame_rate));
    AV_LOG("patch", "grid timing grids=" << grid_amount << " stop=" << last_stop_time
                                         << " fps=" << frame_rate
                                         << " sites=" << report.total());
    if (report.speed_sites == 0) {
        AV_LOG("warn", "mesh template carries no speed sentinel; playback speed unchanged");
    }
    return report;
}

}  // namespace autovideo
