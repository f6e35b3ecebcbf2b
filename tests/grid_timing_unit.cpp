// Unit coverage for per-slot timing values and mesh patching.
#include <cmath>
#include <string>
#include <vector>

#include "byte_patcher.hpp"
#include "grid_timing.hpp"
#include "test_utils.hpp"

using namespace autovideo;

namespace {

bool check(bool cond, const std::string &msg) {
    return test_utils::check(cond, msg, "grid_timing_unit");
}

bool near(float a, float b) { return std::fabs(a - b) < 1e-4f; }

bool test_five_grids_at_20fps() {
    bool ok = true;
    for (uint32_t slot = 1; slot <= kGridSlots; ++slot) {
        const auto t = compute_grid_timing(slot, 5, 42.0f, 20);
        const std::string s = "slot " + std::to_string(slot);
        if (slot < 5) {
            ok &= check(t.controller == 25.6f, s + " controller 25.6");
            ok &= check(near(t.text_key, 12.8f), s + " text key 12.8");
        } else if (slot == 5) {
            ok &= check(t.controller == 42.0f, s + " controller is the stop time");
            ok &= check(near(t.text_key, 21.0f), s + " text key 21.0");
        } else {
            ok &= check(t.controller == 0.0f && t.text_key == 0.0f, s + " inert");
        }
    }
    ok &= check(compute_speed(20) == 2.0f, "speed 2.0 at 20 fps");
    return ok;
}

bool test_native_frame_rate() {
    bool ok = true;
    const auto mid = compute_grid_timing(1, 3, 7.5f, 10);
    ok &= check(mid.text_key == mid.controller && mid.controller == 25.6f,
                "10 fps keeps the text key");
    const auto last = compute_grid_timing(3, 3, 7.5f, 10);
    ok &= check(last.text_key == 7.5f, "10 fps last grid");
    ok &= check(compute_speed(10) == 1.0f, "speed 1.0 at 10 fps");
    ok &= check(compute_speed(15) == 1.5f, "speed 1.5 at 15 fps");
    return ok;
}

bool test_single_and_full() {
    bool ok = true;
    const auto only = compute_grid_timing(1, 1, 3.25f, 30);
    ok &= check(only.controller == 3.25f, "single grid ends at stop time");
    ok &= check(near(only.text_key, 3.25f / 30.0f * 10.0f), "single grid text key rescaled");
    const auto last = compute_grid_timing(24, 24, 12.0f, 5);
    ok &= check(last.controller == 12.0f && near(last.text_key, 24.0f), "slot 24 of 24 at 5 fps");
    ok &= check(is_compact(8) && !is_compact(9) && is_compact(1), "compact boundary");
    return ok;
}

bool test_apply_grid_timing() {
    bool ok = true;
    auto mesh = test_utils::make_mesh_template(8);
    const size_t size_before = mesh.size();
    const auto report = apply_grid_timing(mesh, 5, 42.0f, 20);
    ok &= check(mesh.size() == size_before, "mesh length unchanged");
    ok &= check(report.speed_sites == 2, "both speed sentinels patched");
    for (uint32_t slot = 1; slot <= kGridSlots; ++slot) {
        const std::string s = "slot " + std::to_string(slot);
        ok &= check(report.text_key_sites[slot - 1] == 1, s + " text key patched once");
        ok &= check(report.controller_sites[slot - 1] == (slot <= 8 ? 2u : 1u),
                    s + " every controller copy patched");
    }
    // No sentinel survives.
    for (uint32_t slot = 1; slot <= kGridSlots; ++slot) {
        ok &= check(patch_sentinel_float(mesh, kTextKeySentinelBase + slot, 0.0f) == 0 &&
                        patch_sentinel_float(mesh, kControllerSentinelBase + slot, 0.0f) == 0,
                    "no stale sentinel for slot " + std::to_string(slot));
    }
    ok &= check(patch_sentinel_float(mesh, kSpeedSentinel, 0.0f) == 0, "no stale speed sentinel");

    // Each family carries its own value at the offsets the sentinels occupied.
    const auto pristine = test_utils::make_mesh_template(8);
    for (uint32_t slot = 1; slot <= kGridSlots; ++slot) {
        const std::string s = "slot " + std::to_string(slot);
        float want_text_key = 0.0f;
        float want_controller = 0.0f;
        if (slot < 5) {
            want_text_key = 12.8f;
            want_controller = 25.6f;
        } else if (slot == 5) {
            want_text_key = 21.0f;
            want_controller = 42.0f;
        }
        const auto text_keys =
            test_utils::float_offsets(pristine, kTextKeySentinelBase + static_cast<float>(slot));
        const auto controllers = test_utils::float_offsets(
            pristine, kControllerSentinelBase + static_cast<float>(slot));
        ok &= check(text_keys.size() == 1 && !controllers.empty(), s + " sentinels located");
        for (size_t off : text_keys) {
            ok &= check(near(test_utils::float_at(mesh, off), want_text_key),
                        s + " text key value at its sentinel");
        }
        for (size_t off : controllers) {
            ok &= check(test_utils::float_at(mesh, off) == want_controller,
                        s + " controller value at its sentinel");
        }
    }
    const auto speed_offsets = test_utils::float_offsets(pristine, kSpeedSentinel);
    ok &= check(speed_offsets.size() == 2, "speed sentinels located");
    for (size_t off : speed_offsets) {
        ok &= check(test_utils::float_at(mesh, off) == 2.0f, "speed written in place");
    }
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_five_grids_at_20fps();
    ok &= test_native_frame_rate();
    ok &= test_single_and_full();
    ok &= test_apply_grid_timing();
    return ok ? 0 : 1;
}
