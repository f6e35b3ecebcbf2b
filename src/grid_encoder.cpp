//
//  grid_encoder.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "grid_encoder.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

#include "asset_writer.hpp"
#include "grid_timing.hpp"
#include "logging.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace autovideo {

namespace {

GridEncodeResult fail(std::string msg) {
    AV_LOG("error", msg);
    GridEncodeResult r;
    r.status = make_error(ErrorKind::Encoder, std::move(msg));
    return r;
}

}  // namespace

GridEncodeResult ManifestGridEncoder::encode(const GridEncodeRequest &request) {
    fs::path manifest_path = request.video_path;
    manifest_path += kGridManifestSuffix;
    std::ifstream f(manifest_path);
    if (!f.is_open()) {
        return fail("no grid manifest for " + request.video_path.string() + " (expected " +
                    manifest_path.string() + ")");
    }
    json j;
    try {
        f >> j;
    } catch (const json::exception &e) {
        return fail("cannot parse " + manifest_path.string() + ": " + e.what());
    }

    GridEncodeResult r;
    try {
        r.grid_amount = j.at("grid_amount").get<uint32_t>();
        r.last_stop_time = j.at("last_stop_time").get<float>();
        r.audio_name = j.at("audio_name").get<std::string>();
    } catch (const json::exception &e) {
        return fail("incomplete grid manifest " + manifest_path.string() + ": " + e.what());
    }
    if (r.grid_amount < 1 || r.grid_amount > kGridSlots) {
        return fail("grid manifest " + manifest_path.string() + " reports " +
                    std::to_string(r.grid_amount) + " grids; expected 1.." +
                    std::to_string(kGridSlots));
    }
    if (!(r.last_stop_time >= 0.0f)) {
        return fail("grid manifest " + manifest_path.string() + " has a negative stop time");
    }

    const fs::path base = manifest_path.parent_path();
    if (j.contains("textures") && j["textures"].is_array()) {
        for (const auto &t : j["textures"]) {
            if (!t.is_string()) {
                return fail("grid manifest " + manifest_path.string() +
                            ": textures entries must be strings");
            }
            const fs::path src = base / t.get<std::string>();
            auto st = copy_file_replacing(src, request.texture_dir / src.filename());
            if (!st.ok) {
                r.status = st;
                return r;
            }
            AV_LOG("debug", "atlas " << src.filename().string() << " -> "
                                     << request.texture_dir.string());
        }
    }
    AV_LOG("info", "encoded " << request.video_path.filename().string()
                              << ": grids=" << r.grid_amount << " stop=" << r.last_stop_time
                              << "s audio=" << r.audio_name);
    r.status = make_ok();
    return r;
}

}  // namespace autovideo
