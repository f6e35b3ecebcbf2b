//
//  autovideo_config.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "autovideo_config.hpp"

#include <cerrno>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

using json = nlohmann::json;

namespace autovideo {

namespace {

BuildStatus apply_json(const json &j, AutoVideoConfig &config, const std::string &origin) {
    if (!j.is_object()) {
        return make_error(ErrorKind::Validation, origin + ": top level must be an object");
    }
    static const char *const kKnown[] = {"frame_rate",  "frame_size", "keep_aspect_ratio",
                                         "short_names", "high_quality", "assets_dir",
                                         "output_dir",  "log_level",  "script"};
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool known = false;
        for (const char *k : kKnown) {
            known |= it.key() == k;
        }
        if (!known) {
            AV_LOG("warn", origin << ": ignoring unknown key '" << it.key() << "'");
        }
    }
    try {
        config.frame_rate = j.value("frame_rate", config.frame_rate);
        config.frame_size = j.value("frame_size", config.frame_size);
        config.keep_aspect_ratio = j.value("keep_aspect_ratio", config.keep_aspect_ratio);
        config.short_names = j.value("short_names", config.short_names);
        config.high_quality = j.value("high_quality", config.high_quality);
        config.assets_dir = j.value("assets_dir", config.assets_dir);
        config.output_dir = j.value("output_dir", config.output_dir);
        if (j.contains("log_level")) {
            config.log_level = parse_log_verbosity(j["log_level"].get<std::string>());
        }
        if (j.contains("script")) {
            const auto &s = j["script"];
            if (!s.is_object()) {
                return make_error(ErrorKind::Validation, origin + ": 'script' must be an object");
            }
            ScriptInfo info = config.script.value_or(ScriptInfo{});
            info.esp_name = s.value("esp_name", info.esp_name);
            info.tv_record = s.value("tv_record", info.tv_record);
            info.pr_record = s.value("pr_record", info.pr_record);
            info.di_esp_name = s.value("di_esp_name", info.di_esp_name);
            config.script = info;
        }
    } catch (const json::exception &e) {
        return make_error(ErrorKind::Validation, origin + ": " + e.what());
    }
    AV_LOG("debug", origin << ": fps=" << config.frame_rate << " size=" << config.frame_size
                           << " output=" << config.output_dir);
    return make_ok();
}

}  // namespace

BuildStatus load_config_json(const std::string &text, AutoVideoConfig &config) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return make_error(ErrorKind::Validation, "config is not valid JSON");
    }
    return apply_json(j, config, "config");
}

BuildStatus load_config_file(const std::string &path, AutoVideoConfig &config) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::string msg = "open failed for " + path + " (" +
                          std::generic_category().message(errno) + ")";
        AV_LOG("error", msg);
        return make_error(ErrorKind::Io, msg);
    }
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        return make_error(ErrorKind::Validation, path + " is not valid JSON");
    }
    return apply_json(j, config, path);
}

}  // namespace autovideo
