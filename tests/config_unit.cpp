// Unit coverage for JSON configuration loading.
#include <filesystem>
#include <iostream>
#include <string>

#include "autovideo_config.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;
using namespace autovideo;

namespace {

bool check(bool cond, const std::string &msg) {
    return test_utils::check(cond, msg, "config_unit");
}

bool test_defaults_untouched() {
    AutoVideoConfig c;
    bool ok = check(load_config_json("{}", c).ok, "empty object accepted");
    ok &= check(c.frame_rate == 10 && c.frame_size == 512 && c.output_dir == "output",
                "defaults kept");
    ok &= check(!c.script.has_value(), "no script info by default");
    return ok;
}

bool test_overrides() {
    AutoVideoConfig c;
    const std::string text = R"({
        "frame_rate": 24,
        "frame_size": 256,
        "keep_aspect_ratio": true,
        "high_quality": true,
        "output_dir": "out",
        "log_level": "debug",
        "script": { "esp_name": "Mine.esp", "tv_record": "MyTV" },
        "unknown_key": 1
    })";
    bool ok = check(load_config_json(text, c).ok, "config parsed");
    ok &= check(c.frame_rate == 24 && c.frame_size == 256, "numbers applied");
    ok &= check(c.keep_aspect_ratio && c.high_quality && !c.short_names, "flags applied");
    ok &= check(c.output_dir == "out", "output dir applied");
    ok &= check(c.log_level == LogVerbosity::Debug, "log level applied");
    ok &= check(c.script && c.script->esp_name == "Mine.esp" && c.script->tv_record == "MyTV" &&
                    c.script->pr_record.empty(),
                "script info applied");
    return ok;
}

bool test_errors() {
    AutoVideoConfig c;
    bool ok = check(!load_config_json("{ not json", c).ok, "malformed JSON rejected");
    ok &= check(!load_config_json("[1, 2]", c).ok, "non-object rejected");
    auto st = load_config_json(R"({"frame_rate": "fast"})", c);
    ok &= check(!st.ok && st.kind == ErrorKind::Validation, "wrong type rejected");
    ok &= check(!load_config_json(R"({"script": 3})", c).ok, "script must be an object");
    return ok;
}

bool test_file(const fs::path &work) {
    fs::remove_all(work);
    const fs::path p = work / "autovideo.json";
    test_utils::write_file(p, R"({"frame_size": 128})");
    AutoVideoConfig c;
    bool ok = check(load_config_file(p.string(), c).ok && c.frame_size == 128, "file loaded");
    auto st = load_config_file((work / "missing.json").string(), c);
    ok &= check(!st.ok && st.kind == ErrorKind::Io, "missing file is an I/O error");
    return ok;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc != 2) {
        std::cerr << "usage: config_unit <WORK_DIR>\n";
        return 2;
    }
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_defaults_untouched();
    ok &= test_overrides();
    ok &= test_errors();
    ok &= test_file(argv[1]);
    return ok ? 0 : 1;
}
