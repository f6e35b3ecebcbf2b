// Unit coverage for the plugin and mesh placeholder tables.
#include <string>
#include <vector>

#include "byte_patcher.hpp"
#include "identifier_codec.hpp"
#include "placeholder_map.hpp"
#include "test_utils.hpp"

using namespace autovideo;

namespace {

bool check(bool cond, const std::string &msg) {
    return test_utils::check(cond, msg, "placeholder_unit");
}

bool test_reused_literals() {
    const auto reused = reused_literals();
    bool ok = check(reused.size() == 2, "two literals are reused");
    ok &= check(reused == std::vector<std::string>({"AUTOCIDENT", "AUTOMIDENT"}),
                "AUTOCIDENT and AUTOMIDENT flagged");
    return ok;
}

bool test_plugin_rules() {
    bool ok = true;
    const auto mod = *make_mod_identifiers("Mine");
    const auto first = *make_video_identifiers("Intro");
    const auto second = *make_video_identifiers("Outro");
    auto plugin = test_utils::make_plugin_template(2);
    const size_t size_before = plugin.size();
    const size_t display_offset = locate_token(plugin, "ZAUTONIDEN");

    PlaceholderValues v1{&mod, &first, "SndIntro"};
    ok &= check(apply_placeholders(plugin, plugin_placeholder_rules(), v1), "first video patched");
    ok &= check(count_tokens(plugin, "AUTOCIDENT") == 0, "mod token replaced everywhere");
    ok &= check(count_tokens(plugin, "AUTOTIDENT") == 0 && count_tokens(plugin, "AUTOMIDENT") == 0,
                "mod display tokens replaced everywhere");
    ok &= check(count_tokens(plugin, "AUTOVIDENT") == 1, "one video slot left");
    ok &= check(count_tokens(plugin, "XXXXXIntro") == 3, "video slug in three first-only slots");
    ok &= check(test_utils::as_string(plugin).substr(display_offset, 10) == "Intro     ",
                "trailing-spaced display name");
    ok &= check(count_tokens(plugin, "ZAUTONIDEN") == 1, "display name replaced once");
    ok &= check(count_tokens(plugin, "XXXXXXSndIntro") == 1, "audio name padded to 14");
    ok &= check(count_tokens(plugin, "Mine      ") == 1, "trailing-spaced mod");
    ok &= check(count_tokens(plugin, "      Mine") == 2, "leading-spaced mod in both records");

    PlaceholderValues v2{&mod, &second, "SndOutro"};
    ok &= check(apply_placeholders(plugin, plugin_placeholder_rules(), v2), "second video patched");
    ok &= check(count_tokens(plugin, "AUTOVIDENT") == 0, "slots exhausted");
    ok &= check(count_tokens(plugin, "XXXXXOutro") == 3, "second video in second record");
    ok &= check(plugin.size() == size_before, "length unchanged");
    return ok;
}

bool test_mesh_rules() {
    bool ok = true;
    const auto mod = *make_mod_identifiers("Mine");
    const auto video = *make_video_identifiers("Intro");
    auto mesh = test_utils::make_mesh_template(8);
    PlaceholderValues v{&mod, &video, {}};
    ok &= check(apply_placeholders(mesh, mesh_placeholder_rules(), v), "mesh patched");
    const std::string text = test_utils::as_string(mesh);
    ok &= check(text.find("textures\\Videos\\XXXXXXMine\\XXXXXIntro_1.dds") != std::string::npos,
                "mesh texture path uses mod and video slugs");
    ok &= check(count_tokens(mesh, "XXXXXIntro") == 2, "video slug replaces AUTOCIDENT in meshes");
    return ok;
}

bool test_rejects_wide_audio_name() {
    const auto mod = *make_mod_identifiers("Mine");
    const auto video = *make_video_identifiers("Intro");
    auto plugin = test_utils::make_plugin_template(1);
    PlaceholderValues v{&mod, &video, "ThisNameIsTooLong"};
    return check(!apply_placeholders(plugin, plugin_placeholder_rules(), v),
                 "audio name wider than its token rejected");
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_reused_literals();
    ok &= test_plugin_rules();
    ok &= test_mesh_rules();
    ok &= test_rejects_wide_audio_name();
    return ok ? 0 : 1;
}
