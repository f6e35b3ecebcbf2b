// Unit coverage for identifier padding and the mod/video renderings.
#include <string>

#include "identifier_codec.hpp"
#include "test_utils.hpp"

using autovideo::pad_identifier;

namespace {

bool check(bool cond, const std::string &msg) {
    return test_utils::check(cond, msg, "identifier_codec_unit");
}

bool test_pad_lengths() {
    bool ok = true;
    for (size_t len = 0; len <= 10; ++len) {
        const std::string name(len, 'a');
        for (bool leading : {true, false}) {
            auto padded = pad_identifier(name, 'X', 10, leading);
            ok &= check(padded.has_value(), "pad succeeds for length " + std::to_string(len));
            if (!padded) {
                continue;
            }
            ok &= check(padded->size() == 10, "padded length is 10");
            const std::string stripped =
                leading ? padded->substr(10 - len) : padded->substr(0, len);
            const std::string fill =
                leading ? padded->substr(0, 10 - len) : padded->substr(len);
            ok &= check(stripped == name, "stripping the fill recovers the name");
            ok &= check(fill == std::string(10 - len, 'X'), "fill is on the requested side");
        }
    }
    ok &= check(!pad_identifier("VideoMod123", 'X', 10, true), "11 characters rejected");
    ok &= check(!pad_identifier("abc", ' ', 2, false), "longer than target rejected");
    return ok;
}

bool test_pad_examples() {
    bool ok = true;
    ok &= check(*pad_identifier("Clip1", 'X', 10, true) == "XXXXXClip1", "X leading");
    ok &= check(*pad_identifier("Clip1", ' ', 10, true) == "     Clip1", "space leading");
    ok &= check(*pad_identifier("Clip1", ' ', 10, false) == "Clip1     ", "space trailing");
    ok &= check(*pad_identifier("Sound", 'X', 14, true) == "XXXXXXXXXSound", "audio token width");
    ok &= check(*pad_identifier("", 'X', 3, true) == "XXX", "empty name is all fill");
    return ok;
}

bool test_mod_and_video_identifiers() {
    bool ok = true;
    auto mod = autovideo::make_mod_identifiers("VideoMod12");
    ok &= check(mod.has_value(), "10-character mod name accepted");
    if (mod) {
        ok &= check(mod->slug == "VideoMod12" && mod->leading_spaced == "VideoMod12" &&
                        mod->trailing_spaced == "VideoMod12",
                    "full-width name needs no padding");
    }
    ok &= check(!autovideo::make_mod_identifiers("VideoMod123"), "11-character mod rejected");

    auto small = autovideo::make_mod_identifiers("Mine");
    ok &= check(small && small->slug == "XXXXXXMine" && small->leading_spaced == "      Mine" &&
                    small->trailing_spaced == "Mine      ",
                "short mod renderings");

    auto video = autovideo::make_video_identifiers("Intro");
    ok &= check(video && video->slug == "XXXXXIntro" && video->trailing_spaced == "Intro     ",
                "video renderings");
    ok &= check(!autovideo::make_video_identifiers("ElevenChars"), "long video name rejected");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_pad_lengths();
    ok &= test_pad_examples();
    ok &= test_mod_and_video_identifiers();
    return ok ? 0 : 1;
}
