// Unit coverage for token substitution and sentinel float patching.
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "byte_patcher.hpp"
#include "test_utils.hpp"

using namespace autovideo;
using test_utils::append_filler;
using test_utils::append_text;
using test_utils::as_string;
using test_utils::write_f32_le;

namespace {

bool check(bool cond, const std::string &msg) {
    return test_utils::check(cond, msg, "byte_patcher_unit");
}

std::vector<uint8_t> bytes(const std::string &s) { return std::vector<uint8_t>(s.begin(), s.end()); }

bool test_locate_and_count() {
    bool ok = true;
    auto b = bytes("..AUTOVIDENT..AUTOVIDENT");
    ok &= check(locate_token(b, "AUTOVIDENT") == 2, "first match offset");
    ok &= check(locate_token(b, "AUTOVIDENT", 3) == 14, "match after offset");
    ok &= check(locate_token(b, "AUTOVIDENT", 15) == kTokenNotFound, "no match past last");
    ok &= check(locate_token(b, "") == kTokenNotFound, "empty pattern matches nothing");
    ok &= check(count_tokens(b, "AUTOVIDENT") == 2, "count two");
    ok &= check(count_tokens(bytes("aaaa"), "aa") == 2, "count is non-overlapping");
    ok &= check(count_tokens(bytes("aaa"), "aa") == 1, "overlap not double counted");
    ok &= check(count_tokens({}, "AUTOVIDENT") == 0, "empty buffer");
    return ok;
}

bool test_replace_all() {
    bool ok = true;
    std::vector<uint8_t> b;
    append_filler(b, 3);
    append_text(b, "AUTOCIDENT");
    append_text(b, "AUTOCIDENT");
    append_filler(b, 5);
    append_text(b, "AUTOCIDENT");
    const size_t size_before = b.size();

    size_t replaced = 0;
    ok &= check(replace_all_tokens(b, "AUTOCIDENT", "Mine", &replaced), "replace_all succeeds");
    ok &= check(replaced == 3, "all three replaced");
    ok &= check(b.size() == size_before, "length unchanged");
    ok &= check(count_tokens(b, "AUTOCIDENT") == 0, "pattern gone");
    ok &= check(count_tokens(b, "XXXXXXMine") == 3, "padded replacement present");

    // Non-overlapping resume: "aaa" with "aa" -> only the first pair is replaced.
    auto ov = bytes("aaa");
    ok &= check(replace_all_tokens(ov, "aa", "b") && as_string(ov) == "Xba",
                "search resumes after the consumed match");

    auto none = bytes("no tokens here");
    ok &= check(replace_all_tokens(none, "AUTOCIDENT", "Mine", &replaced) && replaced == 0,
                "absence is not an error");
    ok &= check(as_string(none) == "no tokens here", "buffer untouched without match");

    auto too_long = bytes("AUTOCIDENT");
    ok &= check(!replace_all_tokens(too_long, "AUTOCIDENT", "ElevenChars"),
                "replacement wider than token rejected");
    ok &= check(as_string(too_long) == "AUTOCIDENT", "rejected replacement leaves buffer alone");
    return ok;
}

bool test_replace_first() {
    bool ok = true;
    auto b = bytes("AUTOVIDENT|AUTOVIDENT");
    size_t replaced = 0;
    ok &= check(replace_first_token(b, "AUTOVIDENT", "Clip1", &replaced) && replaced == 1,
                "first replaced");
    ok &= check(as_string(b) == "XXXXXClip1|AUTOVIDENT", "only the first occurrence");

    auto single = bytes("--ZAUTONIDEN--");
    ok &= check(replace_first_token(single, "ZAUTONIDEN", "Clip1     "), "spaced video");
    ok &= check(count_tokens(single, "ZAUTONIDEN") == 0, "pattern absent after one replace");
    const auto snapshot = single;
    ok &= check(replace_first_token(single, "ZAUTONIDEN", "Clip2     ", &replaced) &&
                    replaced == 0 && single == snapshot,
                "second replace_first is a no-op");

    auto sound = bytes("AUTOIDENTSOUND");
    ok &= check(replace_first_token(sound, "AUTOIDENTSOUND", "VotWIntro") &&
                    as_string(sound) == "XXXXXVotWIntro",
                "variable-width audio token padded to 14");
    return ok;
}

bool test_float_helpers() {
    bool ok = true;
    const auto b = float_to_le_bytes(1.0f);
    ok &= check(b[0] == 0x00 && b[1] == 0x00 && b[2] == 0x80 && b[3] == 0x3F,
                "1.0f little-endian bytes");
    ok &= check(le_bytes_to_float(b.data()) == 1.0f, "decode 1.0f");
    const auto speed = float_to_le_bytes(1313.0f);
    ok &= check(le_bytes_to_float(speed.data()) == 1313.0f, "1313.0f survives the round trip");
    return ok;
}

bool test_patch_sentinel_float() {
    bool ok = true;
    const float target = 121203.0f;
    std::vector<uint8_t> b;
    append_filler(b, 1);
    write_f32_le(b, target);  // offset 1, unaligned
    append_filler(b, 4);
    write_f32_le(b, target);  // offset 9
    // Near miss: one ulp above the target.
    uint32_t bits = 0;
    std::memcpy(&bits, &target, 4);
    bits += 1;
    float near = 0.0f;
    std::memcpy(&near, &bits, 4);
    const size_t near_offset = b.size();
    write_f32_le(b, near);
    const size_t tail_offset = b.size();
    write_f32_le(b, target);  // last complete window of the buffer

    const size_t size_before = b.size();
    const size_t n = patch_sentinel_float(b, target, 12.8f);
    ok &= check(n == 3, "three exact sites patched");
    ok &= check(b.size() == size_before, "length unchanged");
    ok &= check(test_utils::float_at(b, 1) == 12.8f, "unaligned site rewritten");
    ok &= check(test_utils::float_at(b, 9) == 12.8f, "second site rewritten");
    ok &= check(test_utils::float_at(b, tail_offset) == 12.8f, "final window rewritten");
    ok &= check(test_utils::float_at(b, near_offset) == near, "near miss untouched");

    std::vector<uint8_t> tiny = {0x00, 0x01, 0x02};
    ok &= check(patch_sentinel_float(tiny, target, 1.0f) == 0, "short buffer ignored");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_locate_and_count();
    ok &= test_replace_all();
    ok &= test_replace_first();
    ok &= test_float_helpers();
    ok &= test_patch_sentinel_float();
    return ok ? 0 : 1;
}
