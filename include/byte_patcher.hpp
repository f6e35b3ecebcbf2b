//
//  byte_patcher.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

// In-place patching of template buffers without parsing them.
//
// Two assumptions about the plugin and mesh templates live here and nowhere else:
//  * placeholder tokens occupy fixed-width fields, so a replacement is padded to the token
//    width and the buffer length never changes;
//  * sentinel floats are reserved magic values that never occur as real data, so every
//    bit-exact occurrence may be overwritten.

namespace autovideo {

inline constexpr size_t kTokenNotFound = static_cast<size_t>(-1);

// ------------- Little-endian float helpers ----------------------------------

inline std::array<uint8_t, 4> float_to_le_bytes(float f) {
    uint32_t v = 0;
    std::memcpy(&v, &f, sizeof(v));
    return {static_cast<uint8_t>(v & 0xFF), static_cast<uint8_t>((v >> 8) & 0xFF),
            static_cast<uint8_t>((v >> 16) & 0xFF), static_cast<uint8_t>((v >> 24) & 0xFF)};
}

inline float le_bytes_to_float(const uint8_t *p) {
    uint32_t v = (uint32_t(p[3]) << 24) | (uint32_t(p[2]) << 16) | (uint32_t(p[1]) << 8) |
                 (uint32_t(p[0]));
    float f = 0.0f;
    std::memcpy(&f, &v, sizeof(f));
    return f;
}

// ------------- Token substitution -------------------------------------------

// Offset of the first occurrence of `pattern` at or after `from`, or kTokenNotFound.
size_t locate_token(const std::vector<uint8_t> &buffer, const std::string &pattern,
                    size_t from = 0);

// Non-overlapping, left-to-right occurrence count.
size_t count_tokens(const std::vector<uint8_t> &buffer, const std::string &pattern);

// Overwrite every occurrence with `replacement` padded ('X', leading) to the token width.
// Returns false (buffer untouched) when the replacement is wider than the token.
bool replace_all_tokens(std::vector<uint8_t> &buffer, const std::string &pattern,
                        const std::string &replacement, size_t *replaced = nullptr);

// Same as replace_all_tokens, restricted to the first occurrence.
bool replace_first_token(std::vector<uint8_t> &buffer, const std::string &pattern,
                         const std::string &replacement, size_t *replaced = nullptr);

// ------------- Sentinel floats ----------------------------------------------

// Overwrite every bit-exact little-endian occurrence of `target` (any byte offset) with
// `replacement`. Returns the number of patched sites.
size_t patch_sentinel_float(std::vector<uint8_t> &buffer, float target, float replacement);

}  // namespace autovideo
