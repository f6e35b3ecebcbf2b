//
//  byte_patcher.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "byte_patcher.hpp"

#include <algorithm>
#include <utility>

#include "identifier_codec.hpp"
#include "logging.hpp"

namespace autovideo {

namespace {

// Pad the replacement to the token width; empty when it cannot fit.
bool fit_replacement(const std::string &pattern, const std::string &replacement,
                     std::string &out) {
    auto padded = pad_identifier(replacement, kTokenFill, pattern.size(), true);
    if (!padded) {
        AV_LOG("error", "replacement '" << replacement << "' does not fit token " << pattern
                                        << " (" << pattern.size() << " bytes)");
        return false;
    }
    out = std::move(*padded);
    return true;
}

void overwrite(std::vector<uint8_t> &buffer, size_t pos, const std::string &bytes) {
    std::copy(bytes.begin(), bytes.end(), buffer.begin() + static_cast<std::ptrdiff_t>(pos));
}

}  // namespace

size_t locate_token(const std::vector<uint8_t> &buffer, const std::string &pattern,
                    size_t from) {
    if (pattern.empty() || from >= buffer.size() || buffer.size() - from < pattern.size()) {
        return kTokenNotFound;
    }
    auto it = std::search(buffer.begin() + static_cast<std::ptrdiff_t>(from), buffer.end(),
                          pattern.begin(), pattern.end(),
                          [](uint8_t b, char c) { return b == static_cast<uint8_t>(c); });
    if (it == buffer.end()) {
        return kTokenNotFound;
    }
    return static_cast<size_t>(it - buffer.begin());
}

size_t count_tokens(const std::vector<uint8_t> &buffer, const std::string &pattern) {
    size_t count = 0;
    size_t pos = locate_token(buffer, pattern, 0);
    while (pos != kTokenNotFound) {
        ++count;
        pos = locate_token(buffer, pattern, pos + pattern.size());
    }
    return count;
}

bool replace_all_tokens(std::vector<uint8_t> &buffer, const std::string &pattern,
                        const std::string &replacement, size_t *replaced) {
    std::string fitted;
    if (!fit_replacement(pattern, replacement, fitted)) {
        return false;
    }
    size_t count = 0;
    size_t pos = locate_token(buffer, pattern, 0);
    while (pos != kTokenNotFound) {
        overwrite(buffer, pos, fitted);
        ++count;
        // Resume after the consumed match, never inside it.
        pos = locate_token(buffer, pattern, pos + pattern.size());
    }
    AV_LOG("patch", "replace_all " << pattern << " -> '" << fitted << "' x" << count);
    if (replaced) {
        *replaced = count;
    }
    return true;
}

bool replace_first_token(std::vector<uint8_t> &buffer, const std::string &pattern,
                         const std::string &replacement, size_t *replaced) {
    std::string fitted;
    if (!fit_replacement(pattern, replacement, fitted)) {
        return false;
    }
    const size_t pos = locate_token(buffer, pattern, 0);
    if (pos != kTokenNotFound) {
        overwrite(buffer, pos, fitted);
        AV_LOG("patch", "replace_first " << pattern << " @0x" << std::hex << pos << std::dec
                                         << " -> " << hex_window(buffer, pos, pattern.size()));
    }
    if (replaced) {
        *replaced = (pos != kTokenNotFound) ? 1 : 0;
    }
    return true;
}

size_t patch_sentinel_float(std::vector<uint8_t> &buffer, float target, float replacement) {
    if (buffer.size() < 4) {
        return 0;
    }
    const auto needle = float_to_le_bytes(target);
    const auto value = float_to_le_bytes(replacement);
    size_t patched = 0;
    // Byte-by-byte: template layouts give no alignment guarantee.
    for (size_t i = 0; i + 4 <= buffer.size(); ++i) {
        if (buffer[i] == needle[0] && buffer[i + 1] == needle[1] && buffer[i + 2] == needle[2] &&
            buffer[i + 3] == needle[3]) {
            std::copy(value.begin(), value.end(),
                      buffer.begin() + static_cast<std::ptrdiff_t>(i));
            ++patched;
        }
    }
    return patched;
}

}  // namespace autovideo
