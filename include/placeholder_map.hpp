//
//  placeholder_map.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "identifier_codec.hpp"

namespace autovideo {

// What a placeholder token is replaced with.
enum class TokenValue {
    ModSlug,
    ModLeadingSpaced,
    ModTrailingSpaced,
    VideoSlug,
    VideoTrailingSpaced,
    AudioName,
};

enum class ReplaceScope { All, First };

struct PlaceholderRule {
    const char *token;
    TokenValue value;
    ReplaceScope scope;
};

// Values available while patching one video into a buffer.
struct PlaceholderValues {
    const ModIdentifiers *mod = nullptr;
    const VideoIdentifiers *video = nullptr;
    std::string audio_name;

    std::string resolve(TokenValue v) const;
};

// Rules for plugin buffers, applied once per video in this order.
const std::vector<PlaceholderRule> &plugin_placeholder_rules();

// Rules for mesh buffers.
const std::vector<PlaceholderRule> &mesh_placeholder_rules();

// Token literals that mean different things in plugin and mesh templates
// (AUTOCIDENT: mod slug vs. video slug, AUTOMIDENT: spaced mod vs. mod slug).
std::vector<std::string> reused_literals();

const char *token_value_name(TokenValue v);

// Apply `rules` in order. Returns false on the first replacement that does not fit its token.
bool apply_placeholders(std::vector<uint8_t> &buffer, const std::vector<PlaceholderRule> &rules,
                        const PlaceholderValues &values);

}  // namespace autovideo
