//
//  placeholder_map.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "placeholder_map.hpp"

#include <algorithm>

#include "byte_patcher.hpp"
#include "logging.hpp"

namespace autovideo {

std::string PlaceholderValues::resolve(TokenValue v) const {
    switch (v) {
        case TokenValue::ModSlug:
            return mod ? mod->slug : std::string();
        case TokenValue::ModLeadingSpaced:
            return mod ? mod->leading_spaced : std::string();
        case TokenValue::ModTrailingSpaced:
            return mod ? mod->trailing_spaced : std::string();
        case TokenValue::VideoSlug:
            return video ? video->slug : std::string();
        case TokenValue::VideoTrailingSpaced:
            return video ? video->trailing_spaced : std::string();
        case TokenValue::AudioName:
            return audio_name;
    }
    return {};
}

const std::vector<PlaceholderRule> &plugin_placeholder_rules() {
    static const std::vector<PlaceholderRule> rules = {
        {"AUTOCIDENT", TokenValue::ModSlug, ReplaceScope::All},
        {"AUTOVIDENT", TokenValue::VideoSlug, ReplaceScope::First},
        {"AUTOSIDENT", TokenValue::VideoSlug, ReplaceScope::First},
        {"AUTOPIDENT", TokenValue::VideoSlug, ReplaceScope::First},
        {"AUTOTIDENT", TokenValue::ModTrailingSpaced, ReplaceScope::All},
        {"AUTOMIDENT", TokenValue::ModLeadingSpaced, ReplaceScope::All},
        {"ZAUTONIDEN", TokenValue::VideoTrailingSpaced, ReplaceScope::First},
        {"AUTOIDENTSOUND", TokenValue::AudioName, ReplaceScope::First},
    };
    return rules;
}

const std::vector<PlaceholderRule> &mesh_placeholder_rules() {
    static const std::vector<PlaceholderRule> rules = {
        {"AUTOCIDENT", TokenValue::VideoSlug, ReplaceScope::All},
        {"AUTOMIDENT", TokenValue::ModSlug, ReplaceScope::All},
    };
    return rules;
}

std::vector<std::string> reused_literals() {
    std::vector<std::string> out;
    for (const auto &p : plugin_placeholder_rules()) {
        for (const auto &m : mesh_placeholder_rules()) {
            if (std::string(p.token) == m.token && p.value != m.value &&
                std::find(out.begin(), out.end(), p.token) == out.end()) {
                out.emplace_back(p.token);
            }
        }
    }
    return out;
}

const char *token_value_name(TokenValue v) {
    switch (v) {
        case TokenValue::ModSlug:
            return "mod-slug";
        case TokenValue::ModLeadingSpaced:
            return "mod-leading-spaced";
        case TokenValue::ModTrailingSpaced:
            return "mod-trailing-spaced";
        case TokenValue::VideoSlug:
            return "video-slug";
        case TokenValue::VideoTrailingSpaced:
            return "video-trailing-spaced";
        case TokenValue::AudioName:
            return "audio-name";
    }
    return "unknown";
}

bool apply_placeholders(std::vector<uint8_t> &buffer, const std::vector<PlaceholderRule> &rules,
                        const PlaceholderValues &values) {
    for (const auto &rule : rules) {
        const std::string replacement = values.resolve(rule.value);
        const bool ok = rule.scope == ReplaceScope::All
                            ? replace_all_tokens(buffer, rule.token, replacement)
                            : replace_first_token(buffer, rule.token, replacement);
        if (!ok) {
            AV_LOG("error", "placeholder " << rule.token << " (" << token_value_name(rule.value)
                                           << ") rejected value '" << replacement << "'");
            return false;
        }
    }
    return true;
}

}  // namespace autovideo
