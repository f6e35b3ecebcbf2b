//
//  identifier_codec.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace autovideo {

// Width of every identifier field reserved in the templates.
inline constexpr size_t kIdentifierLength = 10;

// Fill used when the padded name is embedded as an opaque token.
inline constexpr char kTokenFill = 'X';
// Fill used when the padded name renders as in-game display text.
inline constexpr char kDisplayFill = ' ';

/**
 * @brief Pad `name` with `fill` up to `target_length`.
 *
 * Inserts at the front when `pad_leading` is set, appends otherwise. Returns an empty
 * optional when `name` is already longer than `target_length`.
 */
std::optional<std::string> pad_identifier(const std::string &name, char fill,
                                          size_t target_length, bool pad_leading);

// The three fixed-width renderings of a mod name.
struct ModIdentifiers {
    std::string name;             ///< As given by the user
    std::string slug;             ///< 'X'-padded left, used in paths and tokens
    std::string leading_spaced;   ///< ' '-padded left
    std::string trailing_spaced;  ///< ' '-padded right
};

// The two fixed-width renderings of a video name.
struct VideoIdentifiers {
    std::string name;
    std::string slug;             ///< 'X'-padded left
    std::string trailing_spaced;  ///< ' '-padded right
};

std::optional<ModIdentifiers> make_mod_identifiers(const std::string &mod_name);
std::optional<VideoIdentifiers> make_video_identifiers(const std::string &video_name);

}  // namespace autovideo
