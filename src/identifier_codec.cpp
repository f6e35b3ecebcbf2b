//
//  identifier_codec.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "identifier_codec.hpp"

#include "logging.hpp"

namespace autovideo {

std::optional<std::string> pad_identifier(const std::string &name, char fill,
                                          size_t target_length, bool pad_leading) {
    if (name.size() > target_length) {
        AV_LOG("debug", "pad_identifier: '" << name << "' exceeds " << target_length
                                            << " characters");
        return std::nullopt;
    }
    std::string out = name;
    const size_t missing = target_length - name.size();
    if (pad_leading) {
        out.insert(0, missing, fill);
    } else {
        out.append(missing, fill);
    }
    return out;
}

std::optional<ModIdentifiers> make_mod_identifiers(const std::string &mod_name) {
    auto slug = pad_identifier(mod_name, kTokenFill, kIdentifierLength, true);
    auto leading = pad_identifier(mod_name, kDisplayFill, kIdentifierLength, true);
    auto trailing = pad_identifier(mod_name, kDisplayFill, kIdentifierLength, false);
    if (!slug || !leading || !trailing) {
        return std::nullopt;
    }
    return ModIdentifiers{mod_name, *slug, *leading, *trailing};
}

std::optional<VideoIdentifiers> make_video_identifiers(const std::string &video_name) {
    auto slug = pad_identifier(video_name, kTokenFill, kIdentifierLength, true);
    auto trailing = pad_identifier(video_name, kDisplayFill, kIdentifierLength, false);
    if (!slug || !trailing) {
        return std::nullopt;
    }
    return VideoIdentifiers{video_name, *slug, *trailing};
}

}  // namespace autovideo
