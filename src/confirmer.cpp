//
//  confirmer.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "confirmer.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

#include "logging.hpp"

namespace autovideo {

namespace {

std::string trim_lower(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    for (auto &c : s) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

}  // namespace

bool InteractiveConfirmer::confirm(const std::string &prompt) {
    out_ << prompt << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        AV_LOG("warn", "no answer on input; treating as no");
        return false;
    }
    return trim_lower(line) == "y";
}

bool FixedConfirmer::confirm(const std::string &prompt) {
    if (echo_) {
        *echo_ << prompt << (answer_ ? "Y" : "N") << "\n";
    }
    return answer_;
}

bool RefusingConfirmer::confirm(const std::string &prompt) {
    AV_LOG("debug", "refusing confirmation: " << prompt);
    return false;
}

const char *RefusingConfirmer::refusal_hint() const {
    return "you can surpass this limit by generating an xEdit script";
}

}  // namespace autovideo
