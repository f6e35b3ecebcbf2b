//
//  logging.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace autovideo {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Map a textual level ("error", "warn", "info", "debug") to a verbosity; unknown -> Error.
LogVerbosity parse_log_verbosity(const std::string &s);

// Hex-preview helper used in debug logs to dump a short window of a template buffer.
inline constexpr size_t kHexPreviewBytes = 16;
inline std::string hex_window(const std::vector<uint8_t> &data, size_t offset,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    if (offset >= data.size()) {
        return oss.str();
    }
    const size_t limit = std::min(max_len, data.size() - offset);
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[offset + i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

}  // namespace autovideo

inline constexpr autovideo::LogVerbosity av_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return autovideo::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return autovideo::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return autovideo::LogVerbosity::Info;
    }
    // Everything else (io/patch/template/etc.) treated as debug-level.
    return autovideo::LogVerbosity::Debug;
}

inline bool av_should_log(const char *level) {
    const auto current = autovideo::get_log_verbosity();
    const auto sev = av_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void av_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[AutoVideo][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[AutoVideo][" << level << "] " << msg << std::endl;
    }
}

#define AV_LOG(level, message)                                              \
    do {                                                                    \
        if (av_should_log(level)) {                                         \
            std::ostringstream _av_log_ss;                                  \
            _av_log_ss << message;                                          \
            av_log_impl(level, _av_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
