//
//  build_status.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace autovideo {

/// Failure categories surfaced to the caller.
enum class ErrorKind {
    None,        ///< success
    Validation,  ///< bad names, frame size, template paths
    Declined,    ///< a confirmation was answered with no
    Io,          ///< filesystem failure (path + OS error in message)
    Encoder,     ///< the frame grid encoder failed or returned nonsense
};

/**
 * @brief Result object with success flag, failure kind and optional error message.
 *
 * When `ok == true`, `message` is empty and `kind` is ErrorKind::None.
 */
struct BuildStatus {
    bool ok{false};
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

inline BuildStatus make_ok() { return BuildStatus{true, ErrorKind::None, {}}; }

inline BuildStatus make_error(ErrorKind kind, std::string msg) {
    return BuildStatus{false, kind, std::move(msg)};
}

const char *error_kind_name(ErrorKind kind);

}  // namespace autovideo
