//
//  build_status.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "build_status.hpp"

namespace autovideo {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::Declined:
            return "declined";
        case ErrorKind::Io:
            return "io";
        case ErrorKind::Encoder:
            return "encoder";
    }
    return "unknown";
}

}  // namespace autovideo
