//
//  asset_writer.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

#include "build_status.hpp"

namespace autovideo {

// Read a whole file. Fails with ErrorKind::Io.
BuildStatus read_file_bytes(const std::filesystem::path &path, std::vector<uint8_t> &out);

// Create `dir` and its parents.
BuildStatus ensure_directory(const std::filesystem::path &dir);

// Write `data` to a sibling temporary file, then rename it over `path`. Parent directories
// are created as needed. A failed write never leaves a truncated `path` behind.
BuildStatus write_file_atomic(const std::filesystem::path &path, const std::vector<uint8_t> &data);

// Copy a file (used for texture atlases produced outside the tool).
BuildStatus copy_file_replacing(const std::filesystem::path &from, const std::filesystem::path &to);

}  // namespace autovideo
