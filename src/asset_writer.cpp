//
//  asset_writer.cpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "asset_writer.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

#include "logging.hpp"

namespace fs = std::filesystem;

namespace autovideo {

namespace {

BuildStatus io_error(const std::string &what, const fs::path &path, const std::error_code &ec) {
    std::string msg = what + " " + path.string() + ": " + ec.message();
    AV_LOG("error", msg);
    return make_error(ErrorKind::Io, msg);
}

std::error_code errno_code() { return std::error_code(errno, std::generic_category()); }

}  // namespace

BuildStatus read_file_bytes(const fs::path &path, std::vector<uint8_t> &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return io_error("open failed for", path, errno_code());
    }
    f.seekg(0, std::ios::end);
    const std::streamoff len = f.tellg();
    if (len < 0) {
        return io_error("cannot size", path, errno_code());
    }
    f.seekg(0, std::ios::beg);
    out.resize(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(len));
    if (f.gcount() != len) {
        return io_error("short read for", path, errno_code());
    }
    AV_LOG("io", "read " << out.size() << " bytes from " << path.string());
    return make_ok();
}

BuildStatus ensure_directory(const fs::path &dir) {
    if (dir.empty()) {
        return make_ok();
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return io_error("cannot create directory", dir, ec);
    }
    return make_ok();
}

BuildStatus write_file_atomic(const fs::path &path, const std::vector<uint8_t> &data) {
    auto st = ensure_directory(path.parent_path());
    if (!st.ok) {
        return st;
    }
    fs::path tmp = path;
    tmp += ".partial";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return io_error("cannot create", tmp, errno_code());
        }
        out.write(reinterpret_cast<const char *>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out.good()) {
            const auto ec = errno_code();
            out.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return io_error("write failed for", tmp, ec);
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return io_error("cannot rename into", path, ec);
    }
    AV_LOG("io", "wrote " << data.size() << " bytes to " << path.string());
    return make_ok();
}

BuildStatus copy_file_replacing(const fs::path &from, const fs::path &to) {
    auto st = ensure_directory(to.parent_path());
    if (!st.ok) {
        return st;
    }
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return io_error("cannot copy " + from.string() + " to", to, ec);
    }
    return make_ok();
}

}  // namespace autovideo
