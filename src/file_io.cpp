//
//  file_io.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "file_io.hpp"

#include <fstream>

#include "logging.hpp"

namespace webpforge {

bool read_file(const std::string &path, std::vector<uint8_t> &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        WF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    f.seekg(0, std::ios::end);
    const std::streamoff len = f.tellg();
    if (len < 0) {
        WF_LOG("error", "cannot determine size of " << path);
        return false;
    }
    f.seekg(0, std::ios::beg);
    out.resize(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(len));
    if (f.gcount() != len) {
        WF_LOG("error", "short read for " << path << " (" << f.gcount() << " of " << len
                                          << " bytes)");
        return false;
    }
    return true;
}

}  // namespace webpforge
