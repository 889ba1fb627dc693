//
//  file_io.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace webpforge {

// Read a whole file. Logs and returns false when it cannot be opened or read completely.
bool read_file(const std::string &path, std::vector<uint8_t> &out);

}  // namespace webpforge
