//
//  fourcc_utils.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>

// FourCC helpers. Values are packed first-character-high so they read naturally in
// comparisons; RIFF stores the four characters in stream order regardless.
inline constexpr uint32_t fourcc(const char a, const char b, const char c, const char d) {
    return (uint32_t(uint8_t(a)) << 24) | (uint32_t(uint8_t(b)) << 16) |
           (uint32_t(uint8_t(c)) << 8) | (uint32_t(uint8_t(d)));
}

inline constexpr uint32_t fourcc(const char t[4]) { return fourcc(t[0], t[1], t[2], t[3]); }

// Read a tag as stored in a RIFF stream.
inline uint32_t read_fourcc(const uint8_t *p) {
    return fourcc(static_cast<char>(p[0]), static_cast<char>(p[1]), static_cast<char>(p[2]),
                  static_cast<char>(p[3]));
}

inline bool is_printable_fourcc(uint32_t type) {
    for (int i = 0; i < 4; ++i) {
        const uint8_t c = static_cast<uint8_t>(type >> (24 - 8 * i));
        if (c < 0x20 || c > 0x7E) {
            return false;
        }
    }
    return true;
}

inline std::string fourcc_to_string(uint32_t type) {
    std::string s(4, ' ');
    s[0] = static_cast<char>((type >> 24) & 0xFF);
    s[1] = static_cast<char>((type >> 16) & 0xFF);
    s[2] = static_cast<char>((type >> 8) & 0xFF);
    s[3] = static_cast<char>(type & 0xFF);
    return s;
}

// Tags used by the WebP container.
inline constexpr uint32_t kTagRiff = fourcc('R', 'I', 'F', 'F');
inline constexpr uint32_t kTagWebp = fourcc('W', 'E', 'B', 'P');
inline constexpr uint32_t kTagVp8x = fourcc('V', 'P', '8', 'X');
inline constexpr uint32_t kTagVp8 = fourcc('V', 'P', '8', ' ');
inline constexpr uint32_t kTagVp8l = fourcc('V', 'P', '8', 'L');
inline constexpr uint32_t kTagAlph = fourcc('A', 'L', 'P', 'H');
inline constexpr uint32_t kTagAnim = fourcc('A', 'N', 'I', 'M');
inline constexpr uint32_t kTagAnmf = fourcc('A', 'N', 'M', 'F');
inline constexpr uint32_t kTagIccp = fourcc('I', 'C', 'C', 'P');
inline constexpr uint32_t kTagExif = fourcc('E', 'X', 'I', 'F');
inline constexpr uint32_t kTagXmp = fourcc('X', 'M', 'P', ' ');
