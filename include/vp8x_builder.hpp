//
//  vp8x_builder.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//

#pragma once
#include <cstdint>
#include <memory>

#include "riff_chunks.hpp"

// VP8X feature bits.
inline constexpr uint8_t kVp8xFlagIcc = 0x20;
inline constexpr uint8_t kVp8xFlagAlpha = 0x10;
inline constexpr uint8_t kVp8xFlagExif = 0x08;
inline constexpr uint8_t kVp8xFlagXmp = 0x04;
inline constexpr uint8_t kVp8xFlagAnimation = 0x02;

struct Vp8xFeatures {
    bool alpha = false;
    bool icc = false;
    bool exif = false;
    bool xmp = false;
};

// Animation is always signalled; the rest follow `features`.
uint8_t vp8x_flags(const Vp8xFeatures &features);

std::unique_ptr<Chunk> build_vp8x(uint8_t flags, uint32_t canvas_width, uint32_t canvas_height);
