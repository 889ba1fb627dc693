//
//  vp8x_builder.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//

#include "vp8x_builder.hpp"

uint8_t vp8x_flags(const Vp8xFeatures &features) {
    uint8_t flags = kVp8xFlagAnimation;
    if (features.icc) {
        flags |= kVp8xFlagIcc;
    }
    if (features.alpha) {
        flags |= kVp8xFlagAlpha;
    }
    if (features.exif) {
        flags |= kVp8xFlagExif;
    }
    if (features.xmp) {
        flags |= kVp8xFlagXmp;
    }
    return flags;
}

std::unique_ptr<Chunk> build_vp8x(uint8_t flags, uint32_t canvas_width, uint32_t canvas_height) {
    auto vp8x = Chunk::create(kTagVp8x);
    std::vector<uint8_t> &p = vp8x->payload;
    p.reserve(10);

    write_u8(p, flags);
    write_u24le(p, 0);  // reserved

    // canvas size, minus one
    write_u24le(p, canvas_width - 1);
    write_u24le(p, canvas_height - 1);

    return vp8x;
}
