//
//  anim_builder.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//

#include "anim_builder.hpp"

std::unique_ptr<Chunk> build_anim(const std::array<uint8_t, 4> &background_bgra,
                                  uint16_t loop_count) {
    auto anim = Chunk::create(kTagAnim);
    auto &p = anim->payload;

    // Background color is stored in byte order blue, green, red, alpha.
    p.insert(p.end(), background_bgra.begin(), background_bgra.end());
    write_u16le(p, loop_count);  // 0 = infinite

    return anim;
}
