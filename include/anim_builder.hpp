//
//  anim_builder.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//

#pragma once
#include <array>
#include <cstdint>
#include <memory>

#include "riff_chunks.hpp"

std::unique_ptr<Chunk> build_anim(const std::array<uint8_t, 4> &background_bgra,
                                  uint16_t loop_count);
