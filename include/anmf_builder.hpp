//
//  anmf_builder.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <memory>
#include <vector>

#include "frame_ledger.hpp"
#include "riff_chunks.hpp"

// ANMF flag bits.
inline constexpr uint8_t kAnmfFlagNoBlend = 0x02;
inline constexpr uint8_t kAnmfFlagDispose = 0x01;

// Size of the fixed ANMF fields ahead of the frame's image chunks.
inline constexpr uint64_t kAnmfPrefixSize = 16;

uint8_t anmf_flags(webpforge::DisposalMethod disposal, webpforge::BlendMethod blend);

// The 16-byte frame header: offsets, size, duration, flags.
std::vector<uint8_t> encode_anmf_prefix(const webpforge::FrameRect &placement,
                                        uint32_t duration_ms, uint8_t flags);

// ANMF chunk for one frame. The ALPH and VP8/VP8L children borrow from `frame.payload`,
// which must stay alive until the chunk was written.
std::unique_ptr<Chunk> build_anmf(const webpforge::FrameRecord &frame);
