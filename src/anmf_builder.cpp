//
//  anmf_builder.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "anmf_builder.hpp"

#include <algorithm>

#include "animation_types.hpp"
#include "logging.hpp"

using webpforge::BlendMethod;
using webpforge::CodecKind;
using webpforge::DisposalMethod;
using webpforge::kMaxFrameDuration;

uint8_t anmf_flags(DisposalMethod disposal, BlendMethod blend) {
    uint8_t flags = 0;  // upper six bits reserved
    if (blend == BlendMethod::NoBlend) {
        flags |= kAnmfFlagNoBlend;
    }
    if (disposal == DisposalMethod::ClearToBackground) {
        flags |= kAnmfFlagDispose;
    }
    return flags;
}

std::vector<uint8_t> encode_anmf_prefix(const webpforge::FrameRect &placement,
                                        uint32_t duration_ms, uint8_t flags) {
    std::vector<uint8_t> p;
    p.reserve(kAnmfPrefixSize);

    write_u24le(p, placement.x / 2);
    write_u24le(p, placement.y / 2);
    write_u24le(p, placement.width - 1);
    write_u24le(p, placement.height - 1);
    write_u24le(p, std::min(duration_ms, kMaxFrameDuration));
    write_u8(p, flags);

    return p;
}

std::unique_ptr<Chunk> build_anmf(const webpforge::FrameRecord &frame) {
    if (frame.duration_ms > kMaxFrameDuration) {
        WF_LOG("warn", "frame duration " << frame.duration_ms << " ms clamped to "
                                         << kMaxFrameDuration << " ms");
    }

    auto anmf = Chunk::create(kTagAnmf);
    anmf->payload =
        encode_anmf_prefix(frame.placement, frame.duration_ms, anmf_flags(frame.disposal, frame.blend));

    const auto &info = frame.info;
    const uint8_t *base = frame.payload.data();
    if (info.has_alpha && info.alpha) {
        anmf->add(Chunk::create_view(kTagAlph, base + info.alpha->offset, info.alpha->size));
    }
    const uint32_t tag = info.codec == CodecKind::Lossless ? kTagVp8l : kTagVp8;
    anmf->add(Chunk::create_view(tag, base + info.bitstream.offset, info.bitstream.size));

    return anmf;
}
