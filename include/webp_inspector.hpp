//
//  webp_inspector.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "mux_status.hpp"

namespace webpforge {

/// Payload codec of a still WebP bitstream.
enum class CodecKind { Lossy, Lossless };

const char *codec_name(CodecKind codec);

/// Location of a chunk inside the inspected buffer.
struct ChunkSpan {
    size_t offset = 0;  ///< First payload byte (just after the 8-byte chunk header)
    uint32_t size = 0;  ///< Declared payload size, pad byte excluded

    bool operator==(const ChunkSpan &o) const { return offset == o.offset && size == o.size; }
};

/// What a still WebP bitstream carries, as far as muxing is concerned.
struct WebPInfo {
    CodecKind codec = CodecKind::Lossy;
    bool has_alpha = false;           ///< An ALPH chunk accompanies a lossy payload
    std::optional<ChunkSpan> alpha;   ///< ALPH chunk, set iff has_alpha
    ChunkSpan bitstream;              ///< VP8 or VP8L chunk
    uint32_t width = 0;               ///< From the codec header
    uint32_t height = 0;
    bool extended = false;            ///< Input carried a VP8X chunk
    bool lossless_alpha_hint = false; ///< VP8L header's alpha_is_used bit

    bool operator==(const WebPInfo &o) const {
        return codec == o.codec && has_alpha == o.has_alpha && alpha == o.alpha &&
               bitstream == o.bitstream && width == o.width && height == o.height &&
               extended == o.extended && lossless_alpha_hint == o.lossless_alpha_hint;
    }
};

struct InspectResult {
    MuxStatus status;
    WebPInfo info;
};

// Inspect a complete still WebP file (RIFF envelope + chunks). Spans are relative to `data`.
InspectResult inspect_webp(const std::vector<uint8_t> &data);

// Inspect the bare chunk sequence that normally follows the 12-byte envelope.
InspectResult inspect_webp_chunks(const std::vector<uint8_t> &data);

// Codec header parsers; `p` points at the chunk payload.
MuxStatus parse_vp8_header(const uint8_t *p, size_t size, uint32_t &width, uint32_t &height);
MuxStatus parse_vp8l_header(const uint8_t *p, size_t size, uint32_t &width, uint32_t &height,
                            bool &alpha_hint);

}  // namespace webpforge
