//
//  container_writer.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

#include "animation_types.hpp"
#include "frame_ledger.hpp"
#include "metadata_builder.hpp"
#include "mux_status.hpp"

// Sizes that decide the layout of one ANMF chunk.
struct FrameChunkSizes {
    bool has_alpha = false;
    uint64_t alpha_size = 0;      // declared ALPH payload size
    uint64_t bitstream_size = 0;  // declared VP8/VP8L payload size
};

// Planned sizes for the whole file, all excluding chunk headers and pad bytes.
struct ContainerPlan {
    std::vector<uint64_t> anmf_sizes;
    uint64_t riff_size = 0;  // value of the envelope size field
};

// Declared ANMF size: 16-byte prefix plus the padded ALPH and image chunks.
uint64_t anmf_data_size(const FrameChunkSizes &frame);

// Compute every size ahead of writing; fails with SizeOverflow when a chunk or the file does
// not fit the 32-bit size field.
webpforge::MuxStatus plan_container(const std::vector<FrameChunkSizes> &frames,
                                    uint64_t icc_size, uint64_t exif_size, uint64_t xmp_size,
                                    ContainerPlan &plan);

// Emit RIFF/WEBP, VP8X, [ICCP], ANIM, ANMF..., [EXIF], [XMP ] to `out`.
// Failures before the first byte (EmptyAnimation, SizeOverflow) leave `out` untouched.
// Plan the file for recorded frames and metadata; SizeOverflow when it cannot be written.
webpforge::MuxStatus plan_animation(const std::vector<webpforge::FrameRecord> &frames,
                                    const MetadataBlobs &metadata, ContainerPlan &plan);

webpforge::MuxStatus write_webp_animation(std::ostream &out,
                                          const webpforge::AnimationParams &params,
                                          const std::vector<webpforge::FrameRecord> &frames,
                                          const MetadataBlobs &metadata);
