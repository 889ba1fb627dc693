//
//  container_writer.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "container_writer.hpp"

#include <chrono>
#include <ios>
#include <string>
#include <utility>

#include "anim_builder.hpp"
#include "anmf_builder.hpp"
#include "logging.hpp"
#include "riff_chunks.hpp"
#include "vp8x_builder.hpp"

using webpforge::make_error;
using webpforge::make_ok;
using webpforge::MuxError;
using webpforge::MuxStatus;

namespace {

constexpr uint64_t kWebpTagSize = 4;      // 'WEBP' inside the RIFF payload
constexpr uint64_t kVp8xDataSize = 10;
constexpr uint64_t kAnimDataSize = 6;

MuxStatus overflow(const std::string &what, uint64_t size) {
    return make_error(MuxError::SizeOverflow,
                      what + " needs " + std::to_string(size) + " bytes; exceeds 32-bit size field");
}

// Write one top-level chunk and report a failing sink.
MuxStatus emit(std::ostream &out, const Chunk &chunk) {
    chunk.write(out);
    if (!out) {
        return make_error(MuxError::IoError,
                          "sink failed while writing " + fourcc_to_string(chunk.type) + " chunk");
    }
    return make_ok();
}

std::vector<FrameChunkSizes> frame_chunk_sizes(const std::vector<webpforge::FrameRecord> &frames) {
    std::vector<FrameChunkSizes> sizes;
    sizes.reserve(frames.size());
    for (const auto &f : frames) {
        FrameChunkSizes s;
        s.has_alpha = f.info.has_alpha && f.info.alpha.has_value();
        s.alpha_size = s.has_alpha ? f.info.alpha->size : 0;
        s.bitstream_size = f.info.bitstream.size;
        sizes.push_back(s);
    }
    return sizes;
}

}  // namespace

uint64_t anmf_data_size(const FrameChunkSizes &frame) {
    uint64_t total = kAnmfPrefixSize;
    if (frame.has_alpha) {
        total += padded_chunk_size(frame.alpha_size);
    }
    total += padded_chunk_size(frame.bitstream_size);
    return total;
}

MuxStatus plan_container(const std::vector<FrameChunkSizes> &frames, uint64_t icc_size,
                         uint64_t exif_size, uint64_t xmp_size, ContainerPlan &plan) {
    ContainerPlan out;
    uint64_t total = kWebpTagSize + padded_chunk_size(kVp8xDataSize) +
                     padded_chunk_size(kAnimDataSize);

    const std::pair<const char *, uint64_t> blobs[] = {
        {"ICCP chunk", icc_size}, {"EXIF chunk", exif_size}, {"XMP chunk", xmp_size}};
    for (const auto &blob : blobs) {
        if (blob.second == 0) {
            continue;
        }
        if (blob.second > kMaxChunkSize) {
            return overflow(blob.first, blob.second);
        }
        total += padded_chunk_size(blob.second);
    }

    out.anmf_sizes.reserve(frames.size());
    for (size_t i = 0; i < frames.size(); ++i) {
        const uint64_t size = anmf_data_size(frames[i]);
        if (size > kMaxChunkSize) {
            return overflow("ANMF chunk for frame " + std::to_string(i), size);
        }
        out.anmf_sizes.push_back(size);
        total += padded_chunk_size(size);
        // Early exit keeps the running sum far away from wrapping.
        if (total > kMaxChunkSize) {
            return overflow("RIFF envelope", total);
        }
    }

    if (total > kMaxChunkSize) {
        return overflow("RIFF envelope", total);
    }
    out.riff_size = total;
    plan = std::move(out);
    return make_ok();
}

MuxStatus plan_animation(const std::vector<webpforge::FrameRecord> &frames,
                         const MetadataBlobs &metadata, ContainerPlan &plan) {
    return plan_container(frame_chunk_sizes(frames), metadata.icc.size(), metadata.exif.size(),
                          metadata.xmp.size(), plan);
}

// -----------------------------------------------------------------------------
// Complete animated WebP writer.
// -----------------------------------------------------------------------------
MuxStatus write_webp_animation(std::ostream &out, const webpforge::AnimationParams &params,
                               const std::vector<webpforge::FrameRecord> &frames,
                               const MetadataBlobs &metadata) {
    auto t_start = std::chrono::steady_clock::now();
    if (frames.empty()) {
        return make_error(MuxError::EmptyAnimation, "animation has no frames");
    }

    //
    // 1) Plan sizes before touching the sink.
    //
    ContainerPlan plan;
    MuxStatus planned = plan_animation(frames, metadata, plan);
    if (!planned.ok) {
        return planned;
    }
    bool any_alpha = false;
    for (const auto &f : frames) {
        any_alpha = any_alpha || (f.info.has_alpha && f.info.alpha.has_value());
    }

    //
    // 2) Feature bits. The frames decide alpha; the declared flag is only a hint.
    //
    if (params.declared_has_alpha != any_alpha) {
        WF_LOG("warn", "declared has_alpha=" << params.declared_has_alpha
                                             << " disagrees with frame content (alpha="
                                             << any_alpha << "); using frame content");
    }
    Vp8xFeatures features;
    features.alpha = any_alpha;
    features.icc = !metadata.icc.empty();
    features.exif = !metadata.exif.empty();
    features.xmp = !metadata.xmp.empty();
    const uint8_t flags = vp8x_flags(features);

    //
    // 3) Chunk tree in emission order.
    //
    auto riff = Chunk::create(kTagRiff);
    write_fourcc(riff->payload, kTagWebp);
    riff->add(build_vp8x(flags, params.canvas_width, params.canvas_height));
    if (auto iccp = build_metadata_chunk(kTagIccp, metadata.icc)) {
        riff->add(std::move(iccp));
    }
    riff->add(build_anim(params.background_bgra, static_cast<uint16_t>(params.loop_count)));
    for (const auto &f : frames) {
        riff->add(build_anmf(f));
    }
    if (auto exif = build_metadata_chunk(kTagExif, metadata.exif)) {
        riff->add(std::move(exif));
    }
    if (auto xmp = build_metadata_chunk(kTagXmp, metadata.xmp)) {
        riff->add(std::move(xmp));
    }
    riff->fix_size_recursive();

    if (riff->exceeds_size_field()) {
        return overflow("RIFF envelope", riff->size());
    }
    if (riff->size() != plan.riff_size) {
        WF_LOG("warn", "planned RIFF size " << plan.riff_size << " differs from built size "
                                            << riff->size());
    }
    WF_LOG("debug", "writing WebP animation: frames=" << frames.size() << " canvas="
                                                      << params.canvas_width << "x"
                                                      << params.canvas_height << " flags=0x"
                                                      << std::hex << static_cast<int>(flags)
                                                      << std::dec << " riff_size="
                                                      << riff->size());

    //
    // 4) Stream: envelope header, then each top-level chunk.
    //
    try {
        riff->write_header(out);
        out.write(reinterpret_cast<const char *>(riff->payload.data()),
                  static_cast<std::streamsize>(riff->payload.size()));
        if (!out) {
            return make_error(MuxError::IoError, "sink failed while writing RIFF header");
        }
        for (const auto &child : riff->children) {
            MuxStatus st = emit(out, *child);
            if (!st.ok) {
                return st;
            }
        }
        out.flush();
        if (!out) {
            return make_error(MuxError::IoError, "sink failed to flush");
        }
    } catch (const std::ios_base::failure &e) {
        return make_error(MuxError::IoError, std::string("sink failed: ") + e.what());
    }

    const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - t_start)
                              .count();
    WF_LOG("debug", "write_webp_animation done bytes=" << padded_chunk_size(riff->size())
                                                       << " ms=" << total_ms);
    return make_ok();
}
