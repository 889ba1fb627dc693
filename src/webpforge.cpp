//
//  webpforge.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//
#include "webpforge.hpp"
#include "webpforge_version.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "container_writer.hpp"
#include "file_io.hpp"
#include "logging.hpp"
#include "manifest.hpp"

namespace webpforge {

std::string version_string() { return WEBPFORGE_VERSION_DISPLAY; }

MuxStatus validate_params(const AnimationParams &params) {
    if (params.canvas_width < 1 || params.canvas_width > kMaxCanvasDimension ||
        params.canvas_height < 1 || params.canvas_height > kMaxCanvasDimension) {
        return make_error(MuxError::InvalidParams,
                          "canvas " + std::to_string(params.canvas_width) + "x" +
                              std::to_string(params.canvas_height) + " outside 1.." +
                              std::to_string(kMaxCanvasDimension));
    }
    if (params.loop_count > kMaxLoopCount) {
        return make_error(MuxError::InvalidParams, "loop count " +
                                                       std::to_string(params.loop_count) +
                                                       " exceeds " + std::to_string(kMaxLoopCount));
    }
    return make_ok();
}

// -----------------------------------------------------------------------------
// Animator.
// -----------------------------------------------------------------------------
Animator::Animator(const AnimationParams &params)
    : params_(params), ledger_(params.canvas_width, params.canvas_height) {}

std::optional<Animator> Animator::create(const AnimationParams &params, MuxStatus *status) {
    MuxStatus st = validate_params(params);
    if (status) {
        *status = st;
    }
    if (!st.ok) {
        WF_LOG("debug", "Animator::create rejected: " << st.message);
        return std::nullopt;
    }
    WF_LOG("debug", "Animator::create canvas=" << params.canvas_width << "x"
                                               << params.canvas_height
                                               << " loop=" << params.loop_count);
    return Animator(params);
}

MuxStatus Animator::append(std::vector<uint8_t> bytes, const std::optional<FrameRect> &placement,
                           uint32_t duration_ms, DisposalMethod disposal, BlendMethod blend,
                           PayloadFraming framing) {
    if (state_ == State::Finished) {
        return make_error(MuxError::AlreadyFinished, "cannot add frames after finish()");
    }
    return ledger_.append(std::move(bytes), placement, duration_ms, disposal, blend, framing);
}

MuxStatus Animator::add_frame(std::vector<uint8_t> webp, const std::optional<FrameRect> &placement,
                              uint32_t duration_ms, DisposalMethod disposal, BlendMethod blend) {
    return append(std::move(webp), placement, duration_ms, disposal, blend,
                  PayloadFraming::RiffFile);
}

MuxStatus Animator::add_frame_chunks(std::vector<uint8_t> chunks,
                                     const std::optional<FrameRect> &placement,
                                     uint32_t duration_ms, DisposalMethod disposal,
                                     BlendMethod blend) {
    return append(std::move(chunks), placement, duration_ms, disposal, blend,
                  PayloadFraming::BareChunks);
}

MuxStatus Animator::set_metadata(std::vector<uint8_t> &slot, std::vector<uint8_t> data,
                                 const char *label) {
    if (state_ == State::Finished) {
        return make_error(MuxError::AlreadyFinished,
                          std::string("cannot set ") + label + " after finish()");
    }
    WF_LOG("debug", label << " set, bytes=" << data.size() << " hex=" << hex_prefix(data));
    slot = std::move(data);
    return make_ok();
}

MuxStatus Animator::set_icc_profile(std::vector<uint8_t> icc) {
    return set_metadata(metadata_.icc, std::move(icc), "ICC profile");
}

MuxStatus Animator::set_exif_metadata(std::vector<uint8_t> exif) {
    return set_metadata(metadata_.exif, std::move(exif), "EXIF metadata");
}

MuxStatus Animator::set_xmp_metadata(std::vector<uint8_t> xmp) {
    return set_metadata(metadata_.xmp, std::move(xmp), "XMP metadata");
}

MuxStatus Animator::finish(std::ostream &sink) {
    if (state_ == State::Finished) {
        return make_error(MuxError::AlreadyFinished, "animation was already written");
    }
    MuxStatus st = write_webp_animation(sink, params_, ledger_.frames(), metadata_);
    // Only a sink failure spends the animator; validation failures leave it building.
    if (st.ok || st.error == MuxError::IoError) {
        state_ = State::Finished;
        ledger_.clear();
        metadata_ = MetadataBlobs{};
    }
    return st;
}

MuxStatus Animator::finish_to_file(const std::string &output_path) {
    if (state_ == State::Finished) {
        return make_error(MuxError::AlreadyFinished, "animation was already written");
    }
    if (ledger_.empty()) {
        return make_error(MuxError::EmptyAnimation, "animation has no frames");
    }
    // Validate before the output is truncated.
    ContainerPlan plan;
    MuxStatus planned = plan_animation(ledger_.frames(), metadata_, plan);
    if (!planned.ok) {
        return planned;
    }
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        WF_LOG("error", "Failed to open output for write: " << output_path);
        return make_error(MuxError::IoError, "cannot open " + output_path + " for writing");
    }
    MuxStatus st = finish(out);
    out.close();
    if (st.ok && !out) {
        st = make_error(MuxError::IoError, "closing " + output_path + " failed");
    }
    if (!st.ok) {
        std::error_code ec;
        std::filesystem::remove(output_path, ec);
        if (ec) {
            WF_LOG("warn", "could not remove partial output " << output_path << ": "
                                                              << ec.message());
        }
    }
    return st;
}

// -----------------------------------------------------------------------------
// Manifest driven muxing.
// -----------------------------------------------------------------------------
namespace {

MuxStatus load_blob(const std::string &path, const char *label, std::vector<uint8_t> &out) {
    if (path.empty()) {
        return make_ok();
    }
    if (!read_file(path, out)) {
        return make_error(MuxError::ManifestError,
                          std::string("cannot read ") + label + " file " + path);
    }
    return make_ok();
}

MuxStatus with_context(MuxStatus st, const std::string &context) {
    st.message = context + ": " + st.message;
    return st;
}

}  // namespace

MuxStatus mux_manifest_to_webp(const std::string &manifest_path,
                               const std::string &output_path) {
    const auto t0 = std::chrono::steady_clock::now();
    WF_LOG("debug", "mux_manifest_to_webp manifest=" << manifest_path
                                                     << " output=" << output_path);
    AnimationManifest manifest;
    MuxStatus st = load_manifest(manifest_path, manifest);
    if (!st.ok) {
        WF_LOG("error", st.message);
        return st;
    }

    auto animator = Animator::create(manifest.params, &st);
    if (!animator) {
        WF_LOG("error", "invalid animation parameters: " << st.message);
        return st;
    }

    for (size_t i = 0; i < manifest.frames.size(); ++i) {
        const auto &entry = manifest.frames[i];
        const std::string context = "frame " + std::to_string(i) + " (" + entry.path + ")";
        std::vector<uint8_t> bytes;
        if (!read_file(entry.path, bytes)) {
            return make_error(MuxError::ManifestError, context + ": cannot read frame file");
        }

        std::optional<FrameRect> placement;
        if (entry.has_placement()) {
            FrameRect rect{entry.x.value_or(0), entry.y.value_or(0), 0, 0};
            if (entry.width && entry.height) {
                rect.width = *entry.width;
                rect.height = *entry.height;
            } else {
                // Size defaults to the frame's own dimensions.
                InspectResult inspected = inspect_webp(bytes);
                if (!inspected.status.ok) {
                    WF_LOG("error", context << ": " << inspected.status.message);
                    return with_context(inspected.status, context);
                }
                rect.width = entry.width.value_or(inspected.info.width);
                rect.height = entry.height.value_or(inspected.info.height);
            }
            placement = rect;
        }

        st = animator->add_frame(std::move(bytes), placement, entry.duration_ms, entry.disposal,
                                 entry.blend);
        if (!st.ok) {
            WF_LOG("error", context << ": " << st.message);
            return with_context(st, context);
        }
    }

    std::vector<uint8_t> icc, exif, xmp;
    if (!(st = load_blob(manifest.icc_path, "ICC", icc)).ok ||
        !(st = load_blob(manifest.exif_path, "EXIF", exif)).ok ||
        !(st = load_blob(manifest.xmp_path, "XMP", xmp)).ok) {
        WF_LOG("error", st.message);
        return st;
    }
    if (!(st = animator->set_icc_profile(std::move(icc))).ok ||
        !(st = animator->set_exif_metadata(std::move(exif))).ok ||
        !(st = animator->set_xmp_metadata(std::move(xmp))).ok) {
        return st;
    }

    st = animator->finish_to_file(output_path);
    const auto t1 = std::chrono::steady_clock::now();
    WF_LOG("debug", "mux_manifest_to_webp timings ms: total="
                        << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count());
    if (!st.ok) {
        WF_LOG("error", "Failed to write WebP to " << output_path << ": " << st.message);
    }
    return st;
}

}  // namespace webpforge
