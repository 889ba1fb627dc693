//
//  webpforge.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "animation_types.hpp"
#include "frame_ledger.hpp"
#include "metadata_builder.hpp"
#include "mux_status.hpp"
#include "webp_inspector.hpp"

namespace webpforge {

/// @defgroup api WebPForge Public API
/// Public, supported C++ interfaces for muxing still WebP images into an animated WebP.
/// @{

/**
 * @brief Return the WebPForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/// Check canvas size (1..16384 per side) and loop count (0..65535).
MuxStatus validate_params(const AnimationParams &params);  ///< @ingroup api

/**
 * @brief Builder for one animated WebP file.
 *
 * Frames are appended in display order, then finish() writes the file once. Any failed call
 * leaves the animator usable, except an I/O failure during finish(): the sink may hold partial
 * bytes, so the animator is spent either way.
 *
 * Not safe for concurrent use.
 */
class Animator {
   public:
    /// Returns std::nullopt (and InvalidParams in `status`) for out-of-range parameters.
    static std::optional<Animator> create(const AnimationParams &params,
                                          MuxStatus *status = nullptr);

    Animator(Animator &&) = default;
    Animator &operator=(Animator &&) = default;
    Animator(const Animator &) = delete;
    Animator &operator=(const Animator &) = delete;

    /**
     * @brief Append a still WebP file (RIFF envelope included) as the next frame.
     *
     * @param webp Complete still WebP bitstream, stored unmodified.
     * @param placement Explicit rectangle; its size must match the bitstream and x/y must be
     *        even. Leave empty to place the frame at 0,0 covering the whole canvas.
     * @param duration_ms Display time; values above 16777215 are clamped when written.
     * @param disposal What happens to the frame's area before the next frame is drawn.
     * @param blend Whether the frame is alpha-blended onto the canvas or replaces it.
     */
    MuxStatus add_frame(std::vector<uint8_t> webp, const std::optional<FrameRect> &placement,
                        uint32_t duration_ms,
                        DisposalMethod disposal = DisposalMethod::ClearToBackground,
                        BlendMethod blend = BlendMethod::NoBlend);

    /// @overload Same as add_frame() for the bare chunks (`[ALPH] VP8 ` or `VP8L`) that
    /// follow the 12-byte RIFF header.
    MuxStatus add_frame_chunks(std::vector<uint8_t> chunks,
                               const std::optional<FrameRect> &placement, uint32_t duration_ms,
                               DisposalMethod disposal = DisposalMethod::ClearToBackground,
                               BlendMethod blend = BlendMethod::NoBlend);

    /// Optional metadata; an empty blob removes the chunk again.
    MuxStatus set_icc_profile(std::vector<uint8_t> icc);
    MuxStatus set_exif_metadata(std::vector<uint8_t> exif);
    MuxStatus set_xmp_metadata(std::vector<uint8_t> xmp);

    /// Write the animation to `sink`. Succeeds once; later calls fail with AlreadyFinished.
    MuxStatus finish(std::ostream &sink);

    /// Write the animation to a file; a failed write removes the partial file.
    MuxStatus finish_to_file(const std::string &output_path);

    bool is_finished() const { return state_ == State::Finished; }
    size_t frame_count() const { return ledger_.size(); }
    const AnimationParams &params() const { return params_; }
    const std::vector<FrameRecord> &frames() const { return ledger_.frames(); }

#ifdef WEBPFORGE_TESTING
    // Test-only: append a prepared record, bypassing inspection.
    void add_record_for_test(FrameRecord record) {
        ledger_.append_record_for_test(std::move(record));
    }
#endif

   private:
    enum class State { Building, Finished };

    explicit Animator(const AnimationParams &params);

    MuxStatus append(std::vector<uint8_t> bytes, const std::optional<FrameRect> &placement,
                     uint32_t duration_ms, DisposalMethod disposal, BlendMethod blend,
                     PayloadFraming framing);
    MuxStatus set_metadata(std::vector<uint8_t> &slot, std::vector<uint8_t> data,
                           const char *label);

    AnimationParams params_;
    FrameLedger ledger_;
    MetadataBlobs metadata_;
    State state_ = State::Building;
};

/// Mux the animation described by a JSON manifest (see manifest.hpp) into `output_path`.
MuxStatus mux_manifest_to_webp(const std::string &manifest_path,
                               const std::string &output_path);  ///< @ingroup api

/// @}

}  // namespace webpforge
