//
//  frame_ledger.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "animation_types.hpp"
#include "mux_status.hpp"
#include "webp_inspector.hpp"

namespace webpforge {

/// One accepted frame. Spans in `info` index into `payload`.
struct FrameRecord {
    std::vector<uint8_t> payload;  ///< Bitstream bytes exactly as supplied
    WebPInfo info;
    FrameRect placement;
    uint32_t duration_ms = 0;  ///< Clamped to 24 bits when written
    DisposalMethod disposal = DisposalMethod::ClearToBackground;
    BlendMethod blend = BlendMethod::NoBlend;
};

/// How the appended bytes are framed.
enum class PayloadFraming { RiffFile, BareChunks };

// Resolve the frame rectangle from an optional override and the inspected size, then check
// parity and bounds against the canvas.
MuxStatus resolve_placement(const WebPInfo &info, const std::optional<FrameRect> &placement,
                            uint32_t canvas_width, uint32_t canvas_height, FrameRect &out);

// Ordered, append-only record of the frames of one animation.
class FrameLedger {
   public:
    FrameLedger(uint32_t canvas_width, uint32_t canvas_height)
        : canvas_width_(canvas_width), canvas_height_(canvas_height) {}

    // Inspect and validate; appends only on success.
    MuxStatus append(std::vector<uint8_t> payload, const std::optional<FrameRect> &placement,
                     uint32_t duration_ms, DisposalMethod disposal, BlendMethod blend,
                     PayloadFraming framing = PayloadFraming::RiffFile);

    const std::vector<FrameRecord> &frames() const { return frames_; }
    size_t size() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }
    bool any_alpha() const;

    // Drop all recorded frames (after the animation was written).
    void clear() { frames_.clear(); }

#ifdef WEBPFORGE_TESTING
    // Record a frame without inspection or placement checks.
    void append_record_for_test(FrameRecord record) { frames_.push_back(std::move(record)); }
#endif

   private:
    uint32_t canvas_width_;
    uint32_t canvas_height_;
    std::vector<FrameRecord> frames_;
};

}  // namespace webpforge
