//
//  frame_ledger.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "frame_ledger.hpp"

#include <string>
#include <utility>

#include "logging.hpp"

namespace {

std::string rect_string(const webpforge::FrameRect &r) {
    return std::to_string(r.width) + "x" + std::to_string(r.height) + "@" + std::to_string(r.x) +
           "," + std::to_string(r.y);
}

}  // namespace

namespace webpforge {

MuxStatus resolve_placement(const WebPInfo &info, const std::optional<FrameRect> &placement,
                            uint32_t canvas_width, uint32_t canvas_height, FrameRect &out) {
    FrameRect rect{};
    if (placement) {
        rect = *placement;
        if (rect.width != info.width || rect.height != info.height) {
            return make_error(MuxError::PlacementSizeMismatch,
                              "placement " + rect_string(rect) + " does not match the " +
                                  std::to_string(info.width) + "x" +
                                  std::to_string(info.height) + " bitstream");
        }
    } else {
        rect = FrameRect{0, 0, canvas_width, canvas_height};
        if (info.width != canvas_width || info.height != canvas_height) {
            return make_error(MuxError::FrameCanvasMismatch,
                              "full-canvas frame is " + std::to_string(info.width) + "x" +
                                  std::to_string(info.height) + ", canvas is " +
                                  std::to_string(canvas_width) + "x" +
                                  std::to_string(canvas_height));
        }
    }

    // ANMF stores offsets in units of two pixels.
    if ((rect.x & 1) != 0 || (rect.y & 1) != 0) {
        return make_error(MuxError::UnalignedOffset,
                          "frame offset " + std::to_string(rect.x) + "," +
                              std::to_string(rect.y) + " is not even");
    }
    // 64-bit sums: x + width must not wrap.
    if (uint64_t(rect.x) + rect.width > canvas_width ||
        uint64_t(rect.y) + rect.height > canvas_height) {
        return make_error(MuxError::FrameOutOfBounds,
                          "frame " + rect_string(rect) + " exceeds the " +
                              std::to_string(canvas_width) + "x" + std::to_string(canvas_height) +
                              " canvas");
    }
    out = rect;
    return make_ok();
}

MuxStatus FrameLedger::append(std::vector<uint8_t> payload,
                              const std::optional<FrameRect> &placement, uint32_t duration_ms,
                              DisposalMethod disposal, BlendMethod blend,
                              PayloadFraming framing) {
    InspectResult inspected = framing == PayloadFraming::RiffFile ? inspect_webp(payload)
                                                                  : inspect_webp_chunks(payload);
    if (!inspected.status.ok) {
        WF_LOG("debug", "frame " << frames_.size() << " rejected by inspection: "
                                 << inspected.status.message
                                 << " head=" << hex_prefix(payload));
        return inspected.status;
    }

    FrameRect rect{};
    MuxStatus placed =
        resolve_placement(inspected.info, placement, canvas_width_, canvas_height_, rect);
    if (!placed.ok) {
        return placed;
    }

    FrameRecord record;
    record.payload = std::move(payload);
    record.info = inspected.info;
    record.placement = rect;
    record.duration_ms = duration_ms;
    record.disposal = disposal;
    record.blend = blend;
    frames_.push_back(std::move(record));

    WF_LOG("debug", "frame[" << frames_.size() - 1 << "] " << rect_string(rect)
                             << " codec=" << codec_name(inspected.info.codec)
                             << " alpha=" << inspected.info.has_alpha
                             << " duration_ms=" << duration_ms);
    return make_ok();
}

bool FrameLedger::any_alpha() const {
    for (const auto &f : frames_) {
        if (f.info.has_alpha) {
            return true;
        }
    }
    return false;
}

}  // namespace webpforge
