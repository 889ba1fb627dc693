//
//  animation_types.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>

namespace webpforge {

inline constexpr uint32_t kMaxCanvasDimension = 16384;
inline constexpr uint32_t kMaxLoopCount = 0xFFFF;
inline constexpr uint32_t kMaxFrameDuration = 0xFFFFFF;  // 24-bit ANMF field

/// @ingroup api
/// Fixed animation parameters supplied when the animator is created.
struct AnimationParams {
    uint32_t canvas_width = 0;                       ///< 1..16384
    uint32_t canvas_height = 0;                      ///< 1..16384
    std::array<uint8_t, 4> background_bgra{0, 0, 0, 0};  ///< Blue, green, red, alpha
    uint32_t loop_count = 0;                         ///< 0 loops forever; max 65535
    bool declared_has_alpha = false;                 ///< Advisory only; frames decide
};

/// @ingroup api
/// Frame placement on the canvas, in pixels. x and y must be even.
struct FrameRect {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;

    bool operator==(const FrameRect &o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
};

/// What happens to the frame's area after it was shown.
enum class DisposalMethod { None, ClearToBackground };

/// How the frame is composited onto the canvas.
enum class BlendMethod { AlphaBlend, NoBlend };

}  // namespace webpforge
