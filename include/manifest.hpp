//
//  manifest.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "animation_types.hpp"
#include "mux_status.hpp"

namespace webpforge {

/**
 * @brief One frame entry of a manifest.
 *
 * `x`/`y` (and optionally `width`/`height`) request an explicit placement; a missing size is
 * taken from the frame's bitstream.
 */
struct ManifestFrame {
    std::string path;  ///< Resolved against the manifest directory
    uint32_t duration_ms = 0;
    std::optional<uint32_t> x;
    std::optional<uint32_t> y;
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    DisposalMethod disposal = DisposalMethod::ClearToBackground;
    BlendMethod blend = BlendMethod::NoBlend;

    bool has_placement() const { return x || y || width || height; }
};

/**
 * @brief Animation described by a JSON manifest.
 *
 * @code{.json}
 * {
 *   "width": 64, "height": 64,
 *   "background": [255, 255, 255, 255],
 *   "loop_count": 0,
 *   "has_alpha": false,
 *   "icc": "profile.icc", "exif": "meta.exif", "xmp": "meta.xmp",
 *   "frames": [
 *     {"file": "f0.webp", "duration_ms": 500, "x": 0, "y": 0,
 *      "disposal": "background", "blend": "none"}
 *   ]
 * }
 * @endcode
 */
struct AnimationManifest {
    AnimationParams params;
    std::string icc_path;   ///< Empty when absent
    std::string exif_path;  ///< Empty when absent
    std::string xmp_path;   ///< Empty when absent
    std::vector<ManifestFrame> frames;
};

// Parse manifest text; relative paths resolve against `base_dir`.
MuxStatus parse_manifest(const std::string &json_text, const std::string &base_dir,
                         AnimationManifest &out);

// Read and parse a manifest file.
MuxStatus load_manifest(const std::string &json_path, AnimationManifest &out);

}  // namespace webpforge
