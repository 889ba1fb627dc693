//
//  mux_status.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace webpforge {

/// @ingroup api
/// Distinguishable failure kinds reported through MuxStatus.
enum class MuxError {
    None = 0,
    InvalidParams,          ///< Canvas or loop count out of range
    MalformedEnvelope,      ///< Missing RIFF/WEBP signature or inconsistent envelope length
    UnsupportedChunk,       ///< No usable VP8/VP8L payload, or an animated input
    TruncatedData,          ///< A declared length runs past the end of the buffer
    PlacementSizeMismatch,  ///< Explicit rectangle differs from the frame's own size
    FrameCanvasMismatch,    ///< Full-canvas frame whose size differs from the canvas
    FrameOutOfBounds,       ///< Rectangle extends past the canvas
    UnalignedOffset,        ///< Odd x or y offset
    EmptyAnimation,         ///< finish() without frames
    SizeOverflow,           ///< A chunk or the file exceeds the 32-bit size field
    AlreadyFinished,        ///< Animator was already written
    IoError,                ///< Sink or file failure
    ManifestError,          ///< JSON manifest could not be read or is malformed
};

/// Short stable name for an error kind (e.g. "UnalignedOffset").
const char *error_name(MuxError error);

/**
 * @brief Result object with success flag, error kind and optional error message.
 *
 * When `ok == true`, `error` is MuxError::None and `message` is empty. On failure, `message`
 * contains a short description of what went wrong.
 */
struct MuxStatus {
    bool ok{false};
    MuxError error{MuxError::None};
    std::string message;
};

inline MuxStatus make_ok() { return MuxStatus{true, MuxError::None, {}}; }

inline MuxStatus make_error(MuxError error, std::string msg) {
    return MuxStatus{false, error, std::move(msg)};
}

}  // namespace webpforge
