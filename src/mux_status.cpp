//
//  mux_status.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "mux_status.hpp"

namespace webpforge {

const char *error_name(MuxError error) {
    switch (error) {
        case MuxError::None:
            return "None";
        case MuxError::InvalidParams:
            return "InvalidParams";
        case MuxError::MalformedEnvelope:
            return "MalformedEnvelope";
        case MuxError::UnsupportedChunk:
            return "UnsupportedChunk";
        case MuxError::TruncatedData:
            return "TruncatedData";
        case MuxError::PlacementSizeMismatch:
            return "PlacementSizeMismatch";
        case MuxError::FrameCanvasMismatch:
            return "FrameCanvasMismatch";
        case MuxError::FrameOutOfBounds:
            return "FrameOutOfBounds";
        case MuxError::UnalignedOffset:
            return "UnalignedOffset";
        case MuxError::EmptyAnimation:
            return "EmptyAnimation";
        case MuxError::SizeOverflow:
            return "SizeOverflow";
        case MuxError::AlreadyFinished:
            return "AlreadyFinished";
        case MuxError::IoError:
            return "IoError";
        case MuxError::ManifestError:
            return "ManifestError";
    }
    return "Unknown";
}

}  // namespace webpforge
