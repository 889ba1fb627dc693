//
//  metadata_builder.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//

#pragma once
#include <cstdint>
#include <memory>
#include <vector>

#include "riff_chunks.hpp"

/**
 * @brief Metadata blobs carried next to the animation.
 *
 * Each blob is stored verbatim; empty blobs are omitted from the file.
 */
struct MetadataBlobs {
    std::vector<uint8_t> icc;   ///< ICC color profile (ICCP)
    std::vector<uint8_t> exif;  ///< EXIF block (EXIF)
    std::vector<uint8_t> xmp;   ///< XMP packet (XMP )
};

// Wrap one metadata blob; returns nullptr when `data` is empty.
std::unique_ptr<Chunk> build_metadata_chunk(uint32_t tag, const std::vector<uint8_t> &data);
