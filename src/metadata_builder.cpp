//
//  metadata_builder.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//

#include "metadata_builder.hpp"

std::unique_ptr<Chunk> build_metadata_chunk(uint32_t tag, const std::vector<uint8_t> &data) {
    if (data.empty()) {
        return nullptr;
    }
    return Chunk::create_view(tag, data.data(), data.size());
}
