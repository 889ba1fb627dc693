//
//  riff_chunks.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "riff_chunks.hpp"

// -----------------------------------------------------------------------------
// Factory.
// -----------------------------------------------------------------------------
ChunkPtr Chunk::create(uint32_t t) { return std::make_unique<Chunk>(t); }

ChunkPtr Chunk::create_view(uint32_t t, const uint8_t *data, size_t size) {
    auto chunk = std::make_unique<Chunk>(t);
    chunk->view = data;
    chunk->view_size = size;
    return chunk;
}

// -----------------------------------------------------------------------------
// Add child.
// -----------------------------------------------------------------------------
void Chunk::add(ChunkPtr child) { children.push_back(std::move(child)); }

// -----------------------------------------------------------------------------
// Compute recursive chunk size.
// -----------------------------------------------------------------------------
void Chunk::fix_size_recursive() {
    // The size field counts neither the 8-byte header nor the pad byte.
    uint64_t total = payload.size() + view_size;

    for (auto &c : children) {
        c->fix_size_recursive();
        total += c->stored_size();
    }

    data_size = total;
}

// -----------------------------------------------------------------------------
// Sizes.
// -----------------------------------------------------------------------------
uint64_t Chunk::size() const { return data_size; }

uint64_t Chunk::stored_size() const { return padded_chunk_size(data_size); }

bool Chunk::exceeds_size_field() const {
    if (data_size > kMaxChunkSize) {
        return true;
    }
    for (const auto &c : children) {
        if (c->exceeds_size_field()) {
            return true;
        }
    }
    return false;
}

// -----------------------------------------------------------------------------
// Write chunk header.
// -----------------------------------------------------------------------------
void Chunk::write_header(std::ostream &out) const {
    const uint32_t s = static_cast<uint32_t>(data_size);

    uint8_t header[8];
    header[0] = (type >> 24) & 0xFF;
    header[1] = (type >> 16) & 0xFF;
    header[2] = (type >> 8) & 0xFF;
    header[3] = (type) & 0xFF;

    header[4] = (s) & 0xFF;
    header[5] = (s >> 8) & 0xFF;
    header[6] = (s >> 16) & 0xFF;
    header[7] = (s >> 24) & 0xFF;

    out.write(reinterpret_cast<const char *>(header), 8);
}

// -----------------------------------------------------------------------------
// Write chunk to stream.
// -----------------------------------------------------------------------------
void Chunk::write(std::ostream &out) const {
    write_header(out);

    // Write payload.
    if (!payload.empty()) {
        out.write(reinterpret_cast<const char *>(payload.data()),
                  static_cast<std::streamsize>(payload.size()));
    }
    if (view != nullptr && view_size > 0) {
        out.write(reinterpret_cast<const char *>(view), static_cast<std::streamsize>(view_size));
    }

    // Write children.
    for (const auto &c : children) {
        c->write(out);
    }

    // Odd-sized data is followed by a single zero byte.
    if (data_size & 1) {
        out.put('\0');
    }
}
