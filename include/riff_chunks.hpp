//
//  riff_chunks.hpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "fourcc_utils.hpp"

// Forward declaration.
class Chunk;

using ChunkPtr = std::unique_ptr<Chunk>;

// RIFF chunk header: 4-byte tag + 4-byte little-endian size.
inline constexpr uint64_t kChunkHeaderSize = 8;
inline constexpr uint64_t kMaxChunkSize = 0xFFFFFFFFULL;

class Chunk {
   public:
    uint32_t type = 0;              // FourCC
    std::vector<uint8_t> payload;   // Owned payload (written before the view and children)
    const uint8_t *view = nullptr;  // Borrowed payload bytes; must outlive write()
    size_t view_size = 0;
    std::vector<ChunkPtr> children;  // Nested chunks

    uint64_t data_size = 0;  // Declared size, computed via fix_size_recursive()

    Chunk() = default;
    explicit Chunk(uint32_t t) : type(t) {}

    // Factory.
    static ChunkPtr create(uint32_t t);
    // Chunk whose payload references caller-owned bytes.
    static ChunkPtr create_view(uint32_t t, const uint8_t *data, size_t size);

    // Add child chunk.
    void add(ChunkPtr child);

    // Recursive size computation; data_size excludes the header and the pad byte.
    void fix_size_recursive();

    // Declared size (must call fix_size_recursive first).
    uint64_t size() const;

    // Bytes this chunk occupies in its parent: header + data + pad.
    uint64_t stored_size() const;

    // True when this chunk or any descendant exceeds the 32-bit size field.
    bool exceeds_size_field() const;

    // Write tag + little-endian size only.
    void write_header(std::ostream &out) const;

    // Write chunk (header, payload, children, pad) to the stream.
    void write(std::ostream &out) const;
};

// Bytes occupied by a chunk with the given declared size, including header and pad.
inline constexpr uint64_t padded_chunk_size(uint64_t data_size) {
    return kChunkHeaderSize + data_size + (data_size & 1);
}

// ------------- Helper write functions (little-endian) -----------------------

inline void write_u8(std::vector<uint8_t> &p, uint8_t v) { p.push_back(v); }

inline void write_u16le(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
}

inline void write_u24le(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
}

inline void write_u32le(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 24) & 0xFF);
}

inline void write_fourcc(std::vector<uint8_t> &p, uint32_t tag) {
    p.push_back((tag >> 24) & 0xFF);
    p.push_back((tag >> 16) & 0xFF);
    p.push_back((tag >> 8) & 0xFF);
    p.push_back(tag & 0xFF);
}

// ------------- Helper read functions (little-endian) ------------------------

inline uint16_t read_u16le(const uint8_t *p) {
    return static_cast<uint16_t>(uint16_t(p[0]) | (uint16_t(p[1]) << 8));
}

inline uint32_t read_u24le(const uint8_t *p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16);
}

inline uint32_t read_u32le(const uint8_t *p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) |
           (uint32_t(p[3]) << 24);
}
