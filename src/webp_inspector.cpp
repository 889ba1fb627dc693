//
//  webp_inspector.cpp
//  WebPForge
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "webp_inspector.hpp"

#include <string>

#include "fourcc_utils.hpp"
#include "logging.hpp"
#include "riff_chunks.hpp"

namespace {

using webpforge::ChunkSpan;
using webpforge::CodecKind;
using webpforge::InspectResult;
using webpforge::make_error;
using webpforge::MuxError;

constexpr size_t kEnvelopeSize = 12;      // RIFF + size + WEBP
constexpr uint32_t kVp8xPayloadSize = 10;  // flags + reserved + canvas
constexpr size_t kVp8FrameHeaderSize = 10;  // frame tag + start code + width + height
constexpr size_t kVp8lHeaderSize = 5;       // signature + packed size/alpha/version
constexpr uint8_t kVp8lSignature = 0x2F;

std::string describe(uint32_t tag) {
    return is_printable_fourcc(tag) ? "'" + fourcc_to_string(tag) + "'" : std::string("<binary>");
}

// Walk the chunks in data[start, end). The envelope (if any) has already been checked.
InspectResult walk_chunks(const std::vector<uint8_t> &data, size_t start, size_t end) {
    InspectResult result;
    auto &info = result.info;
    const uint8_t *p = data.data();

    std::optional<ChunkSpan> alpha;
    std::optional<ChunkSpan> bitstream;
    uint32_t bitstream_tag = 0;

    size_t pos = start;
    bool first = true;
    while (pos < end) {
        if (end - pos < kChunkHeaderSize) {
            result.status = make_error(MuxError::TruncatedData,
                                       "chunk header truncated at offset " + std::to_string(pos));
            return result;
        }
        const uint32_t tag = read_fourcc(p + pos);
        const uint32_t size = read_u32le(p + pos + 4);
        const size_t payload_offset = pos + kChunkHeaderSize;
        if (size > end - payload_offset) {
            result.status = make_error(
                MuxError::TruncatedData,
                "chunk " + describe(tag) + " at offset " + std::to_string(pos) + " declares " +
                    std::to_string(size) + " bytes, only " +
                    std::to_string(end - payload_offset) + " remain");
            return result;
        }

        switch (tag) {
            case kTagVp8x:
                if (!first) {
                    result.status =
                        make_error(MuxError::UnsupportedChunk, "VP8X chunk is not the first chunk");
                    return result;
                }
                if (size < kVp8xPayloadSize) {
                    result.status = make_error(MuxError::TruncatedData,
                                               "VP8X chunk shorter than " +
                                                   std::to_string(kVp8xPayloadSize) + " bytes");
                    return result;
                }
                info.extended = true;
                WF_LOG("debug", "inspect: VP8X flags=0x" << std::hex
                                                        << static_cast<int>(p[payload_offset])
                                                        << std::dec << " canvas="
                                                        << read_u24le(p + payload_offset + 4) + 1
                                                        << "x"
                                                        << read_u24le(p + payload_offset + 7) + 1);
                break;
            case kTagAlph:
                if (bitstream) {
                    WF_LOG("debug", "inspect: ignoring ALPH chunk after the image payload");
                } else if (alpha) {
                    WF_LOG("warn", "inspect: ignoring duplicate ALPH chunk at offset " << pos);
                } else {
                    alpha = ChunkSpan{payload_offset, size};
                }
                break;
            case kTagVp8:
            case kTagVp8l:
                if (bitstream) {
                    result.status = make_error(MuxError::UnsupportedChunk,
                                               "more than one image payload chunk");
                    return result;
                }
                bitstream = ChunkSpan{payload_offset, size};
                bitstream_tag = tag;
                break;
            case kTagAnim:
            case kTagAnmf:
                result.status = make_error(MuxError::UnsupportedChunk,
                                           "animated input (" + describe(tag) +
                                               " chunk) cannot be used as a frame");
                return result;
            default:
                // ICCP/EXIF/XMP of a still image do not carry over into the animation.
                WF_LOG("debug", "inspect: skipping chunk " << describe(tag) << " size=" << size);
                break;
        }

        first = false;
        pos = payload_offset + size + (size & 1);
    }

    if (!bitstream) {
        result.status = make_error(MuxError::UnsupportedChunk, "no VP8 or VP8L chunk found");
        return result;
    }

    info.bitstream = *bitstream;
    const uint8_t *payload = p + bitstream->offset;
    if (bitstream_tag == kTagVp8) {
        info.codec = CodecKind::Lossy;
        result.status =
            webpforge::parse_vp8_header(payload, bitstream->size, info.width, info.height);
    } else {
        info.codec = CodecKind::Lossless;
        result.status = webpforge::parse_vp8l_header(payload, bitstream->size, info.width,
                                                     info.height, info.lossless_alpha_hint);
    }
    if (!result.status.ok) {
        return result;
    }

    if (alpha) {
        if (info.codec == CodecKind::Lossless) {
            WF_LOG("warn", "inspect: ALPH chunk next to a VP8L payload is ignored");
        } else {
            info.has_alpha = true;
            info.alpha = alpha;
        }
    }

    WF_LOG("debug", "inspect: codec=" << webpforge::codec_name(info.codec) << " size="
                                      << info.width << "x" << info.height
                                      << " alpha=" << info.has_alpha
                                      << " payload_bytes=" << info.bitstream.size);
    return result;
}

}  // namespace

namespace webpforge {

const char *codec_name(CodecKind codec) {
    return codec == CodecKind::Lossless ? "VP8L" : "VP8";
}

MuxStatus parse_vp8_header(const uint8_t *p, size_t size, uint32_t &width, uint32_t &height) {
    if (size < kVp8FrameHeaderSize) {
        return make_error(MuxError::TruncatedData, "VP8 frame header truncated");
    }
    const uint32_t frame_tag = read_u24le(p);
    const bool key_frame = (frame_tag & 1) == 0;
    const uint32_t profile = (frame_tag >> 1) & 0x7;
    if (!key_frame) {
        return make_error(MuxError::UnsupportedChunk, "VP8 payload is not a key frame");
    }
    if (profile > 3) {
        return make_error(MuxError::UnsupportedChunk,
                          "VP8 profile " + std::to_string(profile) + " is not defined");
    }
    if (p[3] != 0x9D || p[4] != 0x01 || p[5] != 0x2A) {
        return make_error(MuxError::UnsupportedChunk, "VP8 start code missing");
    }
    // Top two bits of each field are the upscaling mode.
    const uint32_t w = read_u16le(p + 6) & 0x3FFF;
    const uint32_t h = read_u16le(p + 8) & 0x3FFF;
    if (w == 0 || h == 0) {
        return make_error(MuxError::UnsupportedChunk, "VP8 header declares a zero dimension");
    }
    width = w;
    height = h;
    return make_ok();
}

MuxStatus parse_vp8l_header(const uint8_t *p, size_t size, uint32_t &width, uint32_t &height,
                            bool &alpha_hint) {
    if (size < kVp8lHeaderSize) {
        return make_error(MuxError::TruncatedData, "VP8L header truncated");
    }
    if (p[0] != kVp8lSignature) {
        return make_error(MuxError::UnsupportedChunk, "VP8L signature byte missing");
    }
    const uint32_t bits = read_u32le(p + 1);
    const uint32_t version = bits >> 29;
    if (version != 0) {
        return make_error(MuxError::UnsupportedChunk,
                          "VP8L version " + std::to_string(version) + " is not supported");
    }
    width = (bits & 0x3FFF) + 1;
    height = ((bits >> 14) & 0x3FFF) + 1;
    alpha_hint = ((bits >> 28) & 1) != 0;
    return make_ok();
}

InspectResult inspect_webp(const std::vector<uint8_t> &data) {
    InspectResult result;
    if (data.size() < kEnvelopeSize || read_fourcc(data.data()) != kTagRiff ||
        read_fourcc(data.data() + 8) != kTagWebp) {
        result.status = make_error(MuxError::MalformedEnvelope, "missing RIFF/WEBP signature");
        return result;
    }
    const uint64_t riff_size = read_u32le(data.data() + 4);
    if (riff_size < 4 || riff_size + kChunkHeaderSize > data.size()) {
        result.status = make_error(MuxError::MalformedEnvelope,
                                   "RIFF size " + std::to_string(riff_size) +
                                       " is inconsistent with " + std::to_string(data.size()) +
                                       " input bytes");
        return result;
    }
    const size_t end = static_cast<size_t>(riff_size + kChunkHeaderSize);
    if (end < data.size()) {
        WF_LOG("warn", "inspect: ignoring " << data.size() - end
                                            << " trailing bytes after the RIFF envelope");
    }
    return walk_chunks(data, kEnvelopeSize, end);
}

InspectResult inspect_webp_chunks(const std::vector<uint8_t> &data) {
    return walk_chunks(data, 0, data.size());
}

}  // namespace webpforge
