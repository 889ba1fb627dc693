// Animator lifecycle coverage: parameter validation, frame admission, finish semantics and
// file output.
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "webpforge.hpp"
#include "test_utils.hpp"

using webpforge::AnimationParams;
using webpforge::Animator;
using webpforge::BlendMethod;
using webpforge::DisposalMethod;
using webpforge::FrameRect;
using webpforge::MuxError;
using webpforge::MuxStatus;
using test_utils::get_u24le;
using test_utils::get_u32le;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[animator_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

AnimationParams params(uint32_t w, uint32_t h) {
    AnimationParams p;
    p.canvas_width = w;
    p.canvas_height = h;
    p.background_bgra = {255, 255, 255, 255};
    p.loop_count = 0;
    return p;
}

bool test_create_validation() {
    MuxStatus st;
    bool ok = check(Animator::create(params(64, 64), &st).has_value() && st.ok, "64x64 accepted");
    ok &= check(Animator::create(params(1, 1)).has_value(), "1x1 accepted");
    ok &= check(Animator::create(params(16384, 16384)).has_value(), "16384 accepted");

    ok &= check(!Animator::create(params(0, 10), &st) && st.error == MuxError::InvalidParams,
                "zero width rejected");
    ok &= check(!Animator::create(params(10, 0), &st) && st.error == MuxError::InvalidParams,
                "zero height rejected");
    ok &= check(!Animator::create(params(16385, 10), &st) && st.error == MuxError::InvalidParams,
                "oversized width rejected");

    auto looped = params(8, 8);
    looped.loop_count = 65535;
    ok &= check(Animator::create(looped).has_value(), "max loop count accepted");
    looped.loop_count = 65536;
    ok &= check(!Animator::create(looped, &st) && st.error == MuxError::InvalidParams,
                "loop count above 16 bits rejected");
    return ok;
}

bool test_add_frame_errors() {
    auto anim = Animator::create(params(20, 20));
    if (!check(anim.has_value(), "animator created")) {
        return false;
    }
    auto st = anim->add_frame(test_utils::lossless_webp(10, 10), FrameRect{1, 0, 10, 10}, 10);
    bool ok = check(st.error == MuxError::UnalignedOffset, "odd x rejected");
    st = anim->add_frame(test_utils::lossless_webp(10, 10), FrameRect{0, 0, 12, 10}, 10);
    ok &= check(st.error == MuxError::PlacementSizeMismatch, "placement size mismatch");
    st = anim->add_frame(test_utils::lossless_webp(10, 10), std::nullopt, 10);
    ok &= check(st.error == MuxError::FrameCanvasMismatch, "full-canvas size mismatch");
    st = anim->add_frame(test_utils::lossless_webp(10, 10), FrameRect{12, 0, 10, 10}, 10);
    ok &= check(st.error == MuxError::FrameOutOfBounds, "frame past right edge");
    st = anim->add_frame({1, 2, 3}, std::nullopt, 10);
    ok &= check(st.error == MuxError::MalformedEnvelope, "garbage input rejected");
    ok &= check(anim->frame_count() == 0, "failed calls recorded nothing");

    st = anim->add_frame(test_utils::lossless_webp(10, 10), FrameRect{10, 10, 10, 10}, 10);
    ok &= check(st.ok && anim->frame_count() == 1, "frame flush with corner accepted");
    ok &= check(anim->frames()[0].placement == FrameRect{10, 10, 10, 10}, "placement recorded");
    return ok;
}

bool test_empty_finish_stays_building() {
    auto anim = Animator::create(params(8, 8));
    std::ostringstream os;
    auto st = anim->finish(os);
    bool ok = check(st.error == MuxError::EmptyAnimation, "empty animation rejected");
    ok &= check(!anim->is_finished() && os.str().empty(), "still building, nothing written");
    ok &= check(anim->add_frame(test_utils::lossless_webp(8, 8), std::nullopt, 10).ok,
                "frames still accepted");
    ok &= check(anim->finish(os).ok && anim->is_finished(), "finish after adding a frame");
    return ok;
}

bool test_finish_once() {
    auto anim = Animator::create(params(64, 64));
    bool ok = check(anim->add_frame(test_utils::lossless_webp(64, 64), std::nullopt, 500).ok,
                    "frame 1");
    ok &= check(anim->add_frame(test_utils::lossy_webp(64, 64), std::nullopt, 500).ok, "frame 2");
    std::ostringstream os;
    auto st = anim->finish(os);
    ok &= check(st.ok, "finish: " + st.message);
    const std::string bytes = os.str();
    ok &= check(bytes.size() > 12 && bytes.compare(0, 4, "RIFF") == 0, "RIFF output");

    std::ostringstream again;
    st = anim->finish(again);
    ok &= check(st.error == MuxError::AlreadyFinished && again.str().empty(), "second finish");
    st = anim->add_frame(test_utils::lossless_webp(64, 64), std::nullopt, 500);
    ok &= check(st.error == MuxError::AlreadyFinished, "add after finish");
    st = anim->set_exif_metadata({1, 2});
    ok &= check(st.error == MuxError::AlreadyFinished, "metadata after finish");
    return ok;
}

bool test_io_error_spends_animator() {
    auto anim = Animator::create(params(8, 8));
    bool ok = check(anim->add_frame(test_utils::lossless_webp(8, 8), std::nullopt, 10).ok,
                    "frame added");
    std::ostringstream broken;
    broken.setstate(std::ios::badbit);
    auto st = anim->finish(broken);
    ok &= check(st.error == MuxError::IoError, "sink failure reported");
    ok &= check(anim->is_finished(), "animator finished after sink failure");
    std::ostringstream os;
    ok &= check(anim->finish(os).error == MuxError::AlreadyFinished, "no retry after IoError");
    return ok;
}

bool test_bare_chunks_and_metadata() {
    auto anim = Animator::create(params(12, 12));
    std::vector<uint8_t> chunks;
    test_utils::append_chunk(chunks, "VP8L", test_utils::make_vp8l(12, 12));
    bool ok = check(anim->add_frame_chunks(chunks, std::nullopt, 33).ok, "bare chunks accepted");
    ok &= check(anim->add_frame_chunks(test_utils::lossless_webp(12, 12), std::nullopt, 33)
                        .error == MuxError::UnsupportedChunk,
                "RIFF file is not a bare chunk stream");

    ok &= check(anim->set_icc_profile({9, 9, 9}).ok, "icc set");
    ok &= check(anim->set_xmp_metadata({7}).ok, "xmp set");
    ok &= check(anim->set_xmp_metadata({}).ok, "xmp cleared");

    std::ostringstream os;
    ok &= check(anim->finish(os).ok, "finish");
    const std::string s = os.str();
    const std::vector<uint8_t> buf(s.begin(), s.end());
    auto top = test_utils::walk(buf, 12, buf.size());
    ok &= check(top && top->size() == 4, "VP8X ICCP ANIM ANMF");
    if (top && top->size() == 4) {
        ok &= check((*top)[1].tag == "ICCP", "ICCP after VP8X");
        ok &= check(buf[(*top)[0].offset] == 0x22, "ICC and animation flags only");
        ok &= check(get_u24le(buf.data() + (*top)[3].offset + 12) == 33, "duration stored");
    }
    return ok;
}

bool test_finish_to_file() {
    const auto path = std::filesystem::temp_directory_path() / "webpforge_animator_unit.webp";
    std::filesystem::remove(path);

    auto anim = Animator::create(params(16, 16));
    bool ok = check(anim->finish_to_file(path.string()).error == MuxError::EmptyAnimation,
                    "empty animation not written");
    ok &= check(!std::filesystem::exists(path), "no file for empty animation");

    ok &= check(anim->add_frame(test_utils::lossy_alpha_webp(16, 16), std::nullopt, 80).ok,
                "alpha frame added");
    auto st = anim->finish_to_file("/nonexistent-webpforge-dir/out.webp");
    ok &= check(st.error == MuxError::IoError && !anim->is_finished(),
                "unopenable path keeps animator building");

    st = anim->finish_to_file(path.string());
    ok &= check(st.ok, "written to file: " + st.message);
    auto bytes = test_utils::read_all(path);
    ok &= check(bytes && bytes->size() > 12, "file readable");
    if (bytes && bytes->size() > 20) {
        ok &= check(get_u32le(bytes->data() + 4) == bytes->size() - 8, "envelope size");
        ok &= check(((*bytes)[20] & 0x10) != 0, "alpha flag set from frame content");
    }
    std::filesystem::remove(path);
    return ok;
}

// A frame whose declared size cannot fit the 32-bit envelope.
webpforge::FrameRecord oversized_record() {
    webpforge::FrameRecord record;
    record.payload = test_utils::make_vp8l(16, 16);
    record.info.codec = webpforge::CodecKind::Lossless;
    record.info.bitstream = webpforge::ChunkSpan{0, 0xFFFFFFF0u};
    record.info.width = 16;
    record.info.height = 16;
    record.placement = FrameRect{0, 0, 16, 16};
    record.duration_ms = 10;
    return record;
}

bool test_overflow_keeps_existing_file() {
    const auto path = std::filesystem::temp_directory_path() / "webpforge_overflow_unit.webp";
    const std::vector<uint8_t> previous = {'k', 'e', 'e', 'p'};
    test_utils::write_temp_file(previous, path.filename().string());

    auto anim = Animator::create(params(16, 16));
    anim->add_record_for_test(oversized_record());

    std::ostringstream os;
    auto st = anim->finish(os);
    bool ok = check(st.error == MuxError::SizeOverflow, "oversized frame rejected by finish");
    ok &= check(os.str().empty() && !anim->is_finished(), "sink untouched, still building");

    st = anim->finish_to_file(path.string());
    ok &= check(st.error == MuxError::SizeOverflow, "oversized frame rejected by finish_to_file");
    ok &= check(!anim->is_finished(), "still building after file overflow");
    auto bytes = test_utils::read_all(path);
    ok &= check(bytes && *bytes == previous, "existing output file left intact");
    std::filesystem::remove(path);
    return ok;
}

bool test_move() {
    auto anim = Animator::create(params(8, 8));
    bool ok = check(anim->add_frame(test_utils::lossless_webp(8, 8), std::nullopt, 10).ok,
                    "frame added");
    Animator moved = std::move(*anim);
    ok &= check(moved.frame_count() == 1 && moved.params().canvas_width == 8,
                "state travels with move");
    std::ostringstream os;
    ok &= check(moved.finish(os).ok, "moved animator finishes");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_create_validation();
    ok &= test_add_frame_errors();
    ok &= test_empty_finish_stays_building();
    ok &= test_finish_once();
    ok &= test_io_error_spends_animator();
    ok &= test_bare_chunks_and_metadata();
    ok &= test_finish_to_file();
    ok &= test_overflow_keeps_existing_file();
    ok &= test_move();
    return ok ? 0 : 1;
}
