// Unit coverage for the frame ledger: placement resolution, validation order, append-only
// bookkeeping.
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "frame_ledger.hpp"
#include "test_utils.hpp"

using webpforge::BlendMethod;
using webpforge::DisposalMethod;
using webpforge::FrameLedger;
using webpforge::FrameRect;
using webpforge::MuxError;
using webpforge::PayloadFraming;
using webpforge::resolve_placement;
using webpforge::WebPInfo;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        fprintf(stderr, "[ledger_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

WebPInfo info_of(uint32_t w, uint32_t h) {
    WebPInfo info;
    info.width = w;
    info.height = h;
    return info;
}

MuxError placement_error(const WebPInfo &info, const std::optional<FrameRect> &rect,
                         uint32_t cw = 100, uint32_t ch = 80) {
    FrameRect out{};
    return resolve_placement(info, rect, cw, ch, out).error;
}

bool test_resolve_full_canvas() {
    FrameRect out{};
    auto st = resolve_placement(info_of(100, 80), std::nullopt, 100, 80, out);
    bool ok = check(st.ok, "full-canvas frame accepted");
    ok &= check(out == FrameRect{0, 0, 100, 80}, "full-canvas rectangle");
    ok &= check(placement_error(info_of(50, 80), std::nullopt) == MuxError::FrameCanvasMismatch,
                "full-canvas size mismatch");
    return ok;
}

bool test_resolve_explicit() {
    FrameRect out{};
    auto st = resolve_placement(info_of(20, 10), FrameRect{80, 70, 20, 10}, 100, 80, out);
    bool ok = check(st.ok && out == FrameRect{80, 70, 20, 10}, "flush with bottom-right corner");

    ok &= check(placement_error(info_of(20, 10), FrameRect{0, 0, 22, 10}) ==
                    MuxError::PlacementSizeMismatch,
                "width differs from bitstream");
    ok &= check(placement_error(info_of(20, 10), FrameRect{0, 0, 20, 12}) ==
                    MuxError::PlacementSizeMismatch,
                "height differs from bitstream");
    ok &= check(placement_error(info_of(20, 10), FrameRect{1, 0, 20, 10}) ==
                    MuxError::UnalignedOffset,
                "odd x");
    ok &= check(placement_error(info_of(20, 10), FrameRect{0, 3, 20, 10}) ==
                    MuxError::UnalignedOffset,
                "odd y");
    ok &= check(placement_error(info_of(20, 10), FrameRect{82, 0, 20, 10}) ==
                    MuxError::FrameOutOfBounds,
                "x + width beyond canvas");
    ok &= check(placement_error(info_of(20, 10), FrameRect{0, 72, 20, 10}) ==
                    MuxError::FrameOutOfBounds,
                "y + height beyond canvas");
    ok &= check(placement_error(info_of(20, 10), FrameRect{0xFFFFFFFE, 0, 20, 10}) ==
                    MuxError::FrameOutOfBounds,
                "offset near 2^32 does not wrap");
    // Parity is reported even when the rectangle would also be out of bounds.
    ok &= check(placement_error(info_of(20, 10), FrameRect{91, 0, 20, 10}) ==
                    MuxError::UnalignedOffset,
                "odd offset reported before bounds");
    return ok;
}

bool test_append_order_and_state() {
    FrameLedger ledger(16, 16);
    bool ok = check(ledger.empty(), "new ledger empty");

    auto st = ledger.append(test_utils::lossless_webp(16, 16), std::nullopt, 100,
                            DisposalMethod::None, BlendMethod::AlphaBlend);
    ok &= check(st.ok, "first frame appended");
    st = ledger.append(test_utils::lossy_alpha_webp(8, 8), FrameRect{4, 6, 8, 8}, 200,
                       DisposalMethod::ClearToBackground, BlendMethod::NoBlend);
    ok &= check(st.ok, "second frame appended");

    // Failures record nothing.
    st = ledger.append(test_utils::lossless_webp(8, 8), std::nullopt, 300,
                       DisposalMethod::None, BlendMethod::NoBlend);
    ok &= check(!st.ok && st.error == MuxError::FrameCanvasMismatch, "canvas mismatch");
    st = ledger.append({'n', 'o', 'p', 'e'}, std::nullopt, 300, DisposalMethod::None,
                       BlendMethod::NoBlend);
    ok &= check(!st.ok && st.error == MuxError::MalformedEnvelope, "inspector error propagated");
    ok &= check(ledger.size() == 2, "failed appends left no record");

    const auto &frames = ledger.frames();
    ok &= check(frames[0].duration_ms == 100 && frames[1].duration_ms == 200, "append order kept");
    ok &= check(frames[0].placement == FrameRect{0, 0, 16, 16}, "default placement");
    ok &= check(frames[1].placement == FrameRect{4, 6, 8, 8}, "explicit placement");
    ok &= check(frames[0].disposal == DisposalMethod::None &&
                    frames[0].blend == BlendMethod::AlphaBlend,
                "disposal/blend stored");
    ok &= check(frames[1].info.has_alpha, "alpha inspected");
    ok &= check(ledger.any_alpha(), "ledger sees alpha frame");
    ok &= check(frames[0].payload == test_utils::lossless_webp(16, 16), "payload unmodified");
    return ok;
}

bool test_append_bare_chunks() {
    FrameLedger ledger(12, 12);
    std::vector<uint8_t> chunks;
    test_utils::append_chunk(chunks, "VP8L", test_utils::make_vp8l(12, 12));
    auto st = ledger.append(chunks, std::nullopt, 40, DisposalMethod::None, BlendMethod::NoBlend,
                            PayloadFraming::BareChunks);
    bool ok = check(st.ok, "bare chunk frame appended");
    ok &= check(ledger.frames()[0].info.bitstream.offset == 8, "span relative to bare chunks");

    st = ledger.append(chunks, std::nullopt, 40, DisposalMethod::None, BlendMethod::NoBlend,
                       PayloadFraming::RiffFile);
    ok &= check(!st.ok && st.error == MuxError::MalformedEnvelope,
                "bare chunks rejected as RIFF file");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_resolve_full_canvas();
    ok &= test_resolve_explicit();
    ok &= test_append_order_and_state();
    ok &= test_append_bare_chunks();
    return ok ? 0 : 1;
}
