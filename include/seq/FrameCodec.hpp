#pragma once

#include "seq/Batch.hpp"
#include <cstdint>
#include <vector>

namespace tapepg::seq {

// ============================================================================
// Encoded Frame
// ============================================================================

struct EncodedFrame {
    LaneMask present;
    int width = 1;
    bool keyframe = false;
    std::vector<uint8_t> bytes;      // (run length, delta) pairs
};

// ============================================================================
// 8-bit Delta Frame Codec
// ============================================================================

/**
 * Lossy codec for observation frames.
 *
 * Values are quantized to 256 levels over [range_min, range_max], coded as the
 * difference (mod 256) from the same lane's previous step and run-length
 * encoded. A keyframe resets the per-lane history to zero so decoding can
 * start there. Values on the quantization grid round-trip exactly.
 */
class FrameEncoder {
public:
    FrameEncoder(float range_min, float range_max);

    EncodedFrame encode(const Batch& batch, bool keyframe);

private:
    float range_min_;
    float range_max_;
    std::vector<uint8_t> history_;   // [lane * width + i]
};

class FrameDecoder {
public:
    FrameDecoder(float range_min, float range_max);

    Batch decode(const EncodedFrame& frame);

    // Forget lane history; the next frame must be a keyframe
    void reset();

private:
    float range_min_;
    float range_max_;
    bool primed_ = false;
    std::vector<uint8_t> history_;
};

} // namespace tapepg::seq
