#include "seq/FrameCodec.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace tapepg::seq {

namespace {

constexpr int MAX_LEVEL = constants::QUANT_LEVELS - 1;

uint8_t quantize(float v, float lo, float hi) {
    float scaled = (v - lo) / (hi - lo) * MAX_LEVEL;
    float rounded = std::round(std::clamp(scaled, 0.0f, static_cast<float>(MAX_LEVEL)));
    return static_cast<uint8_t>(rounded);
}

float dequantize(uint8_t q, float lo, float hi) {
    return lo + (hi - lo) * static_cast<float>(q) / MAX_LEVEL;
}

// Run-length pairs: [count (1..255), value]
void append_runs(std::vector<uint8_t>& out, const std::vector<uint8_t>& symbols) {
    std::size_t i = 0;
    while (i < symbols.size()) {
        uint8_t value = symbols[i];
        std::size_t run = 1;
        while (i + run < symbols.size() && symbols[i + run] == value && run < 255) {
            ++run;
        }
        out.push_back(static_cast<uint8_t>(run));
        out.push_back(value);
        i += run;
    }
}

std::vector<uint8_t> expand_runs(const std::vector<uint8_t>& bytes, std::size_t expected) {
    if (bytes.size() % 2 != 0) {
        throw std::invalid_argument("Corrupt frame: odd run-length payload");
    }

    std::vector<uint8_t> symbols;
    symbols.reserve(expected);
    for (std::size_t i = 0; i < bytes.size(); i += 2) {
        symbols.insert(symbols.end(), static_cast<std::size_t>(bytes[i]), bytes[i + 1]);
    }
    if (symbols.size() != expected) {
        throw std::invalid_argument("Corrupt frame: decoded " + std::to_string(symbols.size()) +
                                    " values, expected " + std::to_string(expected));
    }
    return symbols;
}

void check_history(std::vector<uint8_t>& history, const LaneMask& present, int width,
                   bool keyframe) {
    std::size_t size = present.size() * static_cast<std::size_t>(width);
    if (keyframe) {
        history.assign(size, 0);
    } else if (history.size() != size) {
        throw std::invalid_argument("Frame shape changed without a keyframe");
    }
}

} // namespace

// ============================================================================
// Encoder
// ============================================================================

FrameEncoder::FrameEncoder(float range_min, float range_max)
    : range_min_(range_min), range_max_(range_max) {
    if (!(range_max > range_min)) {
        throw std::invalid_argument("range_max must be greater than range_min");
    }
}

EncodedFrame FrameEncoder::encode(const Batch& batch, bool keyframe) {
    const int width = batch.width();
    for (float v : batch.packed()) {
        if (std::isnan(v)) {
            throw std::invalid_argument("Cannot quantize NaN");
        }
    }
    check_history(history_, batch.present(), width, keyframe);

    std::vector<uint8_t> deltas;
    deltas.reserve(batch.packed().size());

    auto src = batch.packed().begin();
    for (int lane = 0; lane < batch.num_lanes(); ++lane) {
        if (!batch.present()[lane]) {
            continue;
        }
        uint8_t* prev = &history_[static_cast<std::size_t>(lane) * width];
        for (int i = 0; i < width; ++i, ++src) {
            uint8_t q = quantize(*src, range_min_, range_max_);
            deltas.push_back(static_cast<uint8_t>(q - prev[i]));
            prev[i] = q;
        }
    }

    EncodedFrame frame;
    frame.present = batch.present();
    frame.width = width;
    frame.keyframe = keyframe;
    append_runs(frame.bytes, deltas);
    return frame;
}

// ============================================================================
// Decoder
// ============================================================================

FrameDecoder::FrameDecoder(float range_min, float range_max)
    : range_min_(range_min), range_max_(range_max) {
    if (!(range_max > range_min)) {
        throw std::invalid_argument("range_max must be greater than range_min");
    }
}

void FrameDecoder::reset() {
    primed_ = false;
    history_.clear();
}

Batch FrameDecoder::decode(const EncodedFrame& frame) {
    if (!primed_ && !frame.keyframe) {
        throw std::logic_error("Decoding must start at a keyframe");
    }
    check_history(history_, frame.present, frame.width, frame.keyframe);
    primed_ = true;

    const int width = frame.width;
    const int num_present = count_present(frame.present);
    auto deltas = expand_runs(frame.bytes, static_cast<std::size_t>(num_present) * width);

    std::vector<float> packed;
    packed.reserve(deltas.size());

    auto src = deltas.begin();
    for (std::size_t lane = 0; lane < frame.present.size(); ++lane) {
        if (!frame.present[lane]) {
            continue;
        }
        uint8_t* prev = &history_[lane * width];
        for (int i = 0; i < width; ++i, ++src) {
            prev[i] = static_cast<uint8_t>(prev[i] + *src);
            packed.push_back(dequantize(prev[i], range_min_, range_max_));
        }
    }
    return Batch(frame.present, width, std::move(packed));
}

} // namespace tapepg::seq
