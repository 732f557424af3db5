#include "seq/Batch.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace tapepg::seq {

int count_present(const LaneMask& mask) {
    return static_cast<int>(std::count(mask.begin(), mask.end(), true));
}

Batch::Batch(LaneMask present, int width, std::vector<float> packed)
    : present_(std::move(present))
    , width_(width)
    , num_present_(count_present(present_))
    , packed_(std::move(packed)) {

    if (width_ < 1) {
        throw std::invalid_argument("Batch width must be >= 1");
    }
    std::size_t expected = static_cast<std::size_t>(num_present_) * width_;
    if (packed_.size() != expected) {
        throw std::invalid_argument("Packed size " + std::to_string(packed_.size()) +
                                    " does not match " + std::to_string(num_present_) +
                                    " present lanes of width " + std::to_string(width_));
    }
}

Batch Batch::absent(int num_lanes, int width) {
    return Batch(LaneMask(num_lanes, false), width, {});
}

bool Batch::is_present(LaneIndex lane) const {
    if (lane < 0 || lane >= num_lanes()) {
        throw std::out_of_range("Lane index out of range: " + std::to_string(lane));
    }
    return present_[lane];
}

int Batch::packed_index(LaneIndex lane) const {
    if (!is_present(lane)) {
        return -1;
    }
    return static_cast<int>(std::count(present_.begin(), present_.begin() + lane, true));
}

Batch Batch::expand(const LaneMask& mask) const {
    if (mask.size() != present_.size()) {
        throw std::invalid_argument("Lane count mismatch in expand");
    }

    std::vector<float> out;
    out.reserve(static_cast<std::size_t>(count_present(mask)) * width_);

    auto src = packed_.begin();
    for (std::size_t lane = 0; lane < mask.size(); ++lane) {
        if (present_[lane]) {
            if (!mask[lane]) {
                throw std::invalid_argument("expand: mask drops present lane " +
                                            std::to_string(lane));
            }
            out.insert(out.end(), src, src + width_);
            src += width_;
        } else if (mask[lane]) {
            out.insert(out.end(), static_cast<std::size_t>(width_), 0.0f);
        }
    }
    return Batch(mask, width_, std::move(out));
}

Batch Batch::reduce(const LaneMask& mask) const {
    if (mask.size() != present_.size()) {
        throw std::invalid_argument("Lane count mismatch in reduce");
    }

    std::vector<float> out;
    out.reserve(static_cast<std::size_t>(count_present(mask)) * width_);

    auto src = packed_.begin();
    for (std::size_t lane = 0; lane < mask.size(); ++lane) {
        if (mask[lane] && !present_[lane]) {
            throw std::invalid_argument("reduce: mask contains absent lane " +
                                        std::to_string(lane));
        }
        if (present_[lane]) {
            if (mask[lane]) {
                out.insert(out.end(), src, src + width_);
            }
            src += width_;
        }
    }
    return Batch(mask, width_, std::move(out));
}

Batch Batch::scaled(float factor) const {
    Batch out = *this;
    for (float& v : out.packed_) {
        v *= factor;
    }
    return out;
}

Batch Batch::concat_lanes(const std::vector<Batch>& batches) {
    if (batches.empty()) {
        throw std::invalid_argument("concat_lanes: no batches");
    }

    int width = batches.front().width();
    LaneMask present;
    std::vector<float> packed;
    for (const auto& b : batches) {
        if (b.width() != width) {
            throw std::invalid_argument("concat_lanes: width mismatch");
        }
        present.insert(present.end(), b.present().begin(), b.present().end());
        packed.insert(packed.end(), b.packed().begin(), b.packed().end());
    }
    return Batch(std::move(present), width, std::move(packed));
}

} // namespace tapepg::seq
