#pragma once

#include "common/Types.hpp"
#include <vector>

namespace tapepg::seq {

/**
 * One time step across a fixed number of lanes.
 *
 * Only present lanes carry values: packed() holds width() values for each
 * present lane, in lane order. Absent lanes are never materialized.
 */
class Batch {
public:
    Batch() = default;

    Batch(LaneMask present, int width, std::vector<float> packed);

    // One value per present lane
    static Batch scalars(LaneMask present, std::vector<float> packed) {
        return Batch(std::move(present), 1, std::move(packed));
    }

    // All-absent batch
    static Batch absent(int num_lanes, int width);

    const LaneMask& present() const { return present_; }
    bool is_present(LaneIndex lane) const;

    int width() const { return width_; }
    int num_lanes() const { return static_cast<int>(present_.size()); }
    int num_present() const { return num_present_; }

    const std::vector<float>& packed() const { return packed_; }
    std::vector<float>& packed() { return packed_; }

    // Packed row index of lane, or -1 when the lane is absent
    int packed_index(LaneIndex lane) const;

    bool same_presence(const Batch& other) const { return present_ == other.present_; }

    /**
     * Re-pack onto a superset mask; lanes absent here become zeros.
     * Throws if a lane present here is absent in mask.
     */
    Batch expand(const LaneMask& mask) const;

    /**
     * Re-pack onto a subset mask, dropping lanes absent in mask.
     * Throws if mask contains a lane absent here.
     */
    Batch reduce(const LaneMask& mask) const;

    Batch scaled(float factor) const;

    // Lane-wise concatenation; every batch must share one width
    static Batch concat_lanes(const std::vector<Batch>& batches);

private:
    LaneMask present_;
    int width_ = 1;
    int num_present_ = 0;
    std::vector<float> packed_;
};

int count_present(const LaneMask& mask);

} // namespace tapepg::seq
