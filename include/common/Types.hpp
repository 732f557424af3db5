#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tapepg {

using LaneIndex = int32_t;

using StepIndex = std::size_t;

// Presence of every lane at one time step.
using LaneMask = std::vector<bool>;

namespace constants {

    constexpr float DEFAULT_PPO_EPSILON = 0.2f;

    constexpr float DEFAULT_CRITIC_WEIGHT = 1.0f;

    constexpr float NORMALIZE_EPSILON = 1e-8f;

    constexpr int DEFAULT_CHECKPOINT_INTERVAL = 32;

    constexpr int QUANT_LEVELS = 256;

}

} // namespace tapepg
