#pragma once

#include "common/Types.hpp"
#include <string>
#include <filesystem>
#include <stdexcept>

namespace tapepg {

// ============================================================================
// Tape Configuration
// ============================================================================

enum class TapeStorage {
    Reference,    // In-memory batches, full random replay
    Compressed    // 8-bit delta frames, forward replay from checkpoints
};

struct TapeConfig {
    TapeStorage storage = TapeStorage::Reference;

    // Quantization range of the compressed backend
    float range_min = 0.0f;
    float range_max = 255.0f;

    // Steps between keyframes of the compressed backend
    int checkpoint_interval = constants::DEFAULT_CHECKPOINT_INTERVAL;

    bool operator==(const TapeConfig& other) const {
        return storage == other.storage && range_min == other.range_min &&
               range_max == other.range_max &&
               checkpoint_interval == other.checkpoint_interval;
    }
    bool operator!=(const TapeConfig& other) const { return !(*this == other); }

    void validate() const {
        if (!(range_max > range_min)) {
            throw std::invalid_argument("range_max must be greater than range_min");
        }
        if (checkpoint_interval < 1) {
            throw std::invalid_argument("checkpoint_interval must be >= 1");
        }
    }
};

// ============================================================================
// PPO Configuration
// ============================================================================

struct PPOConfig {
    float critic_weight = constants::DEFAULT_CRITIC_WEIGHT;  // 0 selects the default
    float discount = 0.99f;          // Reward discount (gamma)
    float lambda = 0.95f;            // GAE lambda
    float epsilon = constants::DEFAULT_PPO_EPSILON;  // <= 0 selects the default

    // Keep the whole Base output in memory instead of evaluating Base
    // separately for the actor and the critic
    bool pool_base = false;

    bool normalize_advantages = false;

    // Runs between log lines, 0 disables logging
    int log_interval = 0;

    float effective_epsilon() const {
        return epsilon > 0.0f ? epsilon : constants::DEFAULT_PPO_EPSILON;
    }

    float effective_critic_weight() const {
        return critic_weight != 0.0f ? critic_weight : constants::DEFAULT_CRITIC_WEIGHT;
    }

    void validate() const {
        if (!(discount > 0.0f && discount <= 1.0f)) {
            throw std::invalid_argument("discount must be in (0, 1]");
        }
        if (!(lambda >= 0.0f && lambda <= 1.0f)) {
            throw std::invalid_argument("lambda must be in [0, 1]");
        }
        if (epsilon >= 1.0f) {
            throw std::invalid_argument("epsilon must be < 1");
        }
        if (critic_weight < 0.0f) {
            throw std::invalid_argument("critic_weight must be >= 0");
        }
        if (log_interval < 0) {
            throw std::invalid_argument("log_interval must be >= 0");
        }
    }
};

// ============================================================================
// Optimizer Configuration
// ============================================================================

struct AdamConfig {
    float lr = 3e-4f;
    float beta1 = 0.9f;
    float beta2 = 0.999f;
    float eps = 1e-8f;
    float weight_decay = 0.0f;

    void validate() const {
        if (lr <= 0.0f) {
            throw std::invalid_argument("adam lr must be > 0");
        }
        if (beta1 < 0.0f || beta1 >= 1.0f || beta2 < 0.0f || beta2 >= 1.0f) {
            throw std::invalid_argument("adam betas must be in [0, 1)");
        }
        if (eps <= 0.0f) {
            throw std::invalid_argument("adam eps must be > 0");
        }
    }
};

struct SGDConfig {
    float lr = 1e-3f;
    float momentum = 0.9f;
    float weight_decay = 0.0f;
    bool nesterov = false;

    void validate() const {
        if (lr <= 0.0f) {
            throw std::invalid_argument("sgd lr must be > 0");
        }
        if (momentum < 0.0f) {
            throw std::invalid_argument("sgd momentum must be >= 0");
        }
        if (nesterov && momentum == 0.0f) {
            throw std::invalid_argument("nesterov requires momentum > 0");
        }
    }
};

// ============================================================================
// Master Configuration
// ============================================================================

struct Config {
    PPOConfig ppo;
    TapeConfig input_tape;           // Storage of observation tapes
    AdamConfig adam;
    SGDConfig sgd;

    std::string optimizer = "adam";  // "adam" or "sgd"

    // Logging
    std::string log_level = "INFO";  // DEBUG, INFO, WARNING, ERROR

    // Load from file; keys that are absent keep their defaults
    static Config from_json(const std::filesystem::path& path);

    // Save to file
    void to_json(const std::filesystem::path& path) const;

    void validate() const {
        ppo.validate();
        input_tape.validate();
        if (optimizer == "adam") {
            adam.validate();
        } else if (optimizer == "sgd") {
            sgd.validate();
        } else {
            throw std::invalid_argument("Unknown optimizer: " + optimizer);
        }
    }
};

} // namespace tapepg
