#pragma once

#include "seq/Rereader.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace tapepg::model {

// ============================================================================
// Affine Layer
// ============================================================================

/**
 * y = W x + b applied to every present lane of every step.
 * W is [out_features, in_features], row-major.
 */
class Affine : public seq::SeqFunc {
public:
    Affine(int in_features, int out_features, uint32_t seed = 42);

    seq::RereaderPtr apply(const seq::RereaderPtr& in) override;

    Parameter& weights() { return weights_; }
    Parameter& bias() { return bias_; }

    std::vector<Parameter*> parameters() { return {&weights_, &bias_}; }

    int in_features() const { return in_features_; }
    int out_features() const { return out_features_; }

    /**
     * Forward pass for one packed block
     * @param input [rows, in_features]
     * @param output [rows, out_features]
     */
    void forward(const float* input, float* output, int rows) const;

private:
    int in_features_;
    int out_features_;
    Parameter weights_;
    Parameter bias_;

    void initialize_weights(uint32_t seed);
};

// ============================================================================
// Tanh
// ============================================================================

class Tanh : public seq::SeqFunc {
public:
    seq::RereaderPtr apply(const seq::RereaderPtr& in) override;
};

// ============================================================================
// Chain
// ============================================================================

// Applies its functions in order; does not own them
class Chain : public seq::SeqFunc {
public:
    explicit Chain(std::vector<seq::SeqFunc*> funcs) : funcs_(std::move(funcs)) {}

    seq::RereaderPtr apply(const seq::RereaderPtr& in) override;

private:
    std::vector<seq::SeqFunc*> funcs_;
};

} // namespace tapepg::model
