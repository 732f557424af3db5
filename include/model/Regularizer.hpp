#pragma once

#include "model/ActionSpace.hpp"

namespace tapepg::model {

/**
 * Per-lane bonus added to the objective, typically to encourage exploration.
 */
class Regularizer {
public:
    virtual ~Regularizer() = default;

    virtual std::vector<float> regularize(const seq::Batch& params) const = 0;

    // Vector-Jacobian product with respect to params
    virtual seq::Batch regularize_grad(const seq::Batch& params,
                                       const std::vector<float>& upstream) const = 0;
};

// coeff * entropy of the action distribution
class EntropyRegularizer : public Regularizer {
public:
    EntropyRegularizer(const Entropyer& entropyer, float coeff)
        : entropyer_(entropyer), coeff_(coeff) {}

    std::vector<float> regularize(const seq::Batch& params) const override {
        auto h = entropyer_.entropy(params);
        for (float& v : h) {
            v *= coeff_;
        }
        return h;
    }

    seq::Batch regularize_grad(const seq::Batch& params,
                               const std::vector<float>& upstream) const override {
        std::vector<float> scaled(upstream);
        for (float& v : scaled) {
            v *= coeff_;
        }
        return entropyer_.entropy_grad(params, scaled);
    }

private:
    const Entropyer& entropyer_;
    float coeff_;
};

} // namespace tapepg::model
