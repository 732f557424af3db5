#pragma once

#include "seq/Batch.hpp"
#include <random>
#include <vector>

namespace tapepg::model {

// ============================================================================
// Capabilities
// ============================================================================

/**
 * Log-likelihood of sampled actions under distribution parameters.
 * Both batches share one presence pattern; results hold one value per
 * present lane.
 */
class ActionSpace {
public:
    virtual ~ActionSpace() = default;

    virtual std::vector<float> log_prob(const seq::Batch& params,
                                        const seq::Batch& actions) const = 0;

    /**
     * Vector-Jacobian product of log_prob with respect to params.
     * @param upstream one derivative per present lane
     * @return batch shaped like params
     */
    virtual seq::Batch log_prob_grad(const seq::Batch& params,
                                     const seq::Batch& actions,
                                     const std::vector<float>& upstream) const = 0;
};

class Entropyer {
public:
    virtual ~Entropyer() = default;

    virtual std::vector<float> entropy(const seq::Batch& params) const = 0;

    virtual seq::Batch entropy_grad(const seq::Batch& params,
                                    const std::vector<float>& upstream) const = 0;
};

// ============================================================================
// Softmax (categorical) action space
// ============================================================================

/**
 * Parameters are K logits per lane; actions are one-hot K-vectors.
 */
class Softmax : public ActionSpace, public Entropyer {
public:
    std::vector<float> log_prob(const seq::Batch& params,
                                const seq::Batch& actions) const override;

    seq::Batch log_prob_grad(const seq::Batch& params,
                             const seq::Batch& actions,
                             const std::vector<float>& upstream) const override;

    std::vector<float> entropy(const seq::Batch& params) const override;

    seq::Batch entropy_grad(const seq::Batch& params,
                            const std::vector<float>& upstream) const override;

    // One-hot action per present lane
    seq::Batch sample(const seq::Batch& params, std::mt19937& rng) const;
};

// ============================================================================
// Diagonal Gaussian action space
// ============================================================================

/**
 * Parameters are D means followed by D log standard deviations per lane;
 * actions are D-vectors.
 */
class Gaussian : public ActionSpace, public Entropyer {
public:
    std::vector<float> log_prob(const seq::Batch& params,
                                const seq::Batch& actions) const override;

    seq::Batch log_prob_grad(const seq::Batch& params,
                             const seq::Batch& actions,
                             const std::vector<float>& upstream) const override;

    std::vector<float> entropy(const seq::Batch& params) const override;

    seq::Batch entropy_grad(const seq::Batch& params,
                            const std::vector<float>& upstream) const override;

    seq::Batch sample(const seq::Batch& params, std::mt19937& rng) const;
};

} // namespace tapepg::model
