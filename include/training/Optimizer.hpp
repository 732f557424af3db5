#pragma once

#include "common/Config.hpp"
#include "common/Gradient.hpp"
#include <unordered_map>
#include <vector>

namespace tapepg::training {

// ============================================================================
// Base Optimizer Interface
// ============================================================================

/**
 * Applies gradients of an objective that is being maximized.
 * State is kept per Parameter, created on the first step that touches it.
 */
class Optimizer {
public:
    virtual ~Optimizer() = default;

    /**
     * Perform single optimization step (ascent)
     */
    virtual void step(const Gradient& grad) = 0;

    /**
     * Get/set learning rate
     */
    virtual float get_lr() const = 0;
    virtual void set_lr(float lr) = 0;

    /**
     * Drop all per-parameter state
     */
    virtual void reset() = 0;
};

// ============================================================================
// Adam Optimizer
// ============================================================================

class AdamOptimizer : public Optimizer {
public:
    explicit AdamOptimizer(const AdamConfig& config = {});

    void step(const Gradient& grad) override;

    float get_lr() const override { return config_.lr; }
    void set_lr(float lr) override { config_.lr = lr; }

    void reset() override;

    int step_count() const { return step_count_; }

private:
    struct Moments {
        std::vector<float> m;              // First moment estimate
        std::vector<float> v;              // Second moment estimate
    };

    AdamConfig config_;
    std::unordered_map<const Parameter*, Moments> moments_;
    int step_count_ = 0;
};

// ============================================================================
// SGD with Momentum
// ============================================================================

class SGDOptimizer : public Optimizer {
public:
    explicit SGDOptimizer(const SGDConfig& config = {});

    void step(const Gradient& grad) override;

    float get_lr() const override { return config_.lr; }
    void set_lr(float lr) override { config_.lr = lr; }

    void reset() override { velocity_.clear(); }

private:
    SGDConfig config_;
    std::unordered_map<const Parameter*, std::vector<float>> velocity_;
};

// ============================================================================
// Learning Rate Schedulers
// ============================================================================

class LRScheduler {
public:
    explicit LRScheduler(Optimizer* optimizer);
    virtual ~LRScheduler() = default;

    virtual void step() = 0;
    virtual float get_lr() const { return optimizer_->get_lr(); }

protected:
    Optimizer* optimizer_;
};

class ExponentialLR : public LRScheduler {
public:
    ExponentialLR(Optimizer* optimizer, float gamma);

    void step() override {
        optimizer_->set_lr(optimizer_->get_lr() * gamma_);
    }

private:
    float gamma_;
};

class CosineAnnealingLR : public LRScheduler {
public:
    CosineAnnealingLR(Optimizer* optimizer, int T_max, float eta_min = 0.0f);

    void step() override;

private:
    int T_max_;
    float eta_min_;
    float base_lr_;
    int step_count_;
};

} // namespace tapepg::training
