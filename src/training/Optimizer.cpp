#include "training/Optimizer.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tapepg::training {

namespace {

constexpr double PI = 3.14159265358979323846;

} // namespace

// ============================================================================
// Adam Optimizer Implementation
// ============================================================================

AdamOptimizer::AdamOptimizer(const AdamConfig& config) : config_(config) {
    config_.validate();
}

void AdamOptimizer::reset() {
    moments_.clear();
    step_count_ = 0;
}

void AdamOptimizer::step(const Gradient& grad) {
    step_count_++;

    float bias_correction1 = 1.0f - std::pow(config_.beta1, step_count_);
    float bias_correction2 = 1.0f - std::pow(config_.beta2, step_count_);

    for (const auto& entry : grad) {
        auto& params = entry.param->data();
        const auto& grads = entry.values;

        auto& state = moments_[entry.param];
        if (state.m.size() != params.size()) {
            state.m.assign(params.size(), 0.0f);
            state.v.assign(params.size(), 0.0f);
        }

        for (std::size_t i = 0; i < params.size(); ++i) {
            float g = grads[i];

            // Weight decay pulls towards zero against the ascent direction
            if (config_.weight_decay > 0) {
                g -= config_.weight_decay * params[i];
            }

            // Update biased first moment estimate
            state.m[i] = config_.beta1 * state.m[i] + (1 - config_.beta1) * g;

            // Update biased second raw moment estimate
            state.v[i] = config_.beta2 * state.v[i] + (1 - config_.beta2) * g * g;

            // Compute bias-corrected moment estimates
            float m_hat = state.m[i] / bias_correction1;
            float v_hat = state.v[i] / bias_correction2;

            params[i] += config_.lr * m_hat / (std::sqrt(v_hat) + config_.eps);
        }
    }
}

// ============================================================================
// SGD Optimizer Implementation
// ============================================================================

SGDOptimizer::SGDOptimizer(const SGDConfig& config) : config_(config) {
    config_.validate();
}

void SGDOptimizer::step(const Gradient& grad) {
    for (const auto& entry : grad) {
        auto& params = entry.param->data();
        const auto& grads = entry.values;

        auto& velocity = velocity_[entry.param];
        if (velocity.size() != params.size()) {
            velocity.assign(params.size(), 0.0f);
        }

        for (std::size_t i = 0; i < params.size(); ++i) {
            float g = grads[i];

            if (config_.weight_decay > 0) {
                g -= config_.weight_decay * params[i];
            }

            velocity[i] = config_.momentum * velocity[i] + g;

            if (config_.nesterov) {
                params[i] += config_.lr * (g + config_.momentum * velocity[i]);
            } else {
                params[i] += config_.lr * velocity[i];
            }
        }
    }
}

// ============================================================================
// Learning Rate Schedulers
// ============================================================================

LRScheduler::LRScheduler(Optimizer* optimizer) : optimizer_(optimizer) {
    if (!optimizer_) {
        throw std::invalid_argument("LRScheduler: null optimizer");
    }
}

ExponentialLR::ExponentialLR(Optimizer* optimizer, float gamma)
    : LRScheduler(optimizer), gamma_(gamma) {
    if (gamma <= 0.0f) {
        throw std::invalid_argument("ExponentialLR: gamma must be > 0");
    }
}

CosineAnnealingLR::CosineAnnealingLR(Optimizer* optimizer, int T_max, float eta_min)
    : LRScheduler(optimizer), T_max_(T_max), eta_min_(eta_min),
      base_lr_(optimizer->get_lr()), step_count_(0) {
    if (T_max < 1) {
        throw std::invalid_argument("CosineAnnealingLR: T_max must be >= 1");
    }
}

void CosineAnnealingLR::step() {
    step_count_ = std::min(step_count_ + 1, T_max_);
    float cos_val = static_cast<float>(std::cos(PI * step_count_ / T_max_));
    float new_lr = eta_min_ + (base_lr_ - eta_min_) * (1.0f + cos_val) / 2.0f;
    optimizer_->set_lr(new_lr);
}

} // namespace tapepg::training
