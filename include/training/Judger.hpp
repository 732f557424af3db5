#pragma once

#include "training/RolloutSet.hpp"
#include <functional>

namespace tapepg::training {

// ============================================================================
// Action Judger Interface
// ============================================================================

/**
 * Scores every action of a rollout set.
 * The result is a scalar tape with the presence pattern of the rewards.
 */
class ActionJudger {
public:
    virtual ~ActionJudger() = default;

    virtual seq::Tape judge_actions(const RolloutSet& rollouts) const = 0;
};

// ============================================================================
// Q Judger
// ============================================================================

/**
 * Discounted reward-to-go:
 *   Q_t = r_t + discount * Q_{t+1}
 * with Q = 0 after an episode's last step.
 */
class QJudger : public ActionJudger {
public:
    explicit QJudger(float discount = 1.0f, bool normalize = false);

    seq::Tape judge_actions(const RolloutSet& rollouts) const override;

private:
    float discount_;
    bool normalize_;
};

// ============================================================================
// Generalized Advantage Estimation
// ============================================================================

// Value estimate per step and lane, computed from the inputs tape
using ValueFunc = std::function<seq::Tape(const seq::Tape& inputs)>;

/**
 * GAE advantages (https://arxiv.org/abs/1506.02438):
 *   delta_t = r_t + discount * V_{t+1} - V_t
 *   A_t     = delta_t + discount * lambda * A_{t+1}
 * where V and A are 0 after an episode's last step. lambda = 0 gives the
 * one-step TD residual, lambda = 1 the discounted return minus V_t.
 */
class GAEJudger : public ActionJudger {
public:
    GAEJudger(ValueFunc value_func, float discount, float lambda, bool normalize = false);

    seq::Tape judge_actions(const RolloutSet& rollouts) const override;

private:
    ValueFunc value_func_;
    float discount_;
    float lambda_;
    bool normalize_;
};

// Shift and scale all present values to zero mean and unit variance; the
// result is Reference-stored
seq::Tape normalize_tape(const seq::Tape& tape);

} // namespace tapepg::training
