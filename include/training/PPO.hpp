#pragma once

#include "common/Config.hpp"
#include "common/Gradient.hpp"
#include "model/ActionSpace.hpp"
#include "model/Regularizer.hpp"
#include "seq/Rereader.hpp"
#include "training/RolloutSet.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace tapepg::training {

// ============================================================================
// Clipped Surrogate Objective
// ============================================================================

/**
 * Clipped PPO objective (https://arxiv.org/abs/1707.06347):
 *   min(clip(r, 1 - epsilon, 1 + epsilon) * A, r * A)
 * one component per action.
 */
std::vector<float> ppo_objective(float epsilon,
                                 const std::vector<float>& ratios,
                                 const std::vector<float>& advantages);

struct SurrogateGrad {
    std::vector<float> d_ratios;
    std::vector<float> d_advantages;
};

// Vector-Jacobian products of ppo_objective for ratios and advantages
SurrogateGrad ppo_objective_grad(float epsilon,
                                 const std::vector<float>& ratios,
                                 const std::vector<float>& advantages,
                                 const std::vector<float>& upstream);

// ============================================================================
// Objective Terms
// ============================================================================

/**
 * Batch means of the three parts of the objective.
 * Their sum is the objective value. Logging only.
 */
struct PPOTerms {
    float mean_advantage = 0.0f;
    float mean_critic = 0.0f;
    float mean_regularization = 0.0f;

    float total() const { return mean_advantage + mean_critic + mean_regularization; }
};

std::ostream& operator<<(std::ostream& os, const PPOTerms& terms);

// Running sums over lane-steps
struct TermSums {
    double advantage = 0.0;
    double critic = 0.0;
    double regularization = 0.0;

    // Divide by count; all zero when count is 0
    PPOTerms mean(std::size_t count) const;
};

// ============================================================================
// PPO Trainer
// ============================================================================

struct RunResult {
    Gradient gradient;
    std::optional<PPOTerms> terms;    // Empty when no parameters are trained
};

/**
 * Proximal Policy Optimization over tapes of rollouts.
 *
 * Base feeds both Actor and Critic; Actor produces action-distribution
 * parameters, Critic one value estimate per lane. None of the functions are
 * owned and all must outlive the trainer.
 *
 * Typical use per batch: advantage() once, then run() one or more times,
 * applying each returned gradient with an Optimizer.
 */
class PPOTrainer {
public:
    /**
     * @param base nullable, identity when null
     * @param regularizer nullable
     * Throws std::invalid_argument for a null actor, critic or action space.
     */
    PPOTrainer(std::vector<Parameter*> params,
               seq::SeqFunc* base,
               seq::SeqFunc* actor,
               seq::SeqFunc* critic,
               const model::ActionSpace* action_space,
               const model::Regularizer* regularizer,
               const PPOConfig& config);

    /**
     * GAE advantages with Critic(Base(inputs)) as the value function.
     * Call once per batch; the estimate changes as the critic trains.
     */
    seq::Tape advantage(const RolloutSet& rollouts) const;

    /**
     * Gradient of the objective for one PPO step.
     * May be called several times per batch with the same advantages.
     */
    RunResult run(const RolloutSet& rollouts, const seq::Tape& advantages);

    const PPOConfig& config() const { return config_; }
    const std::vector<Parameter*>& parameters() const { return params_; }

    uint64_t run_count() const { return run_count_; }

private:
    std::vector<Parameter*> params_;
    seq::SeqFunc* base_;
    seq::SeqFunc* actor_;
    seq::SeqFunc* critic_;
    const model::ActionSpace* action_space_;
    const model::Regularizer* regularizer_;
    PPOConfig config_;

    uint64_t run_count_ = 0;

    seq::RereaderPtr apply_base(const seq::Tape& inputs) const;

    void actor_pass(const seq::RereaderPtr& actor_out, const RolloutSet& rollouts,
                    const seq::Tape& advantages, float scale,
                    TermSums& sums, Gradient& grad) const;

    void critic_pass(const seq::RereaderPtr& critic_out, const seq::Tape& targets,
                     float scale, TermSums& sums, Gradient& grad) const;

    void log_run(const PPOTerms& terms) const;
};

} // namespace tapepg::training
