#pragma once

#include "seq/Tape.hpp"
#include <vector>

namespace tapepg::training {

/**
 * Sum of each episode's rewards.
 * One entry per lane present at the first step, in lane order; empty for a
 * tape without steps.
 */
std::vector<float> total_rewards(const seq::Tape& rewards);

// Mean of total_rewards(); throws std::domain_error when there are no episodes
float mean_reward(const seq::Tape& rewards);

// Population variance of total_rewards(); throws std::domain_error when there are no episodes
float reward_variance(const seq::Tape& rewards);

/**
 * Scale step i of rewards by factor^i.
 *
 * This is a per-step scaling, not a discounted return: no sum over future
 * steps is taken. Use QJudger for reward-to-go.
 * Requires 0 < factor <= 1.
 */
seq::Tape discounted_rewards(const seq::Tape& rewards, float factor);

} // namespace tapepg::training
