#pragma once

#include "seq/Tape.hpp"
#include <vector>

namespace tapepg::training {

/**
 * One training batch of recorded episodes, one episode per lane.
 *
 * All four tapes share the same presence pattern. AgentOuts holds the
 * action-distribution parameters the policy produced while acting, used as
 * the "old" policy when computing probability ratios.
 */
class RolloutSet {
public:
    RolloutSet(seq::Tape inputs, seq::Tape actions, seq::Tape agent_outs, seq::Tape rewards);

    const seq::Tape& inputs() const { return inputs_; }
    const seq::Tape& actions() const { return actions_; }
    const seq::Tape& agent_outs() const { return agent_outs_; }
    const seq::Tape& rewards() const { return rewards_; }

    // Number of episodes (lanes)
    int num_episodes() const { return rewards_.num_lanes(); }

    // Total timesteps across all episodes
    std::size_t num_steps() const;

    // Length of the longest episode
    std::size_t tape_length() const { return rewards_.num_steps(); }

private:
    seq::Tape inputs_;
    seq::Tape actions_;
    seq::Tape agent_outs_;
    seq::Tape rewards_;
};

/**
 * Join rollout sets along the lane dimension.
 * Lanes keep their order (set by set); sets shorter than the longest are
 * padded with absent steps.
 */
RolloutSet pack_rollout_sets(const std::vector<RolloutSet>& sets);

} // namespace tapepg::training
