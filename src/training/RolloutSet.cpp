#include "training/RolloutSet.hpp"
#include <algorithm>
#include <stdexcept>

namespace tapepg::training {

RolloutSet::RolloutSet(seq::Tape inputs, seq::Tape actions, seq::Tape agent_outs,
                       seq::Tape rewards)
    : inputs_(std::move(inputs))
    , actions_(std::move(actions))
    , agent_outs_(std::move(agent_outs))
    , rewards_(std::move(rewards)) {
}

std::size_t RolloutSet::num_steps() const {
    std::size_t total = 0;
    seq::TapeReader reader = rewards_.read();
    while (auto batch = reader.next()) {
        total += static_cast<std::size_t>(batch->num_present());
    }
    return total;
}

namespace {

// Concatenate one tape per set, padding exhausted sets with absent lanes
seq::Tape pack_tapes(const std::vector<const seq::Tape*>& tapes) {
    std::size_t length = 0;
    for (const auto* tape : tapes) {
        length = std::max(length, tape->num_steps());
    }

    std::vector<seq::TapeReader> readers;
    readers.reserve(tapes.size());
    for (const auto* tape : tapes) {
        readers.push_back(tape->read());
    }

    // Mixed storage configs would re-encode some lanes through another codec
    TapeConfig config = tapes.front()->config();
    for (const auto* tape : tapes) {
        if (tape->config() != config) {
            config = TapeConfig{};
            break;
        }
    }

    auto [packed, writer] = seq::Tape::create(config);
    for (std::size_t t = 0; t < length; ++t) {
        std::vector<seq::Batch> parts;
        parts.reserve(tapes.size());
        for (std::size_t i = 0; i < tapes.size(); ++i) {
            if (auto batch = readers[i].next()) {
                parts.push_back(std::move(*batch));
            } else if (tapes[i]->num_lanes() > 0) {
                parts.push_back(seq::Batch::absent(tapes[i]->num_lanes(), tapes[i]->width()));
            }
        }
        writer.write(seq::Batch::concat_lanes(parts));
    }
    writer.close();
    return packed;
}

} // namespace

RolloutSet pack_rollout_sets(const std::vector<RolloutSet>& sets) {
    if (sets.empty()) {
        throw std::invalid_argument("pack_rollout_sets: no rollout sets");
    }

    std::vector<const seq::Tape*> inputs, actions, agent_outs, rewards;
    for (const auto& set : sets) {
        inputs.push_back(&set.inputs());
        actions.push_back(&set.actions());
        agent_outs.push_back(&set.agent_outs());
        rewards.push_back(&set.rewards());
    }

    return RolloutSet(pack_tapes(inputs), pack_tapes(actions),
                      pack_tapes(agent_outs), pack_tapes(rewards));
}

} // namespace tapepg::training
