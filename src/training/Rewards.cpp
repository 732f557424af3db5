#include "training/Rewards.hpp"
#include <cmath>
#include <optional>
#include <stdexcept>

namespace tapepg::training {

namespace {

// Per-lane sums over the lanes of the first step
std::optional<seq::Batch> reward_sum(const seq::Tape& rewards) {
    std::optional<seq::Batch> sum;
    seq::TapeReader reader = rewards.read();
    while (auto batch = reader.next()) {
        if (!sum) {
            sum = std::move(*batch);
            continue;
        }
        seq::Batch expanded = batch->expand(sum->present());
        auto& acc = sum->packed();
        for (std::size_t i = 0; i < acc.size(); ++i) {
            acc[i] += expanded.packed()[i];
        }
    }
    return sum;
}

} // namespace

std::vector<float> total_rewards(const seq::Tape& rewards) {
    auto sum = reward_sum(rewards);
    if (!sum) {
        return {};
    }
    return sum->packed();
}

float mean_reward(const seq::Tape& rewards) {
    auto totals = total_rewards(rewards);
    if (totals.empty()) {
        throw std::domain_error("mean_reward: no episodes");
    }
    double sum = 0.0;
    for (float v : totals) {
        sum += v;
    }
    return static_cast<float>(sum / totals.size());
}

float reward_variance(const seq::Tape& rewards) {
    auto totals = total_rewards(rewards);
    if (totals.empty()) {
        throw std::domain_error("reward_variance: no episodes");
    }
    double mean = 0.0;
    for (float v : totals) {
        mean += v;
    }
    mean /= totals.size();

    double variance = 0.0;
    for (float v : totals) {
        variance += (v - mean) * (v - mean);
    }
    return static_cast<float>(variance / totals.size());
}

seq::Tape discounted_rewards(const seq::Tape& rewards, float factor) {
    if (!(factor > 0.0f && factor <= 1.0f)) {
        throw std::invalid_argument("discount factor must be in (0, 1]");
    }

    // Scaled values are stored exactly, whatever the input's backend
    auto [result, writer] = seq::Tape::create();
    seq::TapeReader reader = rewards.read();
    double step = 0.0;
    while (auto batch = reader.next()) {
        writer.write(batch->scaled(static_cast<float>(std::pow(factor, step))));
        step += 1.0;
    }
    writer.close();
    return result;
}

} // namespace tapepg::training
