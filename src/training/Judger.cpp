#include "training/Judger.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace tapepg::training {

namespace {

void check_scalar(const seq::Batch& batch, const char* what) {
    if (batch.width() != 1) {
        throw std::invalid_argument(std::string(what) + " must hold one value per lane");
    }
}

// Write batches computed back-to-front into a tape in time order
seq::Tape to_tape(std::vector<seq::Batch> reversed) {
    auto [tape, writer] = seq::Tape::create();
    for (auto it = reversed.rbegin(); it != reversed.rend(); ++it) {
        writer.write(std::move(*it));
    }
    writer.close();
    return tape;
}

} // namespace

// ============================================================================
// Q Judger
// ============================================================================

QJudger::QJudger(float discount, bool normalize)
    : discount_(discount), normalize_(normalize) {
    if (!(discount > 0.0f && discount <= 1.0f)) {
        throw std::invalid_argument("QJudger: discount must be in (0, 1]");
    }
}

seq::Tape QJudger::judge_actions(const RolloutSet& rollouts) const {
    std::vector<seq::Batch> rewards = rollouts.rewards().collect();
    if (rewards.empty()) {
        return seq::Tape::from_batches({});
    }

    std::vector<float> running(rewards.front().num_lanes(), 0.0f);
    std::vector<seq::Batch> reversed;
    reversed.reserve(rewards.size());

    for (auto t = rewards.size(); t-- > 0;) {
        const seq::Batch& r = rewards[t];
        check_scalar(r, "rewards");

        std::vector<float> packed;
        packed.reserve(r.num_present());
        std::size_t idx = 0;
        for (int lane = 0; lane < r.num_lanes(); ++lane) {
            if (!r.present()[lane]) {
                running[lane] = 0.0f;
                continue;
            }
            running[lane] = r.packed()[idx++] + discount_ * running[lane];
            packed.push_back(running[lane]);
        }
        reversed.push_back(seq::Batch::scalars(r.present(), std::move(packed)));
    }

    seq::Tape result = to_tape(std::move(reversed));
    return normalize_ ? normalize_tape(result) : result;
}

// ============================================================================
// GAE Judger
// ============================================================================

GAEJudger::GAEJudger(ValueFunc value_func, float discount, float lambda, bool normalize)
    : value_func_(std::move(value_func))
    , discount_(discount)
    , lambda_(lambda)
    , normalize_(normalize) {
    if (!value_func_) {
        throw std::invalid_argument("GAEJudger: value function is required");
    }
    if (!(discount > 0.0f && discount <= 1.0f)) {
        throw std::invalid_argument("GAEJudger: discount must be in (0, 1]");
    }
    if (!(lambda >= 0.0f && lambda <= 1.0f)) {
        throw std::invalid_argument("GAEJudger: lambda must be in [0, 1]");
    }
}

seq::Tape GAEJudger::judge_actions(const RolloutSet& rollouts) const {
    std::vector<seq::Batch> rewards = rollouts.rewards().collect();
    std::vector<seq::Batch> values = value_func_(rollouts.inputs()).collect();
    if (values.size() != rewards.size()) {
        throw std::invalid_argument("GAEJudger: " + std::to_string(values.size()) +
                                    " value steps for " + std::to_string(rewards.size()) +
                                    " reward steps");
    }
    if (rewards.empty()) {
        return seq::Tape::from_batches({});
    }

    const int num_lanes = rewards.front().num_lanes();
    std::vector<float> next_value(num_lanes, 0.0f);
    std::vector<float> advantage(num_lanes, 0.0f);
    std::vector<seq::Batch> reversed;
    reversed.reserve(rewards.size());

    const float decay = discount_ * lambda_;
    for (auto t = rewards.size(); t-- > 0;) {
        const seq::Batch& r = rewards[t];
        const seq::Batch& v = values[t];
        check_scalar(r, "rewards");
        check_scalar(v, "value estimates");
        if (!r.same_presence(v)) {
            throw std::invalid_argument("GAEJudger: value presence differs from rewards at step " +
                                        std::to_string(t));
        }

        std::vector<float> packed;
        packed.reserve(r.num_present());
        std::size_t idx = 0;
        for (int lane = 0; lane < num_lanes; ++lane) {
            if (!r.present()[lane]) {
                next_value[lane] = 0.0f;
                advantage[lane] = 0.0f;
                continue;
            }
            float value = v.packed()[idx];
            float delta = r.packed()[idx] + discount_ * next_value[lane] - value;
            advantage[lane] = delta + decay * advantage[lane];
            next_value[lane] = value;
            packed.push_back(advantage[lane]);
            ++idx;
        }
        reversed.push_back(seq::Batch::scalars(r.present(), std::move(packed)));
    }

    seq::Tape result = to_tape(std::move(reversed));
    return normalize_ ? normalize_tape(result) : result;
}

// ============================================================================
// Normalization
// ============================================================================

seq::Tape normalize_tape(const seq::Tape& tape) {
    std::vector<seq::Batch> batches = tape.collect();

    double sum = 0.0;
    std::size_t count = 0;
    for (const auto& b : batches) {
        for (float v : b.packed()) {
            sum += v;
        }
        count += b.packed().size();
    }
    if (count == 0) {
        return tape;
    }
    double mean = sum / count;

    double variance = 0.0;
    for (const auto& b : batches) {
        for (float v : b.packed()) {
            variance += (v - mean) * (v - mean);
        }
    }
    variance /= count;
    double std_dev = std::sqrt(variance + constants::NORMALIZE_EPSILON);

    for (auto& b : batches) {
        for (float& v : b.packed()) {
            v = static_cast<float>((v - mean) / std_dev);
        }
    }
    // Normalized values are mostly negative; keep them out of any quantized range
    return seq::Tape::from_batches(batches);
}

} // namespace tapepg::training
