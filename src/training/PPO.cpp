#include "training/PPO.hpp"
#include "training/Judger.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace tapepg::training {

namespace {

void check_lengths(const std::vector<float>& ratios, const std::vector<float>& advantages) {
    if (ratios.size() != advantages.size()) {
        throw std::invalid_argument("PPO objective: " + std::to_string(ratios.size()) +
                                    " ratios but " + std::to_string(advantages.size()) +
                                    " advantages");
    }
    for (float r : ratios) {
        if (r < 0.0f) {
            throw std::invalid_argument("PPO objective: negative probability ratio");
        }
    }
}

seq::Batch next_step(seq::TapeReader& reader, const char* what) {
    auto batch = reader.next();
    if (!batch) {
        throw std::invalid_argument(std::string(what) + " tape is shorter than the actor output");
    }
    return std::move(*batch);
}

// Shared default Base; stateless
seq::SeqFunc& identity() {
    static seq::PassthroughFunc passthrough;
    return passthrough;
}

} // namespace

// ============================================================================
// Clipped Surrogate Objective
// ============================================================================

std::vector<float> ppo_objective(float epsilon,
                                 const std::vector<float>& ratios,
                                 const std::vector<float>& advantages) {
    check_lengths(ratios, advantages);

    std::vector<float> result(ratios.size());
    for (std::size_t i = 0; i < ratios.size(); ++i) {
        float clipped = std::clamp(ratios[i], 1.0f - epsilon, 1.0f + epsilon);
        result[i] = std::min(clipped * advantages[i], ratios[i] * advantages[i]);
    }
    return result;
}

SurrogateGrad ppo_objective_grad(float epsilon,
                                 const std::vector<float>& ratios,
                                 const std::vector<float>& advantages,
                                 const std::vector<float>& upstream) {
    check_lengths(ratios, advantages);
    if (upstream.size() != ratios.size()) {
        throw std::invalid_argument("PPO objective: upstream size mismatch");
    }

    SurrogateGrad grad;
    grad.d_ratios.resize(ratios.size());
    grad.d_advantages.resize(ratios.size());
    for (std::size_t i = 0; i < ratios.size(); ++i) {
        const float r = ratios[i];
        const float a = advantages[i];
        const float clipped = std::clamp(r, 1.0f - epsilon, 1.0f + epsilon);

        if (r * a < clipped * a) {
            // Unclipped branch
            grad.d_ratios[i] = upstream[i] * a;
            grad.d_advantages[i] = upstream[i] * r;
        } else {
            // Clipped branch; flat in r outside the trust region
            bool inside = r >= 1.0f - epsilon && r <= 1.0f + epsilon;
            grad.d_ratios[i] = inside ? upstream[i] * a : 0.0f;
            grad.d_advantages[i] = upstream[i] * clipped;
        }
    }
    return grad;
}

// ============================================================================
// Objective Terms
// ============================================================================

std::ostream& operator<<(std::ostream& os, const PPOTerms& terms) {
    os << "Advantage: " << terms.mean_advantage
       << " | Critic: " << terms.mean_critic
       << " | Regularization: " << terms.mean_regularization;
    return os;
}

PPOTerms TermSums::mean(std::size_t count) const {
    PPOTerms terms;
    if (count == 0) {
        return terms;
    }
    const double n = static_cast<double>(count);
    terms.mean_advantage = static_cast<float>(advantage / n);
    terms.mean_critic = static_cast<float>(critic / n);
    terms.mean_regularization = static_cast<float>(regularization / n);
    return terms;
}

// ============================================================================
// PPO Trainer
// ============================================================================

PPOTrainer::PPOTrainer(std::vector<Parameter*> params,
                       seq::SeqFunc* base,
                       seq::SeqFunc* actor,
                       seq::SeqFunc* critic,
                       const model::ActionSpace* action_space,
                       const model::Regularizer* regularizer,
                       const PPOConfig& config)
    : params_(std::move(params))
    , base_(base ? base : &identity())
    , actor_(actor)
    , critic_(critic)
    , action_space_(action_space)
    , regularizer_(regularizer)
    , config_(config) {
    if (!actor_) {
        throw std::invalid_argument("PPOTrainer: actor is required");
    }
    if (!critic_) {
        throw std::invalid_argument("PPOTrainer: critic is required");
    }
    if (!action_space_) {
        throw std::invalid_argument("PPOTrainer: action space is required");
    }
    config_.validate();
}

seq::RereaderPtr PPOTrainer::apply_base(const seq::Tape& inputs) const {
    return base_->apply(seq::lazify(inputs));
}

seq::Tape PPOTrainer::advantage(const RolloutSet& rollouts) const {
    GAEJudger judger(
        [this](const seq::Tape& inputs) {
            return critic_->apply(apply_base(inputs))->output();
        },
        config_.discount, config_.lambda, config_.normalize_advantages);
    return judger.judge_actions(rollouts);
}

RunResult PPOTrainer::run(const RolloutSet& rollouts, const seq::Tape& advantages) {
    RunResult result{Gradient(params_), std::nullopt};
    if (result.gradient.empty()) {
        return result;
    }

    const std::size_t count = rollouts.num_steps();
    TermSums sums;

    if (count > 0) {
        QJudger target_judger(config_.discount);
        seq::Tape targets = target_judger.judge_actions(rollouts);
        const float scale = 1.0f / static_cast<float>(count);

        if (config_.pool_base) {
            auto pooled = std::make_shared<seq::PooledRereader>(apply_base(rollouts.inputs()));
            seq::RereaderPtr actor_out = actor_->apply(pooled);
            seq::RereaderPtr critic_out = critic_->apply(pooled);
            actor_pass(actor_out, rollouts, advantages, scale, sums, result.gradient);
            critic_pass(critic_out, targets, scale, sums, result.gradient);
            pooled->flush(result.gradient);
        } else {
            {
                seq::RereaderPtr actor_out = actor_->apply(apply_base(rollouts.inputs()));
                actor_pass(actor_out, rollouts, advantages, scale, sums, result.gradient);
            }
            seq::RereaderPtr critic_out = critic_->apply(apply_base(rollouts.inputs()));
            critic_pass(critic_out, targets, scale, sums, result.gradient);
        }
    }

    result.terms = sums.mean(count);

    ++run_count_;
    if (config_.log_interval > 0 && run_count_ % config_.log_interval == 0) {
        log_run(*result.terms);
    }
    return result;
}

void PPOTrainer::actor_pass(const seq::RereaderPtr& actor_out, const RolloutSet& rollouts,
                            const seq::Tape& advantages, float scale,
                            TermSums& sums, Gradient& grad) const {
    const float epsilon = config_.effective_epsilon();

    seq::TapeReader params_reader = actor_out->output().read();
    seq::TapeReader old_reader = rollouts.agent_outs().read();
    seq::TapeReader action_reader = rollouts.actions().read();
    seq::TapeReader adv_reader = advantages.read();

    auto [d_actor, writer] = seq::Tape::create();
    while (auto params = params_reader.next()) {
        seq::Batch old_params = next_step(old_reader, "AgentOuts");
        seq::Batch actions = next_step(action_reader, "Actions");
        seq::Batch adv = next_step(adv_reader, "Advantage");
        if (!adv.same_presence(*params) || adv.width() != 1) {
            throw std::invalid_argument("Advantage tape does not match the rollouts at step " +
                                        std::to_string(params_reader.position() - 1));
        }

        const std::size_t n = static_cast<std::size_t>(params->num_present());
        std::vector<float> new_lp = action_space_->log_prob(*params, actions);
        std::vector<float> old_lp = action_space_->log_prob(old_params, actions);

        std::vector<float> ratios(n);
        for (std::size_t i = 0; i < n; ++i) {
            ratios[i] = std::exp(new_lp[i] - old_lp[i]);
        }

        std::vector<float> objective = ppo_objective(epsilon, ratios, adv.packed());
        std::vector<float> upstream(n, scale);
        SurrogateGrad surrogate = ppo_objective_grad(epsilon, ratios, adv.packed(), upstream);

        // d ratio / d log p_new = ratio
        std::vector<float> d_log_prob(n);
        for (std::size_t i = 0; i < n; ++i) {
            d_log_prob[i] = surrogate.d_ratios[i] * ratios[i];
            sums.advantage += objective[i];
        }
        seq::Batch d_params = action_space_->log_prob_grad(*params, actions, d_log_prob);

        if (regularizer_) {
            for (float v : regularizer_->regularize(*params)) {
                sums.regularization += v;
            }
            seq::Batch d_reg = regularizer_->regularize_grad(*params, upstream);
            auto& acc = d_params.packed();
            for (std::size_t i = 0; i < acc.size(); ++i) {
                acc[i] += d_reg.packed()[i];
            }
        }

        writer.write(std::move(d_params));
    }
    writer.close();

    actor_out->propagate(d_actor, grad);
}

void PPOTrainer::critic_pass(const seq::RereaderPtr& critic_out, const seq::Tape& targets,
                             float scale, TermSums& sums, Gradient& grad) const {
    const float weight = config_.effective_critic_weight();

    seq::TapeReader value_reader = critic_out->output().read();
    seq::TapeReader target_reader = targets.read();

    auto [d_critic, writer] = seq::Tape::create();
    while (auto values = value_reader.next()) {
        seq::Batch target = next_step(target_reader, "Target");
        if (values->width() != 1) {
            throw std::invalid_argument("Critic must output one value per lane");
        }
        if (!values->same_presence(target)) {
            throw std::invalid_argument("Critic output presence does not match the rewards");
        }

        std::vector<float> d_values(values->packed().size());
        for (std::size_t i = 0; i < d_values.size(); ++i) {
            float diff = values->packed()[i] - target.packed()[i];
            sums.critic -= static_cast<double>(weight) * diff * diff;
            d_values[i] = -2.0f * weight * diff * scale;
        }
        writer.write(seq::Batch(values->present(), 1, std::move(d_values)));
    }
    writer.close();

    critic_out->propagate(d_critic, grad);
}

void PPOTrainer::log_run(const PPOTerms& terms) const {
    std::cout << "Run " << run_count_ << " | " << terms
              << " | Objective: " << terms.total() << std::endl;
}

} // namespace tapepg::training
