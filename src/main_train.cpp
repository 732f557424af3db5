#include "common/Config.hpp"
#include "model/ActionSpace.hpp"
#include "model/Layers.hpp"
#include "model/Regularizer.hpp"
#include "training/Optimizer.hpp"
#include "training/PPO.hpp"
#include "training/Rewards.hpp"
#include "training/RolloutSet.hpp"
#include "training/TrainingPhase.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace tapepg;

namespace {

constexpr int OBS_DIM = 3;
constexpr int HIDDEN_DIM = 8;
constexpr int NUM_ACTIONS = 2;
constexpr int MAX_EPISODE_STEPS = 10;

// ============================================================================
// Toy environment
// ============================================================================

/**
 * Each step shows which of two actions pays off; choosing it earns 1.
 * Episodes end at random or after MAX_EPISODE_STEPS steps.
 * Observation: [target == 0, target == 1, 1].
 */
class MatchingEnv {
public:
    explicit MatchingEnv(uint32_t seed) : rng_(seed) {}

    std::vector<float> reset() {
        steps_ = 0;
        return observe();
    }

    // Reward for the action and whether the episode continues
    std::pair<float, bool> step(int action) {
        float reward = action == target_ ? 1.0f : 0.0f;
        ++steps_;
        bool done = steps_ >= MAX_EPISODE_STEPS || end_(rng_) < 0.1;
        return {reward, !done};
    }

    std::vector<float> observe() {
        target_ = coin_(rng_);
        return {target_ == 0 ? 1.0f : 0.0f, target_ == 1 ? 1.0f : 0.0f, 1.0f};
    }

private:
    std::mt19937 rng_;
    std::bernoulli_distribution coin_{0.5};
    std::uniform_real_distribution<double> end_{0.0, 1.0};
    int target_ = 0;
    int steps_ = 0;
};

int argmax(const float* values, int n) {
    int best = 0;
    for (int i = 1; i < n; ++i) {
        if (values[i] > values[best]) {
            best = i;
        }
    }
    return best;
}

/**
 * Run one episode per environment with the current policy, all lanes in
 * lockstep until every episode has ended.
 */
training::RolloutSet collect_rollouts(std::vector<MatchingEnv>& envs,
                                      seq::SeqFunc& policy,
                                      const model::Softmax& space,
                                      const TapeConfig& input_config,
                                      std::mt19937& rng) {
    const int num_lanes = static_cast<int>(envs.size());

    auto [inputs, input_writer] = seq::Tape::create(input_config);
    auto [actions, action_writer] = seq::Tape::create();
    auto [agent_outs, out_writer] = seq::Tape::create();
    auto [rewards, reward_writer] = seq::Tape::create();

    LaneMask alive(num_lanes, true);
    std::vector<std::vector<float>> obs(num_lanes);
    for (int lane = 0; lane < num_lanes; ++lane) {
        obs[lane] = envs[lane].reset();
    }

    while (seq::count_present(alive) > 0) {
        std::vector<float> packed_obs;
        for (int lane = 0; lane < num_lanes; ++lane) {
            if (alive[lane]) {
                packed_obs.insert(packed_obs.end(), obs[lane].begin(), obs[lane].end());
            }
        }
        seq::Batch obs_batch(alive, OBS_DIM, std::move(packed_obs));

        seq::Batch logits = policy.apply(seq::lazify(seq::Tape::from_batches({obs_batch})))
                                ->output().at(0);
        seq::Batch sampled = space.sample(logits, rng);

        LaneMask next_alive = alive;
        std::vector<float> step_rewards;
        int row = 0;
        for (int lane = 0; lane < num_lanes; ++lane) {
            if (!alive[lane]) {
                continue;
            }
            int action = argmax(sampled.packed().data() + row * NUM_ACTIONS, NUM_ACTIONS);
            auto [reward, running] = envs[lane].step(action);
            step_rewards.push_back(reward);
            if (running) {
                obs[lane] = envs[lane].observe();
            } else {
                next_alive[lane] = false;
            }
            ++row;
        }

        input_writer.write(std::move(obs_batch));
        action_writer.write(std::move(sampled));
        out_writer.write(std::move(logits));
        reward_writer.write(seq::Batch::scalars(alive, std::move(step_rewards)));
        alive = std::move(next_alive);
    }

    input_writer.close();
    action_writer.close();
    out_writer.close();
    reward_writer.close();
    return training::RolloutSet(inputs, actions, agent_outs, rewards);
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "==================================" << std::endl;
    std::cout << "tapepg PPO training" << std::endl;
    std::cout << "==================================" << std::endl;

    try {
        Config config = argc > 1 ? Config::from_json(argv[1]) : Config{};
        const int num_iterations = argc > 2 ? std::stoi(argv[2]) : 50;
        const int num_groups = 2;
        const int envs_per_group = 8;
        const int ppo_epochs = 4;
        const bool verbose = config.log_level == "DEBUG";

        std::cout << "\nPPO Configuration:" << std::endl;
        std::cout << "  Discount: " << config.ppo.discount << std::endl;
        std::cout << "  GAE Lambda: " << config.ppo.lambda << std::endl;
        std::cout << "  Clip Epsilon: " << config.ppo.effective_epsilon() << std::endl;
        std::cout << "  Critic Weight: " << config.ppo.effective_critic_weight() << std::endl;
        std::cout << "  Pool Base: " << (config.ppo.pool_base ? "Enabled" : "Disabled") << std::endl;
        std::cout << "  Optimizer: " << config.optimizer << std::endl;

        // Model
        std::cout << "\n[1/3] Creating model..." << std::endl;
        model::Affine base_layer(OBS_DIM, HIDDEN_DIM, 1);
        model::Tanh squash;
        model::Chain base({&base_layer, &squash});
        model::Affine actor(HIDDEN_DIM, NUM_ACTIONS, 2);
        model::Affine critic(HIDDEN_DIM, 1, 3);
        model::Chain policy({&base, &actor});

        std::vector<Parameter*> params;
        for (auto* layer : {&base_layer, &actor, &critic}) {
            for (Parameter* p : layer->parameters()) {
                params.push_back(p);
            }
        }
        std::size_t num_values = 0;
        for (const auto* p : params) {
            num_values += p->size();
        }
        std::cout << "  Model parameters: " << num_values << std::endl;

        model::Softmax space;
        model::EntropyRegularizer regularizer(space, 0.01f);
        training::PPOTrainer trainer(params, &base, &actor, &critic, &space, &regularizer,
                                     config.ppo);

        // Optimizer
        std::cout << "\n[2/3] Setting up optimizer..." << std::endl;
        std::unique_ptr<training::Optimizer> optimizer;
        if (config.optimizer == "sgd") {
            optimizer = std::make_unique<training::SGDOptimizer>(config.sgd);
        } else {
            optimizer = std::make_unique<training::AdamOptimizer>(config.adam);
        }
        training::CosineAnnealingLR scheduler(optimizer.get(), num_iterations,
                                              optimizer->get_lr() * 0.1f);

        // Training loop
        std::cout << "\n[3/3] Starting training..." << std::endl;
        std::cout << "====================================\n" << std::endl;

        std::vector<std::vector<MatchingEnv>> groups;
        for (int g = 0; g < num_groups; ++g) {
            std::vector<MatchingEnv> envs;
            for (int i = 0; i < envs_per_group; ++i) {
                envs.emplace_back(static_cast<uint32_t>(100 * g + i));
            }
            groups.push_back(std::move(envs));
        }

        std::mt19937 rng(0);
        training::PhaseGate gate;
        float best_reward = 0.0f;

        for (int iter = 0; iter < num_iterations; ++iter) {
            std::vector<training::RolloutSet> sets;
            {
                auto lease = gate.acquire(training::Phase::Collecting);
                for (auto& envs : groups) {
                    sets.push_back(collect_rollouts(envs, policy, space, config.input_tape, rng));
                }
            }
            training::RolloutSet rollouts = training::pack_rollout_sets(sets);

            float mean = training::mean_reward(rollouts.rewards());
            best_reward = std::max(best_reward, mean);

            {
                auto lease = gate.acquire(training::Phase::Training);
                seq::Tape advantages = trainer.advantage(rollouts);
                for (int epoch = 0; epoch < ppo_epochs; ++epoch) {
                    training::RunResult result = trainer.run(rollouts, advantages);
                    result.gradient.clip_norm(1.0f);
                    optimizer->step(result.gradient);

                    if (verbose && result.terms) {
                        std::cout << "  Epoch " << epoch << " | " << *result.terms << std::endl;
                    }
                }
            }
            scheduler.step();

            std::cout << "Iteration " << iter
                      << " | Episodes: " << rollouts.num_episodes()
                      << " | Steps: " << rollouts.num_steps()
                      << " | Mean Reward: " << mean
                      << " | Reward Var: " << training::reward_variance(rollouts.rewards())
                      << " | LR: " << optimizer->get_lr() << std::endl;
        }

        std::cout << "\n=====================================" << std::endl;
        std::cout << "Training completed!" << std::endl;
        std::cout << "Best Mean Reward: " << best_reward << std::endl;
        std::cout << "=====================================" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error during training: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
