#include <gtest/gtest.h>

#include "training/Optimizer.hpp"
#include <cmath>
#include <stdexcept>

using namespace tapepg;
using namespace tapepg::training;

// Test fixture with one parameter and a fixed gradient
class OptimizerTest : public ::testing::Test {
protected:
    Parameter param{"p", {1.0f, -1.0f}};
    Parameter other{"q", {5.0f}};

    Gradient gradient(float a, float b) {
        Gradient grad({&param});
        grad.accumulate(&param, {a, b});
        return grad;
    }
};

TEST_F(OptimizerTest, SGDAscends) {
    SGDConfig config;
    config.lr = 0.1f;
    config.momentum = 0.0f;
    SGDOptimizer sgd(config);

    sgd.step(gradient(1.0f, -2.0f));
    EXPECT_FLOAT_EQ(1.1f, param.data()[0]);
    EXPECT_FLOAT_EQ(-1.2f, param.data()[1]);
}

TEST_F(OptimizerTest, SGDMomentumAccumulates) {
    SGDConfig config;
    config.lr = 0.1f;
    config.momentum = 0.5f;
    SGDOptimizer sgd(config);

    sgd.step(gradient(1.0f, 0.0f));     // velocity 1
    sgd.step(gradient(1.0f, 0.0f));     // velocity 1.5
    EXPECT_NEAR(1.0f + 0.1f + 0.15f, param.data()[0], 1e-6f);

    sgd.reset();
    sgd.step(gradient(1.0f, 0.0f));
    EXPECT_NEAR(1.35f, param.data()[0], 1e-6f);
}

TEST_F(OptimizerTest, SGDLeavesUntrackedParameters) {
    SGDOptimizer sgd;
    sgd.step(gradient(1.0f, 1.0f));
    EXPECT_FLOAT_EQ(5.0f, other.data()[0]);
}

TEST_F(OptimizerTest, AdamFirstStepMovesByLearningRate) {
    AdamConfig config;
    config.lr = 0.01f;
    AdamOptimizer adam(config);

    // Bias-corrected first step is lr * sign(g)
    adam.step(gradient(3.0f, -0.5f));
    EXPECT_NEAR(1.01f, param.data()[0], 1e-5f);
    EXPECT_NEAR(-1.01f, param.data()[1], 1e-5f);
    EXPECT_EQ(1, adam.step_count());

    adam.reset();
    EXPECT_EQ(0, adam.step_count());
}

TEST_F(OptimizerTest, WeightDecayShrinksTowardsZero) {
    SGDConfig config;
    config.lr = 0.1f;
    config.momentum = 0.0f;
    config.weight_decay = 0.5f;
    SGDOptimizer sgd(config);

    sgd.step(gradient(0.0f, 0.0f));
    EXPECT_FLOAT_EQ(0.95f, param.data()[0]);
    EXPECT_FLOAT_EQ(-0.95f, param.data()[1]);
}

TEST_F(OptimizerTest, InvalidConfigsThrow) {
    AdamConfig adam;
    adam.lr = 0.0f;
    EXPECT_THROW(AdamOptimizer{adam}, std::invalid_argument);

    SGDConfig sgd;
    sgd.nesterov = true;
    sgd.momentum = 0.0f;
    EXPECT_THROW(SGDOptimizer{sgd}, std::invalid_argument);
}

TEST(LRSchedulerTest, ExponentialDecay) {
    SGDConfig config;
    config.lr = 1.0f;
    SGDOptimizer sgd(config);
    ExponentialLR schedule(&sgd, 0.5f);

    schedule.step();
    schedule.step();
    EXPECT_FLOAT_EQ(0.25f, sgd.get_lr());
    EXPECT_THROW(ExponentialLR(nullptr, 0.5f), std::invalid_argument);
}

TEST(LRSchedulerTest, CosineAnnealingReachesMinimum) {
    AdamConfig config;
    config.lr = 1.0f;
    AdamOptimizer adam(config);
    CosineAnnealingLR schedule(&adam, 4, 0.1f);

    schedule.step();
    schedule.step();
    EXPECT_NEAR(0.55f, adam.get_lr(), 1e-6f);

    schedule.step();
    schedule.step();
    EXPECT_NEAR(0.1f, adam.get_lr(), 1e-6f);

    // Stays at the minimum
    schedule.step();
    EXPECT_NEAR(0.1f, schedule.get_lr(), 1e-6f);
}
