#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "training/Judger.hpp"
#include <cmath>
#include <stdexcept>

using namespace tapepg;
using namespace tapepg::training;

namespace {

// Value estimate c for every present input
ValueFunc constant_value(float c) {
    return [c](const seq::Tape& inputs) {
        auto [out, writer] = seq::Tape::create();
        auto reader = inputs.read();
        while (auto b = reader.next()) {
            writer.write(seq::Batch::scalars(b->present(),
                                             std::vector<float>(b->num_present(), c)));
        }
        writer.close();
        return out;
    };
}

void expect_all_near(const std::vector<float>& expected, const std::vector<float>& actual) {
    ASSERT_EQ(expected.size(), actual.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(expected[i], actual[i], 1e-5f) << "index " << i;
    }
}

} // namespace

TEST(QJudgerTest, DiscountedRewardToGo) {
    auto rollouts = test::reward_rollouts({{1, 2, 3}, {1, 1}});
    auto q = QJudger(0.5f).judge_actions(rollouts);
    expect_all_near({2.75f, 1.5f, 3.5f, 1.0f, 3.0f}, test::flatten(q));
}

TEST(QJudgerTest, UndiscountedIsSuffixSum) {
    auto rollouts = test::reward_rollouts({{1, 2, 3}});
    auto q = QJudger().judge_actions(rollouts);
    expect_all_near({6, 5, 3}, test::flatten(q));
}

TEST(QJudgerTest, InvalidDiscount) {
    EXPECT_THROW(QJudger(0.0f), std::invalid_argument);
    EXPECT_THROW(QJudger(1.1f), std::invalid_argument);
}

TEST(GAEJudgerTest, ZeroLambdaIsTDResidual) {
    auto rollouts = test::reward_rollouts({{1, 2, 3}, {1, 1}});
    GAEJudger judger(constant_value(1.0f), 0.5f, 0.0f);
    expect_all_near({0.5f, 0.5f, 1.5f, 0.0f, 2.0f}, test::flatten(judger.judge_actions(rollouts)));
}

TEST(GAEJudgerTest, UnitLambdaIsReturnMinusBaseline) {
    auto rollouts = test::reward_rollouts({{1, 2, 3}, {1, 1}});
    GAEJudger judger(constant_value(1.0f), 0.5f, 1.0f);
    expect_all_near({1.75f, 0.5f, 2.5f, 0.0f, 2.0f},
                    test::flatten(judger.judge_actions(rollouts)));
}

TEST(GAEJudgerTest, KeepsRewardPresence) {
    auto rollouts = test::reward_rollouts({{1}, {1, 1, 1}});
    GAEJudger judger(constant_value(0.0f), 0.9f, 0.95f);
    auto adv = judger.judge_actions(rollouts).collect();
    auto rewards = rollouts.rewards().collect();
    ASSERT_EQ(rewards.size(), adv.size());
    for (std::size_t t = 0; t < adv.size(); ++t) {
        EXPECT_EQ(rewards[t].present(), adv[t].present());
    }
}

TEST(GAEJudgerTest, NormalizedAdvantages) {
    auto rollouts = test::reward_rollouts({{1, 2, 3}, {1, 1}});
    GAEJudger judger(constant_value(1.0f), 0.5f, 0.0f, true);
    auto values = test::flatten(judger.judge_actions(rollouts));

    double mean = 0.0;
    for (float v : values) {
        mean += v;
    }
    mean /= values.size();
    double var = 0.0;
    for (float v : values) {
        var += (v - mean) * (v - mean);
    }
    var /= values.size();

    EXPECT_NEAR(0.0, mean, 1e-5);
    EXPECT_NEAR(1.0, var, 1e-4);
}

TEST(NormalizeTapeTest, CompressedInputIsNotClamped) {
    TapeConfig config;
    config.storage = TapeStorage::Compressed;
    auto tape = test::scalar_tape({{0, 2}}, config);
    auto normalized = normalize_tape(tape);

    EXPECT_EQ(TapeStorage::Reference, normalized.storage());
    auto values = test::flatten(normalized);
    ASSERT_EQ(2u, values.size());
    EXPECT_NEAR(-1.0f, values[0], 1e-3f);
    EXPECT_NEAR(1.0f, values[1], 1e-3f);
}

TEST(GAEJudgerTest, ValuePresenceMismatchThrows) {
    auto rollouts = test::reward_rollouts({{1, 2}, {1, 1}});
    ValueFunc wrong = [](const seq::Tape&) {
        return test::scalar_tape({{0, 0}, {0}});
    };
    GAEJudger judger(wrong, 0.9f, 0.9f);
    EXPECT_THROW(judger.judge_actions(rollouts), std::invalid_argument);
}

TEST(GAEJudgerTest, ValueLengthMismatchThrows) {
    auto rollouts = test::reward_rollouts({{1, 2}});
    ValueFunc short_values = [](const seq::Tape&) {
        return test::scalar_tape({{0}});
    };
    GAEJudger judger(short_values, 0.9f, 0.9f);
    EXPECT_THROW(judger.judge_actions(rollouts), std::invalid_argument);
}

TEST(GAEJudgerTest, InvalidConfiguration) {
    EXPECT_THROW(GAEJudger(nullptr, 0.9f, 0.9f), std::invalid_argument);
    EXPECT_THROW(GAEJudger(constant_value(0), 0.9f, 1.5f), std::invalid_argument);
}
