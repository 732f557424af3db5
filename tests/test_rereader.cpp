#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "seq/Rereader.hpp"
#include <stdexcept>

using namespace tapepg;
using seq::Batch;
using seq::Tape;

namespace {

// Records the gradient tapes it receives
class RecordingRereader : public seq::Rereader {
public:
    explicit RecordingRereader(Tape tape) : tape_(std::move(tape)) {}

    const Tape& output() const override { return tape_; }

    void propagate(const Tape& upstream, Gradient&) override {
        received.push_back(test::flatten(upstream));
    }

    std::vector<std::vector<float>> received;

private:
    Tape tape_;
};

} // namespace

TEST(RereaderTest, LazifyIsConstant) {
    Tape tape = test::scalar_tape({{1, 2}, {3}});
    auto node = seq::lazify(tape);

    EXPECT_EQ((std::vector<float>{1, 3, 2}), test::flatten(node->output()));

    Gradient grad;
    EXPECT_NO_THROW(node->propagate(tape, grad));
    EXPECT_NO_THROW(node->propagate(tape, grad));
}

TEST(RereaderTest, PassthroughReturnsInput) {
    auto node = seq::lazify(test::scalar_tape({{1}}));
    seq::PassthroughFunc identity;
    EXPECT_EQ(node, identity.apply(node));
}

TEST(PooledRereaderTest, SumsGradientsUntilFlush) {
    auto source = std::make_shared<RecordingRereader>(test::scalar_tape({{1, 2}, {3}}));
    seq::PooledRereader pooled(source);

    EXPECT_EQ(test::flatten(source->output()), test::flatten(pooled.output()));

    Gradient grad;
    pooled.propagate(test::scalar_tape({{1, 1}, {1}}), grad);
    pooled.propagate(test::scalar_tape({{2, 3}, {4}}), grad);
    EXPECT_TRUE(source->received.empty());

    pooled.flush(grad);
    ASSERT_EQ(1u, source->received.size());
    EXPECT_EQ((std::vector<float>{3, 5, 4}), source->received[0]);

    // Nothing left to send
    pooled.flush(grad);
    EXPECT_EQ(1u, source->received.size());
}

TEST(PooledRereaderTest, RejectsMismatchedGradients) {
    auto source = std::make_shared<RecordingRereader>(test::scalar_tape({{1, 2}, {3}}));
    seq::PooledRereader pooled(source);

    Gradient grad;
    pooled.propagate(test::scalar_tape({{1, 1}, {1}}), grad);
    EXPECT_THROW(pooled.propagate(test::scalar_tape({{1}, {1}}), grad), std::invalid_argument);
    EXPECT_THROW(pooled.propagate(test::scalar_tape({{1, 1}, {1, 1}}), grad),
                 std::invalid_argument);
}

TEST(PooledRereaderTest, NullSourceThrows) {
    EXPECT_THROW(seq::PooledRereader(nullptr), std::invalid_argument);
}
