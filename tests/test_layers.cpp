#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "model/Layers.hpp"
#include <cmath>
#include <stdexcept>

using namespace tapepg;
using namespace tapepg::model;

namespace {

// Input node that keeps the gradient it receives
class InputNode : public seq::Rereader {
public:
    explicit InputNode(seq::Tape tape) : tape_(std::move(tape)) {}

    const seq::Tape& output() const override { return tape_; }

    void propagate(const seq::Tape& upstream, Gradient&) override {
        received = test::flatten(upstream);
    }

    std::vector<float> received;

private:
    seq::Tape tape_;
};

seq::Tape inputs() {
    return test::episode_tape({{{0.5f, -1.0f}, {0.2f, 0.3f}}, {{1.5f, 0.0f}}}, 2);
}

// Sum of all outputs of f applied to inputs()
double sum_outputs(seq::SeqFunc& f) {
    double total = 0.0;
    for (float v : test::flatten(f.apply(seq::lazify(inputs()))->output())) {
        total += v;
    }
    return total;
}

// Gradient of sum_outputs() as a tape of ones
seq::Tape ones_like(const seq::Tape& tape) {
    std::vector<seq::Batch> batches = tape.collect();
    for (auto& b : batches) {
        std::fill(b.packed().begin(), b.packed().end(), 1.0f);
    }
    return seq::Tape::from_batches(batches);
}

} // namespace

TEST(AffineTest, InitializationIsSeeded) {
    Affine a(4, 3, 11);
    Affine b(4, 3, 11);
    Affine c(4, 3, 12);
    EXPECT_EQ(12u, a.weights().size());
    EXPECT_EQ(a.weights().data(), b.weights().data());
    EXPECT_NE(a.weights().data(), c.weights().data());
    EXPECT_EQ((std::vector<float>{0, 0, 0}), a.bias().data());
}

TEST(AffineTest, ForwardKeepsPresence) {
    Affine layer(2, 1);
    layer.weights().data() = {2.0f, -1.0f};
    layer.bias().data() = {0.5f};

    auto out = layer.apply(seq::lazify(inputs()))->output().collect();
    ASSERT_EQ(2u, out.size());
    EXPECT_EQ((LaneMask{true, false}), out[1].present());
    EXPECT_FLOAT_EQ(2.5f, out[0].packed()[0]);
    EXPECT_FLOAT_EQ(3.5f, out[0].packed()[1]);
    EXPECT_FLOAT_EQ(0.6f, out[1].packed()[0]);
}

TEST(AffineTest, RejectsWrongInputWidth) {
    Affine layer(3, 1);
    EXPECT_THROW(layer.apply(seq::lazify(inputs())), std::invalid_argument);
    EXPECT_THROW(Affine(0, 1), std::invalid_argument);
}

TEST(AffineTest, PropagatesToInput) {
    Affine layer(2, 1);
    layer.weights().data() = {2.0f, -1.0f};

    auto input = std::make_shared<InputNode>(inputs());
    auto node = layer.apply(input);
    Gradient grad(layer.parameters());
    node->propagate(ones_like(node->output()), grad);

    // dx = W^T g for every present row
    EXPECT_EQ((std::vector<float>{2, -1, 2, -1, 2, -1}), input->received);
    // db = number of present rows
    EXPECT_FLOAT_EQ(3.0f, grad.at(&layer.bias())[0]);
    // dW = sum of inputs
    EXPECT_NEAR(2.2f, grad.at(&layer.weights())[0], 1e-6f);
    EXPECT_NEAR(-0.7f, grad.at(&layer.weights())[1], 1e-6f);
}

TEST(ChainTest, GradientMatchesFiniteDifferences) {
    Affine hidden(2, 3, 5);
    Tanh squash;
    Affine head(3, 2, 6);
    Chain net({&hidden, &squash, &head});

    std::vector<Parameter*> params{&hidden.weights(), &hidden.bias(),
                                   &head.weights(), &head.bias()};
    Gradient grad(params);
    auto node = net.apply(seq::lazify(inputs()));
    node->propagate(ones_like(node->output()), grad);

    const float h = 1e-3f;
    for (Parameter* param : params) {
        for (std::size_t i = 0; i < param->size(); ++i) {
            float saved = param->data()[i];
            param->data()[i] = saved + h;
            double plus = sum_outputs(net);
            param->data()[i] = saved - h;
            double minus = sum_outputs(net);
            param->data()[i] = saved;

            EXPECT_NEAR((plus - minus) / (2.0 * h), grad.at(param)[i], 2e-3)
                << param->name() << "[" << i << "]";
        }
    }
}

TEST(ChainTest, TanhSquashes) {
    Tanh squash;
    auto out = test::flatten(squash.apply(seq::lazify(test::scalar_tape({{0.0f, 100.0f}})))->output());
    EXPECT_FLOAT_EQ(0.0f, out[0]);
    EXPECT_FLOAT_EQ(1.0f, out[1]);
}
