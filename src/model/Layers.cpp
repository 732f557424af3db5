#include "model/Layers.hpp"
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace tapepg::model {

namespace {

seq::Batch next_or_throw(seq::TapeReader& reader, const char* what) {
    auto batch = reader.next();
    if (!batch) {
        throw std::invalid_argument(std::string(what) + ": gradient tape shorter than output");
    }
    return std::move(*batch);
}

class AffineRes : public seq::Rereader {
public:
    AffineRes(Affine& layer, seq::RereaderPtr in, seq::Tape out)
        : layer_(layer), in_(std::move(in)), out_(std::move(out)) {}

    const seq::Tape& output() const override { return out_; }

    void propagate(const seq::Tape& upstream, Gradient& grad) override {
        const int n_in = layer_.in_features();
        const int n_out = layer_.out_features();
        const Parameter& w = layer_.weights();
        const Parameter& b = layer_.bias();

        std::vector<float> d_weights(w.size(), 0.0f);
        std::vector<float> d_bias(b.size(), 0.0f);

        auto [d_in_tape, writer] = seq::Tape::create();
        seq::TapeReader inputs = in_->output().read();
        seq::TapeReader grads = upstream.read();
        while (auto x = inputs.next()) {
            seq::Batch g = next_or_throw(grads, "Affine");
            if (!g.same_presence(*x) || g.width() != n_out) {
                throw std::invalid_argument("Affine: gradient shape mismatch");
            }

            std::vector<float> d_x(x->packed().size(), 0.0f);
            for (int row = 0; row < x->num_present(); ++row) {
                const float* xr = x->packed().data() + row * n_in;
                const float* gr = g.packed().data() + row * n_out;
                float* dxr = d_x.data() + row * n_in;
                for (int o = 0; o < n_out; ++o) {
                    const float go = gr[o];
                    const float* wr = w.data().data() + o * n_in;
                    float* dwr = d_weights.data() + o * n_in;
                    d_bias[o] += go;
                    for (int i = 0; i < n_in; ++i) {
                        dwr[i] += go * xr[i];
                        dxr[i] += go * wr[i];
                    }
                }
            }
            writer.write(seq::Batch(x->present(), n_in, std::move(d_x)));
        }
        writer.close();

        grad.accumulate(&w, d_weights);
        grad.accumulate(&b, d_bias);
        in_->propagate(d_in_tape, grad);
    }

private:
    Affine& layer_;
    seq::RereaderPtr in_;
    seq::Tape out_;
};

class TanhRes : public seq::Rereader {
public:
    TanhRes(seq::RereaderPtr in, seq::Tape out) : in_(std::move(in)), out_(std::move(out)) {}

    const seq::Tape& output() const override { return out_; }

    void propagate(const seq::Tape& upstream, Gradient& grad) override {
        auto [d_in_tape, writer] = seq::Tape::create();
        seq::TapeReader outputs = out_.read();
        seq::TapeReader grads = upstream.read();
        while (auto y = outputs.next()) {
            seq::Batch g = next_or_throw(grads, "Tanh");
            if (!g.same_presence(*y) || g.width() != y->width()) {
                throw std::invalid_argument("Tanh: gradient shape mismatch");
            }
            auto& d = g.packed();
            for (std::size_t i = 0; i < d.size(); ++i) {
                float v = y->packed()[i];
                d[i] *= 1.0f - v * v;
            }
            writer.write(std::move(g));
        }
        writer.close();
        in_->propagate(d_in_tape, grad);
    }

private:
    seq::RereaderPtr in_;
    seq::Tape out_;
};

} // namespace

// ============================================================================
// Affine
// ============================================================================

Affine::Affine(int in_features, int out_features, uint32_t seed)
    : in_features_(in_features)
    , out_features_(out_features)
    , weights_("affine.weights", std::vector<float>())
    , bias_("affine.bias", std::vector<float>()) {
    if (in_features < 1 || out_features < 1) {
        throw std::invalid_argument("Affine features must be >= 1");
    }
    initialize_weights(seed);
}

void Affine::initialize_weights(uint32_t seed) {
    std::mt19937 rng(seed);
    float scale = std::sqrt(2.0f / in_features_);
    std::normal_distribution<float> dist(0.0f, scale);

    weights_.data().resize(static_cast<std::size_t>(out_features_) * in_features_);
    for (float& w : weights_.data()) {
        w = dist(rng);
    }
    bias_.data().assign(out_features_, 0.0f);
}

void Affine::forward(const float* input, float* output, int rows) const {
    const float* w = weights_.data().data();
    const float* b = bias_.data().data();
    for (int r = 0; r < rows; ++r) {
        for (int o = 0; o < out_features_; ++o) {
            float sum = b[o];
            for (int i = 0; i < in_features_; ++i) {
                sum += input[r * in_features_ + i] * w[o * in_features_ + i];
            }
            output[r * out_features_ + o] = sum;
        }
    }
}

seq::RereaderPtr Affine::apply(const seq::RereaderPtr& in) {
    auto [out, writer] = seq::Tape::create();
    seq::TapeReader reader = in->output().read();
    while (auto x = reader.next()) {
        if (x->width() != in_features_) {
            throw std::invalid_argument("Affine expects " + std::to_string(in_features_) +
                                        " inputs, got " + std::to_string(x->width()));
        }
        std::vector<float> y(static_cast<std::size_t>(x->num_present()) * out_features_);
        forward(x->packed().data(), y.data(), x->num_present());
        writer.write(seq::Batch(x->present(), out_features_, std::move(y)));
    }
    writer.close();
    return std::make_shared<AffineRes>(*this, in, out);
}

// ============================================================================
// Tanh
// ============================================================================

seq::RereaderPtr Tanh::apply(const seq::RereaderPtr& in) {
    auto [out, writer] = seq::Tape::create();
    seq::TapeReader reader = in->output().read();
    while (auto x = reader.next()) {
        for (float& v : x->packed()) {
            v = std::tanh(v);
        }
        writer.write(std::move(*x));
    }
    writer.close();
    return std::make_shared<TanhRes>(in, out);
}

// ============================================================================
// Chain
// ============================================================================

seq::RereaderPtr Chain::apply(const seq::RereaderPtr& in) {
    seq::RereaderPtr out = in;
    for (auto* func : funcs_) {
        out = func->apply(out);
    }
    return out;
}

} // namespace tapepg::model
