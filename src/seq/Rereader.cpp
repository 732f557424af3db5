#include "seq/Rereader.hpp"
#include <stdexcept>
#include <string>

namespace tapepg::seq {

namespace {

class ConstRereader : public Rereader {
public:
    explicit ConstRereader(Tape tape) : tape_(std::move(tape)) {}

    const Tape& output() const override { return tape_; }

    void propagate(const Tape&, Gradient&) override {}

private:
    Tape tape_;
};

} // namespace

RereaderPtr lazify(Tape tape) {
    return std::make_shared<ConstRereader>(std::move(tape));
}

// ============================================================================
// PooledRereader
// ============================================================================

PooledRereader::PooledRereader(RereaderPtr source) : source_(std::move(source)) {
    if (!source_) {
        throw std::invalid_argument("PooledRereader: null source");
    }
    pooled_ = Tape::from_batches(source_->output().collect());
}

void PooledRereader::propagate(const Tape& upstream, Gradient&) {
    std::vector<Batch> incoming = upstream.collect();
    if (grad_sum_.empty()) {
        grad_sum_ = std::move(incoming);
        return;
    }
    if (incoming.size() != grad_sum_.size()) {
        throw std::invalid_argument("PooledRereader: gradient step count mismatch");
    }
    for (std::size_t t = 0; t < incoming.size(); ++t) {
        if (!incoming[t].same_presence(grad_sum_[t]) ||
            incoming[t].width() != grad_sum_[t].width()) {
            throw std::invalid_argument("PooledRereader: gradient shape mismatch at step " +
                                        std::to_string(t));
        }
        auto& acc = grad_sum_[t].packed();
        const auto& add = incoming[t].packed();
        for (std::size_t i = 0; i < acc.size(); ++i) {
            acc[i] += add[i];
        }
    }
}

void PooledRereader::flush(Gradient& grad) {
    if (grad_sum_.empty()) {
        return;
    }
    Tape sum = Tape::from_batches(grad_sum_);
    grad_sum_.clear();
    source_->propagate(sum, grad);
}

} // namespace tapepg::seq
