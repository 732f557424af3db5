#pragma once

#include "common/Gradient.hpp"
#include "seq/Tape.hpp"
#include <memory>

namespace tapepg::seq {

// ============================================================================
// Rereader: differentiable view over a tape
// ============================================================================

/**
 * A node of the sequence computation graph.
 *
 * output() is the forward result. propagate() receives the gradient of the
 * objective with respect to output() (same presence and width), adds the
 * parameter gradients it owns into grad and forwards input gradients to the
 * rereaders it was built from. Propagating more than once accumulates.
 */
class Rereader {
public:
    virtual ~Rereader() = default;

    virtual const Tape& output() const = 0;

    virtual void propagate(const Tape& upstream, Gradient& grad) = 0;
};

using RereaderPtr = std::shared_ptr<Rereader>;

// Constant node; gradients stop here
RereaderPtr lazify(Tape tape);

/**
 * Holds the output of an upstream node in memory so several consumers can
 * read it, sums the gradients they propagate and sends the sum upstream once
 * on flush().
 */
class PooledRereader : public Rereader {
public:
    explicit PooledRereader(RereaderPtr source);

    const Tape& output() const override { return pooled_; }

    // Accumulates; nothing reaches the source until flush()
    void propagate(const Tape& upstream, Gradient& grad) override;

    // Propagate the summed gradient to the source and reset the sum
    void flush(Gradient& grad);

private:
    RereaderPtr source_;
    Tape pooled_;
    std::vector<Batch> grad_sum_;
};

// ============================================================================
// SeqFunc: differentiable function capability
// ============================================================================

/**
 * A differentiable map from one sequence to another (Base, Actor, Critic).
 * Implementations must give numerically consistent results when applied more
 * than once to the same input.
 */
class SeqFunc {
public:
    virtual ~SeqFunc() = default;

    virtual RereaderPtr apply(const RereaderPtr& in) = 0;
};

// Identity; the Base used when actor and critic read observations directly
class PassthroughFunc : public SeqFunc {
public:
    RereaderPtr apply(const RereaderPtr& in) override { return in; }
};

} // namespace tapepg::seq
