#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <ostream>

namespace tapepg::training {

enum class Phase {
    Idle,
    Collecting,    // Parameters are read to act in environments
    Training       // Gradients are applied or parameters persisted
};

std::ostream& operator<<(std::ostream& os, Phase phase);

class PhaseGate;

/**
 * Holds a gate in one phase until destroyed or released.
 */
class PhaseLease {
public:
    PhaseLease(PhaseLease&& other) noexcept;
    PhaseLease& operator=(PhaseLease&& other) noexcept;
    PhaseLease(const PhaseLease&) = delete;
    PhaseLease& operator=(const PhaseLease&) = delete;

    ~PhaseLease() { release(); }

    void release();

    bool held() const { return gate_ != nullptr; }
    Phase phase() const { return phase_; }

private:
    friend class PhaseGate;
    PhaseLease(PhaseGate* gate, Phase phase) : gate_(gate), phase_(phase) {}

    PhaseGate* gate_;
    Phase phase_;
};

/**
 * Mutual exclusion between collecting rollouts and updating parameters.
 * One lease at a time; acquire() blocks while another lease is held.
 */
class PhaseGate {
public:
    PhaseGate() = default;
    PhaseGate(const PhaseGate&) = delete;
    PhaseGate& operator=(const PhaseGate&) = delete;

    // Throws std::invalid_argument for Phase::Idle
    PhaseLease acquire(Phase phase);

    // Non-blocking; an unheld lease when the gate is busy
    PhaseLease try_acquire(Phase phase);

    Phase current() const;

    // Number of times the gate entered phase
    uint64_t transitions(Phase phase) const;

private:
    friend class PhaseLease;
    void leave();

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    Phase phase_ = Phase::Idle;
    uint64_t collecting_count_ = 0;
    uint64_t training_count_ = 0;
    uint64_t idle_count_ = 0;
};

} // namespace tapepg::training
