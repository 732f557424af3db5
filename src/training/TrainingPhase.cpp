#include "training/TrainingPhase.hpp"
#include <stdexcept>

namespace tapepg::training {

std::ostream& operator<<(std::ostream& os, Phase phase) {
    switch (phase) {
        case Phase::Idle: return os << "Idle";
        case Phase::Collecting: return os << "Collecting";
        case Phase::Training: return os << "Training";
    }
    return os << "Unknown";
}

// ============================================================================
// PhaseLease
// ============================================================================

PhaseLease::PhaseLease(PhaseLease&& other) noexcept
    : gate_(other.gate_), phase_(other.phase_) {
    other.gate_ = nullptr;
}

PhaseLease& PhaseLease::operator=(PhaseLease&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        phase_ = other.phase_;
        other.gate_ = nullptr;
    }
    return *this;
}

void PhaseLease::release() {
    if (gate_) {
        gate_->leave();
        gate_ = nullptr;
    }
}

// ============================================================================
// PhaseGate
// ============================================================================

PhaseLease PhaseGate::acquire(Phase phase) {
    if (phase == Phase::Idle) {
        throw std::invalid_argument("Cannot acquire the Idle phase");
    }
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return phase_ == Phase::Idle; });

    phase_ = phase;
    ++(phase == Phase::Collecting ? collecting_count_ : training_count_);
    return PhaseLease(this, phase);
}

PhaseLease PhaseGate::try_acquire(Phase phase) {
    if (phase == Phase::Idle) {
        throw std::invalid_argument("Cannot acquire the Idle phase");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != Phase::Idle) {
        return PhaseLease(nullptr, phase);
    }

    phase_ = phase;
    ++(phase == Phase::Collecting ? collecting_count_ : training_count_);
    return PhaseLease(this, phase);
}

Phase PhaseGate::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

uint64_t PhaseGate::transitions(Phase phase) const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (phase) {
        case Phase::Collecting: return collecting_count_;
        case Phase::Training: return training_count_;
        case Phase::Idle: return idle_count_;
    }
    return 0;
}

void PhaseGate::leave() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        phase_ = Phase::Idle;
        ++idle_count_;
    }
    idle_.notify_all();
}

} // namespace tapepg::training
