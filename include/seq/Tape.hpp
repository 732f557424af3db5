#pragma once

#include "common/Config.hpp"
#include "seq/Batch.hpp"
#include "seq/FrameCodec.hpp"
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace tapepg::seq {

namespace detail {
struct TapeState;
}

class TapeReader;
class TapeWriter;

// ============================================================================
// Tape
// ============================================================================

/**
 * Write-once, multiply-readable sequence of time-indexed batches.
 *
 * A tape is filled by its TapeWriter and becomes read-only once the writer is
 * closed. Handles are cheap to copy and share the same storage, which is
 * released together with the last handle, reader or writer.
 *
 * The backend is chosen by TapeConfig::storage:
 *   - Reference: batches kept as-is, random access in O(1).
 *   - Compressed: 8-bit delta frames; reads decode forward from the nearest
 *     keyframe at or before the requested step.
 *
 * Reads wait for the writer: a reader past the written end blocks until the
 * next batch arrives or the tape is closed.
 */
class Tape {
public:
    // Empty, closed reference tape
    Tape();

    static std::pair<Tape, TapeWriter> create(const TapeConfig& config = {});

    // Write all batches into a new tape and close it
    static Tape from_batches(const std::vector<Batch>& batches, const TapeConfig& config = {});

    const TapeConfig& config() const;
    TapeStorage storage() const { return config().storage; }

    bool is_closed() const;

    // Number of steps; waits until the tape is closed
    std::size_t num_steps() const;

    // Lane count and value width; 0 for an empty tape
    int num_lanes() const;
    int width() const;

    TapeReader read(StepIndex start = 0) const;

    // Throws std::out_of_range past the end of a closed tape
    Batch at(StepIndex step) const;

    std::vector<Batch> collect() const;

private:
    explicit Tape(std::shared_ptr<detail::TapeState> state);

    std::shared_ptr<detail::TapeState> state_;
};

// ============================================================================
// Writer
// ============================================================================

class TapeWriter {
public:
    TapeWriter(TapeWriter&& other) noexcept = default;
    TapeWriter& operator=(TapeWriter&& other) noexcept;
    TapeWriter(const TapeWriter&) = delete;
    TapeWriter& operator=(const TapeWriter&) = delete;

    // Closes the tape if still open
    ~TapeWriter();

    /**
     * Append the next step.
     * Lane count and width must match earlier steps and no lane may reappear
     * after being absent.
     */
    void write(Batch batch);

    void close();

private:
    friend class Tape;
    explicit TapeWriter(std::shared_ptr<detail::TapeState> state);

    std::shared_ptr<detail::TapeState> state_;
};

// ============================================================================
// Reader
// ============================================================================

class TapeReader {
public:
    // Next batch, or nullopt once the closed tape is exhausted
    std::optional<Batch> next();

    StepIndex position() const { return pos_; }

private:
    friend class Tape;
    TapeReader(std::shared_ptr<detail::TapeState> state, StepIndex start);

    std::shared_ptr<detail::TapeState> state_;
    StepIndex pos_;
    StepIndex decode_pos_;
    std::unique_ptr<FrameDecoder> decoder_;
};

} // namespace tapepg::seq
