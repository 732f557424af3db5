#include "seq/Tape.hpp"
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>

namespace tapepg::seq {

namespace detail {

struct TapeState {
    explicit TapeState(const TapeConfig& cfg) : config(cfg) {
        config.validate();
        if (config.storage == TapeStorage::Compressed) {
            encoder = std::make_unique<FrameEncoder>(config.range_min, config.range_max);
        }
    }

    TapeConfig config;

    mutable std::mutex mutex;
    mutable std::condition_variable cv;

    bool closed = false;
    int num_lanes = 0;
    int width = 0;
    LaneMask last_present;

    std::vector<Batch> batches;           // Reference storage
    std::vector<EncodedFrame> frames;     // Compressed storage
    std::unique_ptr<FrameEncoder> encoder;

    std::size_t size() const {
        return config.storage == TapeStorage::Reference ? batches.size() : frames.size();
    }

    StepIndex checkpoint_before(StepIndex step) const {
        StepIndex interval = static_cast<StepIndex>(config.checkpoint_interval);
        return (step / interval) * interval;
    }

    // Waits until step is written or the tape is closed; true if step exists
    bool wait_for(std::unique_lock<std::mutex>& lock, StepIndex step) const {
        cv.wait(lock, [&] { return closed || step < size(); });
        return step < size();
    }

    void wait_closed(std::unique_lock<std::mutex>& lock) const {
        cv.wait(lock, [&] { return closed; });
    }

    void check_shape(const Batch& batch) {
        if (size() == 0) {
            num_lanes = batch.num_lanes();
            width = batch.width();
            last_present = batch.present();
            return;
        }
        if (batch.num_lanes() != num_lanes) {
            throw std::invalid_argument("Tape lane count changed from " + std::to_string(num_lanes) +
                                        " to " + std::to_string(batch.num_lanes()));
        }
        if (batch.width() != width) {
            throw std::invalid_argument("Tape width changed from " + std::to_string(width) +
                                        " to " + std::to_string(batch.width()));
        }
        for (int lane = 0; lane < num_lanes; ++lane) {
            if (batch.present()[lane] && !last_present[lane]) {
                throw std::invalid_argument("Lane " + std::to_string(lane) +
                                            " reappeared after its episode ended");
            }
        }
        last_present = batch.present();
    }
};

} // namespace detail

using detail::TapeState;

// ============================================================================
// Tape
// ============================================================================

Tape::Tape() : state_(std::make_shared<TapeState>(TapeConfig{})) {
    state_->closed = true;
}

Tape::Tape(std::shared_ptr<TapeState> state) : state_(std::move(state)) {
}

std::pair<Tape, TapeWriter> Tape::create(const TapeConfig& config) {
    auto state = std::make_shared<TapeState>(config);
    return {Tape(state), TapeWriter(state)};
}

Tape Tape::from_batches(const std::vector<Batch>& batches, const TapeConfig& config) {
    auto [tape, writer] = create(config);
    for (const auto& b : batches) {
        writer.write(b);
    }
    writer.close();
    return tape;
}

const TapeConfig& Tape::config() const {
    return state_->config;
}

bool Tape::is_closed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->closed;
}

std::size_t Tape::num_steps() const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->wait_closed(lock);
    return state_->size();
}

int Tape::num_lanes() const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->wait_for(lock, 0);
    return state_->num_lanes;
}

int Tape::width() const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->wait_for(lock, 0);
    return state_->width;
}

TapeReader Tape::read(StepIndex start) const {
    return TapeReader(state_, start);
}

Batch Tape::at(StepIndex step) const {
    StepIndex checkpoint = 0;
    std::vector<EncodedFrame> frames;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (!state_->wait_for(lock, step)) {
            throw std::out_of_range("Tape step " + std::to_string(step) +
                                    " out of range (" + std::to_string(state_->size()) +
                                    " steps)");
        }
        if (state_->config.storage == TapeStorage::Reference) {
            return state_->batches[step];
        }
        checkpoint = state_->checkpoint_before(step);
        frames.assign(state_->frames.begin() + checkpoint, state_->frames.begin() + step + 1);
    }

    FrameDecoder decoder(state_->config.range_min, state_->config.range_max);
    Batch result;
    for (const auto& frame : frames) {
        result = decoder.decode(frame);
    }
    return result;
}

std::vector<Batch> Tape::collect() const {
    std::vector<Batch> result;
    TapeReader reader = read();
    while (auto batch = reader.next()) {
        result.push_back(std::move(*batch));
    }
    return result;
}

// ============================================================================
// Writer
// ============================================================================

TapeWriter::TapeWriter(std::shared_ptr<TapeState> state) : state_(std::move(state)) {
}

TapeWriter& TapeWriter::operator=(TapeWriter&& other) noexcept {
    if (this != &other) {
        if (state_) {
            close();
        }
        state_ = std::move(other.state_);
    }
    return *this;
}

TapeWriter::~TapeWriter() {
    if (state_) {
        close();
    }
}

void TapeWriter::write(Batch batch) {
    if (!state_) {
        throw std::logic_error("Write through a moved-from TapeWriter");
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->closed) {
            throw std::logic_error("Write to a closed tape");
        }
        state_->check_shape(batch);

        if (state_->config.storage == TapeStorage::Reference) {
            state_->batches.push_back(std::move(batch));
        } else {
            std::size_t step = state_->frames.size();
            bool keyframe = step % static_cast<std::size_t>(state_->config.checkpoint_interval) == 0;
            state_->frames.push_back(state_->encoder->encode(batch, keyframe));
        }
    }
    state_->cv.notify_all();
}

void TapeWriter::close() {
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
        state_->encoder.reset();
    }
    state_->cv.notify_all();
}

// ============================================================================
// Reader
// ============================================================================

TapeReader::TapeReader(std::shared_ptr<TapeState> state, StepIndex start)
    : state_(std::move(state)), pos_(start), decode_pos_(start) {
    if (state_->config.storage == TapeStorage::Compressed) {
        decoder_ = std::make_unique<FrameDecoder>(state_->config.range_min,
                                                  state_->config.range_max);
        decode_pos_ = state_->checkpoint_before(start);
    }
}

std::optional<Batch> TapeReader::next() {
    if (!decoder_) {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (!state_->wait_for(lock, pos_)) {
            return std::nullopt;
        }
        return state_->batches[pos_++];
    }

    // Decode forward from the checkpoint until the requested position
    while (true) {
        EncodedFrame frame;
        {
            std::unique_lock<std::mutex> lock(state_->mutex);
            if (!state_->wait_for(lock, decode_pos_)) {
                return std::nullopt;
            }
            frame = state_->frames[decode_pos_];
        }
        Batch batch = decoder_->decode(frame);
        if (decode_pos_++ == pos_) {
            ++pos_;
            return batch;
        }
    }
}

} // namespace tapepg::seq
