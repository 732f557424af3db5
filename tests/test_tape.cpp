#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "seq/Tape.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace tapepg;
using seq::Batch;
using seq::Tape;

namespace {

TapeConfig compressed(int checkpoint_interval) {
    TapeConfig config;
    config.storage = TapeStorage::Compressed;
    config.checkpoint_interval = checkpoint_interval;
    return config;
}

// Integer-valued steps: exact under 8-bit quantization over [0, 255]
std::vector<Batch> ramp(int steps) {
    std::vector<Batch> batches;
    for (int t = 0; t < steps; ++t) {
        float v = static_cast<float>(t);
        batches.emplace_back(LaneMask{true, true}, 2,
                             std::vector<float>{v, 2 * v, 100 - v, 7});
    }
    return batches;
}

} // namespace

// Test fixture running every case on both backends
class TapeBackendTest : public ::testing::TestWithParam<TapeStorage> {
protected:
    TapeConfig config() const {
        TapeConfig c;
        c.storage = GetParam();
        c.checkpoint_interval = 4;
        return c;
    }
};

TEST_P(TapeBackendTest, ReplaysFromStart) {
    auto batches = ramp(10);
    Tape tape = Tape::from_batches(batches, config());

    EXPECT_TRUE(tape.is_closed());
    EXPECT_EQ(10u, tape.num_steps());
    EXPECT_EQ(2, tape.num_lanes());
    EXPECT_EQ(2, tape.width());

    // Two readers see the same sequence
    auto first = tape.collect();
    auto second = tape.collect();
    ASSERT_EQ(10u, first.size());
    for (std::size_t t = 0; t < first.size(); ++t) {
        EXPECT_EQ(batches[t].packed(), first[t].packed());
        EXPECT_EQ(batches[t].packed(), second[t].packed());
    }
}

TEST_P(TapeBackendTest, RandomAccess) {
    auto batches = ramp(11);
    Tape tape = Tape::from_batches(batches, config());

    for (StepIndex t : {0u, 3u, 4u, 7u, 10u}) {
        EXPECT_EQ(batches[t].packed(), tape.at(t).packed()) << "step " << t;
    }
    EXPECT_THROW(tape.at(11), std::out_of_range);
}

TEST_P(TapeBackendTest, ReaderStartsMidTape) {
    auto batches = ramp(9);
    Tape tape = Tape::from_batches(batches, config());

    auto reader = tape.read(6);
    auto b = reader.next();
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(batches[6].packed(), b->packed());
    EXPECT_EQ(7u, reader.position());
    EXPECT_TRUE(reader.next().has_value());
    EXPECT_TRUE(reader.next().has_value());
    EXPECT_FALSE(reader.next().has_value());
}

TEST_P(TapeBackendTest, KeepsPresencePattern) {
    Tape tape = test::scalar_tape({{1, 2, 3}, {4}, {5, 6}}, config());
    auto batches = tape.collect();
    ASSERT_EQ(3u, batches.size());
    EXPECT_EQ((LaneMask{true, true, true}), batches[0].present());
    EXPECT_EQ((LaneMask{true, false, true}), batches[1].present());
    EXPECT_EQ((LaneMask{true, false, false}), batches[2].present());
    EXPECT_EQ((std::vector<float>{2, 6}), batches[1].packed());
}

INSTANTIATE_TEST_SUITE_P(Backends, TapeBackendTest,
                         ::testing::Values(TapeStorage::Reference, TapeStorage::Compressed));

TEST(TapeTest, DefaultTapeIsEmptyAndClosed) {
    Tape tape;
    EXPECT_TRUE(tape.is_closed());
    EXPECT_EQ(0u, tape.num_steps());
    EXPECT_EQ(0, tape.num_lanes());
    EXPECT_FALSE(tape.read().next().has_value());
}

TEST(TapeTest, WriteAfterCloseThrows) {
    auto [tape, writer] = Tape::create();
    writer.write(Batch::scalars({true}, {1}));
    writer.close();
    EXPECT_THROW(writer.write(Batch::scalars({true}, {2})), std::logic_error);
    EXPECT_EQ(1u, tape.num_steps());
}

TEST(TapeTest, RejectsShapeChanges) {
    auto [tape, writer] = Tape::create();
    writer.write(Batch::scalars({true, true}, {1, 2}));
    EXPECT_THROW(writer.write(Batch::scalars({true}, {1})), std::invalid_argument);
    EXPECT_THROW(writer.write(Batch({true, true}, 2, {1, 2, 3, 4})), std::invalid_argument);
}

TEST(TapeTest, RejectsReappearingLane) {
    auto [tape, writer] = Tape::create();
    writer.write(Batch::scalars({true, true}, {1, 2}));
    writer.write(Batch::scalars({true, false}, {1}));
    EXPECT_THROW(writer.write(Batch::scalars({true, true}, {1, 2})), std::invalid_argument);
}

TEST(TapeTest, WriterClosesOnDestruction) {
    Tape tape;
    {
        auto created = Tape::create();
        tape = created.first;
        created.second.write(Batch::scalars({true}, {3}));
    }
    EXPECT_TRUE(tape.is_closed());
    EXPECT_EQ(1u, tape.num_steps());
}

TEST(TapeTest, ReaderBlocksUntilWriterProducesOrCloses) {
    auto [tape, writer] = Tape::create(compressed(2));

    std::vector<float> seen;
    std::thread reader_thread([&seen, tape = tape]() {
        auto reader = tape.read();
        while (auto b = reader.next()) {
            seen.push_back(b->packed()[0]);
        }
    });

    for (int t = 0; t < 5; ++t) {
        writer.write(Batch::scalars({true}, {static_cast<float>(t * 10)}));
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    writer.close();
    reader_thread.join();

    EXPECT_EQ((std::vector<float>{0, 10, 20, 30, 40}), seen);
}

TEST(TapeTest, CompressedKeyframesAtCheckpointInterval) {
    Tape tape = Tape::from_batches(ramp(20), compressed(8));
    // Reads landing after each checkpoint decode the same values as a full replay
    auto all = tape.collect();
    for (StepIndex t = 0; t < all.size(); ++t) {
        EXPECT_EQ(all[t].packed(), tape.read(t).next()->packed()) << "step " << t;
    }
}

TEST(TapeTest, CompressedIsLossyOffGrid) {
    TapeConfig config = compressed(4);
    config.range_min = 0.0f;
    config.range_max = 1.0f;
    Tape tape = Tape::from_batches({Batch::scalars({true}, {0.3337f})}, config);
    float value = tape.at(0).packed()[0];
    EXPECT_NEAR(0.3337f, value, 1.0f / 255.0f);
}

TEST(TapeTest, InvalidConfigThrows) {
    TapeConfig config;
    config.checkpoint_interval = 0;
    EXPECT_THROW(Tape::create(config), std::invalid_argument);
}
