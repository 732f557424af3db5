#include <gtest/gtest.h>

#include "seq/FrameCodec.hpp"
#include <cmath>
#include <stdexcept>

using tapepg::seq::Batch;
using tapepg::seq::FrameDecoder;
using tapepg::seq::FrameEncoder;

TEST(FrameCodecTest, GridValuesRoundTripExactly) {
    FrameEncoder encoder(0.0f, 255.0f);
    FrameDecoder decoder(0.0f, 255.0f);

    Batch first({true, true, false}, 3, {0, 17, 255, 3, 3, 3});
    Batch second({true, true, false}, 3, {1, 17, 254, 3, 3, 3});

    Batch a = decoder.decode(encoder.encode(first, true));
    Batch b = decoder.decode(encoder.encode(second, false));

    EXPECT_EQ(first.present(), a.present());
    EXPECT_EQ(first.packed(), a.packed());
    EXPECT_EQ(second.packed(), b.packed());
}

TEST(FrameCodecTest, QuantizesOffGridValues) {
    FrameEncoder encoder(-1.0f, 1.0f);
    FrameDecoder decoder(-1.0f, 1.0f);

    Batch batch = Batch::scalars({true, true, true}, {0.1234f, -5.0f, 5.0f});
    Batch out = decoder.decode(encoder.encode(batch, true));

    EXPECT_NEAR(0.1234f, out.packed()[0], 2.0f / 255.0f);
    // Out-of-range values saturate
    EXPECT_FLOAT_EQ(-1.0f, out.packed()[1]);
    EXPECT_FLOAT_EQ(1.0f, out.packed()[2]);
}

TEST(FrameCodecTest, UnchangedFramesCompressToRuns) {
    FrameEncoder encoder(0.0f, 255.0f);
    Batch batch({true, true}, 64, std::vector<float>(128, 42.0f));

    encoder.encode(batch, true);
    auto repeat = encoder.encode(batch, false);

    // 128 zero deltas fit in a single run
    EXPECT_EQ(2u, repeat.bytes.size());
    EXPECT_FALSE(repeat.keyframe);
}

TEST(FrameCodecTest, RejectsNaN) {
    FrameEncoder encoder(0.0f, 1.0f);
    Batch batch = Batch::scalars({true, true}, {0.5f, std::nanf("")});
    EXPECT_THROW(encoder.encode(batch, true), std::invalid_argument);

    // A rejected frame leaves the encoder usable
    FrameDecoder decoder(0.0f, 1.0f);
    Batch ok = Batch::scalars({true, true}, {0.0f, 1.0f});
    EXPECT_EQ(ok.packed(), decoder.decode(encoder.encode(ok, true)).packed());
}

TEST(FrameCodecTest, DecodingMustStartAtKeyframe) {
    FrameEncoder encoder(0.0f, 255.0f);
    Batch batch = Batch::scalars({true}, {10});
    encoder.encode(batch, true);
    auto delta = encoder.encode(batch, false);

    FrameDecoder decoder(0.0f, 255.0f);
    EXPECT_THROW(decoder.decode(delta), std::logic_error);
}

TEST(FrameCodecTest, RejectsEmptyRange) {
    EXPECT_THROW(FrameEncoder(1.0f, 1.0f), std::invalid_argument);
    EXPECT_THROW(FrameDecoder(2.0f, 1.0f), std::invalid_argument);
}
