#include <gtest/gtest.h>
#include "audio/LevelMeter.hpp"
#include <cmath>

static PcmChunk constantChunk(int16_t value, size_t frames) {
    PcmChunk c;
    c.sampleRate = 48000;
    c.samples.assign(frames * c.channelCount, value);
    return c;
}

TEST(LevelMeterTest, SilenceFloorsAtMinus96) {
    auto l = LevelMeter::measure(constantChunk(0, 64));
    EXPECT_FLOAT_EQ(l.rms, 0.0f);
    EXPECT_FLOAT_EQ(l.rmsDB, -96.0f);
    EXPECT_FLOAT_EQ(l.peakDB, -96.0f);
    EXPECT_FALSE(l.clipped);
}

TEST(LevelMeterTest, FullScaleIsZeroDBFS) {
    auto l = LevelMeter::measure(constantChunk(32767, 64));
    EXPECT_NEAR(l.peakDB, 0.0f, 0.01f);
    EXPECT_NEAR(l.rmsDB, 0.0f, 0.01f);
    EXPECT_TRUE(l.clipped);
}

TEST(LevelMeterTest, HalfScaleIsAboutMinus6) {
    auto l = LevelMeter::measure(constantChunk(16384, 64));
    EXPECT_NEAR(l.peakDB, -6.02f, 0.05f);
}

TEST(LevelMeterTest, EmptyChunk) {
    PcmChunk empty;
    auto l = LevelMeter::measure(empty);
    EXPECT_FLOAT_EQ(l.peak, 0.0f);
    EXPECT_FLOAT_EQ(l.peakDB, -96.0f);
}

TEST(LevelMeterTest, AccumulatesAndResets) {
    LevelMeter meter;
    meter.add(constantChunk(0, 100));
    meter.add(constantChunk(16384, 100));
    EXPECT_EQ(meter.chunks(), 2u);
    EXPECT_EQ(meter.frames(), 200u);

    auto l = meter.current();
    EXPECT_NEAR(l.peak, 16384.0f / 32767.0f, 1e-4f);
    // Half the samples are silent
    EXPECT_NEAR(l.rms, std::sqrt(0.5f) * (16384.0f / 32767.0f), 1e-3f);

    meter.reset();
    EXPECT_EQ(meter.chunks(), 0u);
    EXPECT_FLOAT_EQ(meter.current().rmsDB, -96.0f);
}

TEST(LevelMeterTest, CountsChunksThatHitFullScale) {
    LevelMeter meter;
    meter.add(constantChunk(1000, 32));
    meter.add(constantChunk(INT16_MIN, 32));
    meter.add(constantChunk(-1000, 32));
    meter.add(constantChunk(32767, 32));
    EXPECT_EQ(meter.clippedChunks(), 2u);
    EXPECT_TRUE(meter.current().clipped);

    meter.reset();
    meter.add(constantChunk(32000, 32));
    EXPECT_EQ(meter.clippedChunks(), 0u);
    EXPECT_FALSE(meter.current().clipped);
}
