#include <gtest/gtest.h>
#include "audio/SampleConvert.hpp"
#include <cmath>
#include <limits>
#include <vector>

TEST(SampleConvertTest, FloatRoundsHalfAwayFromZero) {
    EXPECT_EQ(SampleConvert::fromFloat(0.5f), 16384);
    EXPECT_EQ(SampleConvert::fromFloat(-0.5f), -16384);
    EXPECT_EQ(SampleConvert::fromFloat(0.0f), 0);
    EXPECT_EQ(SampleConvert::fromFloat(1.0f), 32767);
    EXPECT_EQ(SampleConvert::fromFloat(-1.0f), -32767);
}

TEST(SampleConvertTest, FloatClampsOutOfRange) {
    EXPECT_EQ(SampleConvert::fromFloat(2.5f), 32767);
    EXPECT_EQ(SampleConvert::fromFloat(-7.0f), -32767);
    EXPECT_EQ(SampleConvert::fromFloat(std::numeric_limits<float>::quiet_NaN()), 0);
}

TEST(SampleConvertTest, SignIsPreserved) {
    for (float x : {0.001f, 0.1f, 0.33f, 0.9f}) {
        EXPECT_GT(SampleConvert::fromFloat(x), 0) << x;
        EXPECT_LT(SampleConvert::fromFloat(-x), 0) << x;
    }
}

TEST(SampleConvertTest, IntegerFormats) {
    EXPECT_EQ(SampleConvert::fromUInt16(0), -32768);
    EXPECT_EQ(SampleConvert::fromUInt16(32768), 0);
    EXPECT_EQ(SampleConvert::fromUInt16(65535), 32767);

    EXPECT_EQ(SampleConvert::fromInt32(std::numeric_limits<int32_t>::max()), 32767);
    EXPECT_EQ(SampleConvert::fromInt32(std::numeric_limits<int32_t>::min()), -32768);
    EXPECT_EQ(SampleConvert::fromInt32(0x00010000), 1);

    EXPECT_EQ(SampleConvert::fromInt8(1), 256);
    EXPECT_EQ(SampleConvert::fromInt8(-128), -32768);

    EXPECT_EQ(SampleConvert::fromUInt8(128), 0);
    EXPECT_EQ(SampleConvert::fromUInt8(0), -32768);
    EXPECT_EQ(SampleConvert::fromUInt8(255), 127 * 256);
}

TEST(SampleConvertTest, ConvertBuffer) {
    std::vector<float> in = {0.5f, -0.5f, 0.0f, 1.0f};
    std::vector<int16_t> out;
    ASSERT_TRUE(SampleConvert::convert(in.data(), in.size(), SampleFormat::Float32, out));
    EXPECT_EQ(out, (std::vector<int16_t>{16384, -16384, 0, 32767}));

    std::vector<int16_t> pcm = {1, -2, 3};
    ASSERT_TRUE(SampleConvert::convert(pcm.data(), pcm.size(), SampleFormat::Int16, out));
    EXPECT_EQ(out, pcm);

    std::vector<uint8_t> u8 = {128, 129};
    ASSERT_TRUE(SampleConvert::convert(u8.data(), u8.size(), SampleFormat::UInt8, out));
    EXPECT_EQ(out, (std::vector<int16_t>{0, 256}));
}

TEST(SampleConvertTest, UnsupportedFormatYieldsNothing) {
    std::vector<int16_t> in = {1, 2, 3};
    std::vector<int16_t> out = {9};
    EXPECT_FALSE(SampleConvert::convert(in.data(), in.size(), SampleFormat::Unsupported, out));
    EXPECT_TRUE(out.empty());
}

TEST(SampleConvertTest, ClampToInt16) {
    EXPECT_EQ(SampleConvert::clampToInt16(40000), 32767);
    EXPECT_EQ(SampleConvert::clampToInt16(-40000), -32768);
    EXPECT_EQ(SampleConvert::clampToInt16(123), 123);
}
