#include <gtest/gtest.h>
#include "kelvin.hpp"

using swisp::RgbGain;
using swisp::kelvin_to_gain;

TEST(KelvinToGain, InputIsClampedToSupportedRange)
{
    const RgbGain low = kelvin_to_gain(500.0);
    const RgbGain floor = kelvin_to_gain(1000.0);
    EXPECT_EQ(low.r, floor.r);
    EXPECT_EQ(low.g, floor.g);
    EXPECT_EQ(low.b, floor.b);

    const RgbGain high = kelvin_to_gain(40000.0);
    const RgbGain ceiling = kelvin_to_gain(12000.0);
    EXPECT_EQ(high.r, ceiling.r);
    EXPECT_EQ(high.g, ceiling.g);
    EXPECT_EQ(high.b, ceiling.b);
}

TEST(KelvinToGain, ComponentsStayNormalized)
{
    for (int k = 0; k <= 15000; k += 25) {
        const RgbGain gain = kelvin_to_gain(k);
        EXPECT_GE(gain.r, 0.0f) << k;
        EXPECT_LE(gain.r, 1.0f) << k;
        EXPECT_GE(gain.g, 0.0f) << k;
        EXPECT_LE(gain.g, 1.0f) << k;
        EXPECT_GE(gain.b, 0.0f) << k;
        EXPECT_LE(gain.b, 1.0f) << k;
    }
}

TEST(KelvinToGain, WarmerIsRedderAndCoolerIsBluer)
{
    RgbGain previous = kelvin_to_gain(1000.0);
    for (int k = 1010; k <= 12000; k += 10) {
        const RgbGain current = kelvin_to_gain(k);
        EXPECT_GE(current.b, previous.b) << "blue decreased at " << k;
        EXPECT_LE(current.r, previous.r) << "red increased at " << k;
        previous = current;
    }

    EXPECT_GT(kelvin_to_gain(8000.0).b, kelvin_to_gain(2000.0).b);
    EXPECT_LT(kelvin_to_gain(8000.0).r, kelvin_to_gain(2000.0).r);
}

TEST(KelvinToGain, NeutralAt6600)
{
    const RgbGain gain = kelvin_to_gain(6600.0);
    EXPECT_EQ(gain.r, 1.0f);
    EXPECT_EQ(gain.g, 1.0f);
    EXPECT_EQ(gain.b, 1.0f);
}

TEST(KelvinToGain, KnownValues)
{
    const RgbGain daylight = kelvin_to_gain(5500.0);
    EXPECT_FLOAT_EQ(daylight.r, 1.0f);
    EXPECT_NEAR(daylight.g, 237.4931 / 255.0, 1e-4);
    EXPECT_NEAR(daylight.b, 222.2455 / 255.0, 1e-4);

    // Blue channel is cut off entirely at 1900 K and below
    const RgbGain candle = kelvin_to_gain(1000.0);
    EXPECT_FLOAT_EQ(candle.r, 1.0f);
    EXPECT_NEAR(candle.g, 67.9204 / 255.0, 1e-4);
    EXPECT_EQ(candle.b, 0.0f);

    const RgbGain overcast = kelvin_to_gain(8000.0);
    EXPECT_NEAR(overcast.r, 221.2146 / 255.0, 1e-4);
    EXPECT_EQ(overcast.b, 1.0f);
}
