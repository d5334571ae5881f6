#include <gtest/gtest.h>
#include <cstdlib>
#include "stages.hpp"
#include "test_helpers.hpp"

using namespace swisp;
using swisp::test::make_random_frame;
using swisp::test::make_uniform_frame;

namespace {

void expect_pixel(const Frame& frame, uint32_t x, uint32_t y, int b, int g, int r, int tolerance = 0)
{
    const uint8_t* px = frame.pixel(x, y);
    EXPECT_NEAR(px[0], b, tolerance) << "B at " << x << "," << y;
    EXPECT_NEAR(px[1], g, tolerance) << "G at " << x << "," << y;
    EXPECT_NEAR(px[2], r, tolerance) << "R at " << x << "," << y;
}

Frame make_bad_channel_frame()
{
    Frame frame(4, 4);
    frame.channels = 4;
    return frame;
}

Frame make_short_buffer_frame()
{
    Frame frame(4, 4);
    frame.data.resize(10);
    return frame;
}

} // anonymous namespace

// ============================================================================
// Brightness / contrast
// ============================================================================

TEST(BrightnessContrast, AddsBrightnessOffset)
{
    const Frame in = make_uniform_frame(3, 2, 100, 50, 200);
    const Frame out = apply_brightness_contrast(in, 20, 0);
    expect_pixel(out, 0, 0, 120, 70, 220);
    expect_pixel(out, 2, 1, 120, 70, 220);
}

TEST(BrightnessContrast, ContrastScalesAroundZero)
{
    const Frame in = make_uniform_frame(2, 2, 100, 10, 0);
    // 50 units -> alpha 2
    const Frame out = apply_brightness_contrast(in, 0, 50);
    expect_pixel(out, 1, 1, 200, 20, 0);
}

TEST(BrightnessContrast, SaturatesInsteadOfWrapping)
{
    const Frame bright = apply_brightness_contrast(make_uniform_frame(2, 2, 200, 200, 200), 0, 100);
    expect_pixel(bright, 0, 0, 255, 255, 255);

    // Negative results clamp to zero, they are not mirrored
    const Frame dark = apply_brightness_contrast(make_uniform_frame(2, 2, 50, 50, 50), -100, 0);
    expect_pixel(dark, 0, 0, 0, 0, 0);
}

TEST(BrightnessContrast, NegativeContrastIsIgnored)
{
    const Frame in = make_random_frame(8, 8, 7);
    const Frame out = apply_brightness_contrast(in, 0, -50);
    EXPECT_EQ(out.data, in.data);
}

TEST(BrightnessContrast, BrightnessIsRounded)
{
    const Frame in = make_uniform_frame(1, 1, 10, 10, 10);
    expect_pixel(apply_brightness_contrast(in, 4.6, 0), 0, 0, 15, 15, 15);
    expect_pixel(apply_brightness_contrast(in, -4.6, 0), 0, 0, 5, 5, 5);
}

TEST(BrightnessContrast, LeavesInputUntouchedAndKeepsMetadata)
{
    Frame in = make_random_frame(5, 3, 11);
    in.frame_index = 42;
    in.timestamp = 1234;
    const Frame copy = in;

    const Frame out = apply_brightness_contrast(in, 30, 30);
    EXPECT_EQ(in.data, copy.data);
    EXPECT_EQ(out.width, 5u);
    EXPECT_EQ(out.height, 3u);
    EXPECT_EQ(out.frame_index, 42u);
    EXPECT_EQ(out.timestamp, 1234u);
}

// ============================================================================
// White balance
// ============================================================================

TEST(WhiteBalance, NeutralTemperatureIsIdentity)
{
    const Frame in = make_random_frame(9, 7, 3);
    const Frame out = apply_white_balance(in, 6600);
    EXPECT_EQ(out.data, in.data);
}

TEST(WhiteBalance, DaylightGray)
{
    // 5500 K: red x1.0737, blue x0.9358 relative to green
    const Frame out = apply_white_balance(make_uniform_frame(2, 2, 128, 128, 128), 5500);
    expect_pixel(out, 0, 0, 120, 128, 137);
    expect_pixel(out, 1, 1, 120, 128, 137);
}

TEST(WhiteBalance, GreenIsPivot)
{
    const Frame in = make_random_frame(6, 6, 5);
    for (int kelvin : {2000, 3500, 5000, 6500, 8000}) {
        const Frame out = apply_white_balance(in, kelvin);
        for (size_t i = 1; i < in.data.size(); i += 3) {
            ASSERT_EQ(out.data[i], in.data[i]) << "kelvin " << kelvin;
        }
    }
}

TEST(WhiteBalance, LowerTemperatureIsWarmer)
{
    const Frame in = make_uniform_frame(2, 2, 100, 100, 100);
    const Frame warm = apply_white_balance(in, 3000);
    const Frame cool = apply_white_balance(in, 8000);

    const uint8_t* w = warm.pixel(0, 0);
    const uint8_t* c = cool.pixel(0, 0);
    EXPECT_LT(w[0], c[0]);   // less blue
    EXPECT_GT(w[2], c[2]);   // more red
    EXPECT_GT(w[2], w[0]);
    EXPECT_GT(c[0], c[2]);
}

// ============================================================================
// Hue / saturation
// ============================================================================

TEST(HueSaturation, ZeroAdjustmentKeepsGray)
{
    const Frame in = make_uniform_frame(3, 3, 77, 77, 77);
    const Frame out = apply_hue_saturation(in, 0, 0);
    EXPECT_EQ(out.data, in.data);
}

TEST(HueSaturation, RotatesRedTowardsYellow)
{
    // +30 units = +60 degrees
    const Frame out = apply_hue_saturation(make_uniform_frame(2, 2, 0, 0, 255), 30, 0);
    expect_pixel(out, 0, 0, 0, 255, 255, 1);
}

TEST(HueSaturation, NegativeShiftWrapsAround)
{
    const Frame out = apply_hue_saturation(make_uniform_frame(2, 2, 0, 0, 255), -30, 0);
    expect_pixel(out, 0, 0, 255, 0, 255, 1);
}

TEST(HueSaturation, FullTurnReturnsToStart)
{
    const Frame in = make_uniform_frame(2, 2, 0, 0, 255);
    const Frame plus = apply_hue_saturation(in, 90, 0);
    const Frame minus = apply_hue_saturation(in, -90, 0);
    // +180 and -180 degrees land on the same hue (cyan)
    EXPECT_EQ(plus.data, minus.data);
    expect_pixel(plus, 0, 0, 255, 255, 0, 1);
}

TEST(HueSaturation, HalfUnitsRoundDown)
{
    const Frame in = make_random_frame(16, 16, 21);
    EXPECT_EQ(apply_hue_saturation(in, 7.5, 0).data, apply_hue_saturation(in, 7, 0).data);
    EXPECT_NE(apply_hue_saturation(in, 8, 0).data, apply_hue_saturation(in, 7, 0).data);

    // Negative half units step down to the next whole unit
    EXPECT_EQ(apply_hue_saturation(in, -7.5, 0).data, apply_hue_saturation(in, -8, 0).data);
    EXPECT_NE(apply_hue_saturation(in, -7.5, 0).data, apply_hue_saturation(in, -7, 0).data);
    EXPECT_EQ(apply_hue_saturation(in, -0.5, 0).data, apply_hue_saturation(in, -1, 0).data);
}

TEST(HueSaturation, NegativeHalfUnitOnPureRed)
{
    // -0.5 units: shift -1 degree -> -1 step, red (H=0) wraps to H=179
    const Frame in = make_uniform_frame(1, 1, 0, 0, 255);
    const Frame out = apply_hue_saturation(in, -0.5, 0);
    EXPECT_NE(out.data, in.data);
    EXPECT_EQ(out.data, apply_hue_saturation(in, -1, 0).data);
}

TEST(HueSaturation, DesaturateToGray)
{
    const Frame out = apply_hue_saturation(make_uniform_frame(2, 2, 0, 0, 200), 0, -255);
    expect_pixel(out, 0, 0, 200, 200, 200, 1);
}

TEST(HueSaturation, SaturationClampsAtMaximum)
{
    const Frame in = make_uniform_frame(2, 2, 0, 0, 255);
    const Frame out = apply_hue_saturation(in, 0, 100);
    EXPECT_EQ(out.data, in.data);
}

TEST(HueSaturation, PartialDesaturation)
{
    // V=200, S=255 -> S=155: B = G = 200 * (1 - 155/255)
    const Frame out = apply_hue_saturation(make_uniform_frame(2, 2, 0, 0, 200), 0, -100);
    expect_pixel(out, 0, 0, 78, 78, 200, 1);
}

// ============================================================================
// Sharpness
// ============================================================================

TEST(Sharpness, ZeroIsExactIdentity)
{
    Frame in = make_random_frame(13, 9, 99);
    in.frame_index = 3;
    const Frame out = apply_sharpness(in, 0);
    EXPECT_EQ(out.data, in.data);
    EXPECT_EQ(out.frame_index, 3u);

    EXPECT_EQ(apply_sharpness(in, -10).data, in.data);
}

TEST(Sharpness, FlatFrameIsUnchanged)
{
    const Frame in = make_uniform_frame(10, 10, 128, 64, 32);
    const Frame out = apply_sharpness(in, 60);
    for (size_t i = 0; i < in.data.size(); ++i) {
        ASSERT_NEAR(out.data[i], in.data[i], 1);
    }
}

TEST(Sharpness, EdgesGainContrast)
{
    Frame in = make_uniform_frame(8, 8, 100, 100, 100);
    for (uint32_t y = 0; y < 8; ++y) {
        for (uint32_t x = 4; x < 8; ++x) {
            uint8_t* px = in.pixel(x, y);
            px[0] = px[1] = px[2] = 150;
        }
    }

    const Frame out = apply_sharpness(in, 20);
    EXPECT_LT(out.pixel(3, 4)[0], 100);
    EXPECT_GT(out.pixel(4, 4)[0], 150);

    // Stronger amount overshoots further
    const Frame strong = apply_sharpness(in, 60);
    EXPECT_LT(strong.pixel(3, 4)[0], out.pixel(3, 4)[0]);
    EXPECT_GT(strong.pixel(4, 4)[0], out.pixel(4, 4)[0]);
}

// ============================================================================
// Shape validation
// ============================================================================

TEST(StageShape, MalformedFramesAreRejected)
{
    const Frame empty;
    const Frame bad_channels = make_bad_channel_frame();
    const Frame short_buffer = make_short_buffer_frame();

    for (const Frame* frame : {&empty, &bad_channels, &short_buffer}) {
        EXPECT_THROW(apply_brightness_contrast(*frame, 0, 0), InputShapeError);
        EXPECT_THROW(apply_white_balance(*frame, 5500), InputShapeError);
        EXPECT_THROW(apply_hue_saturation(*frame, 0, 0), InputShapeError);
        EXPECT_THROW(apply_sharpness(*frame, 0), InputShapeError);
    }
}
