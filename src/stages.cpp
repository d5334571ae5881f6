/**
 * @file stages.cpp
 * @brief Pixel transform stages built on OpenCV
 *
 * Frames are wrapped in cv::Mat headers without copying. Output frames are
 * allocated first and OpenCV writes straight into their buffers, since a
 * destination header of the right size and type is never reallocated.
 */

#include "stages.hpp"
#include "kelvin.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace swisp {

namespace {

constexpr int HUE_STEPS = 180;
constexpr double SHARPEN_EPSILON = 1e-6;
constexpr double GREEN_PIVOT_FLOOR = 1e-6;

// Read-only view; callers never write through it
cv::Mat as_mat(const Frame& frame)
{
    return cv::Mat(static_cast<int>(frame.height), static_cast<int>(frame.width), CV_8UC3,
                   const_cast<uint8_t*>(frame.data.data()));
}

cv::Mat as_mat(Frame& frame)
{
    return cv::Mat(static_cast<int>(frame.height), static_cast<int>(frame.width), CV_8UC3,
                   frame.data.data());
}

int floor_half(int value)
{
    return value >= 0 ? value / 2 : -((1 - value) / 2);
}

Frame empty_like(const Frame& frame)
{
    return Frame(frame.width, frame.height, frame.frame_index, frame.timestamp);
}

} // anonymous namespace

Frame apply_brightness_contrast(const Frame& frame, double brightness, double contrast_units)
{
    require_valid_frame(frame, "apply_brightness_contrast");

    const double alpha = 1.0 + 0.02 * std::max(0.0, contrast_units);
    const double beta = std::round(brightness);

    Frame out = empty_like(frame);
    cv::Mat dst = as_mat(out);
    as_mat(frame).convertTo(dst, CV_8U, alpha, beta);
    return out;
}

Frame apply_white_balance(const Frame& frame, double kelvin)
{
    require_valid_frame(frame, "apply_white_balance");

    // Pivot on green so only red and blue move relative to it
    const RgbGain gain = kelvin_to_gain(kelvin);
    const double pivot = std::max(static_cast<double>(gain.g), GREEN_PIVOT_FLOOR);
    const double scale[3] = {
        gain.b / pivot,
        gain.g / pivot,
        gain.r / pivot
    };

    std::vector<cv::Mat> channels;
    cv::split(as_mat(frame), channels);

    std::vector<cv::Mat> scaled(channels.size());
    for (size_t c = 0; c < channels.size(); ++c) {
        channels[c].convertTo(scaled[c], CV_8U, scale[c]);
    }

    Frame out = empty_like(frame);
    cv::Mat dst = as_mat(out);
    cv::merge(scaled, dst);
    return out;
}

Frame apply_hue_saturation(const Frame& frame, double hue_units, int sat_units)
{
    require_valid_frame(frame, "apply_hue_saturation");

    cv::Mat hsv;
    cv::cvtColor(as_mat(frame), hsv, cv::COLOR_BGR2HSV);

    // Degrees are halved back onto the 180-step wheel with floor division,
    // so an odd negative shift rounds away from zero
    const int hue_shift_deg = static_cast<int>(std::lround(hue_units * 2.0));
    const int hue_offset = floor_half(hue_shift_deg);

    for (int y = 0; y < hsv.rows; ++y) {
        cv::Vec3b* row = hsv.ptr<cv::Vec3b>(y);
        for (int x = 0; x < hsv.cols; ++x) {
            int h = (row[x][0] + hue_offset) % HUE_STEPS;
            if (h < 0) {
                h += HUE_STEPS;
            }
            row[x][0] = static_cast<uchar>(h);
            row[x][1] = cv::saturate_cast<uchar>(row[x][1] + sat_units);
        }
    }

    Frame out = empty_like(frame);
    cv::Mat dst = as_mat(out);
    cv::cvtColor(hsv, dst, cv::COLOR_HSV2BGR);
    return out;
}

Frame apply_sharpness(const Frame& frame, double sharp_units)
{
    require_valid_frame(frame, "apply_sharpness");

    const double amount = 0.05 * std::max(0.0, sharp_units);
    if (amount <= SHARPEN_EPSILON) {
        return frame;
    }

    const cv::Mat src = as_mat(frame);
    cv::Mat blurred;
    cv::GaussianBlur(src, blurred, cv::Size(0, 0), SHARPEN_SIGMA);

    Frame out = empty_like(frame);
    cv::Mat dst = as_mat(out);
    cv::addWeighted(src, 1.0 + amount, blurred, -amount, 0.0, dst);
    return out;
}

} // namespace swisp
