/**
 * @file kelvin.cpp
 * @brief Black-body color temperature approximation
 */

#include "kelvin.hpp"
#include <algorithm>
#include <cmath>

namespace swisp {

namespace {

double clamp_channel(double value)
{
    return std::min(std::max(value, 0.0), 255.0);
}

} // anonymous namespace

RgbGain kelvin_to_gain(double kelvin)
{
    // Curve fit works in hundreds of Kelvin
    const double k = std::min(std::max(kelvin, KELVIN_MIN), KELVIN_MAX) / 100.0;

    double r = 255.0;
    if (k > 66.0) {
        r = clamp_channel(329.698727446 * std::pow(k - 60.0, -0.1332047592));
    }

    double g;
    if (k <= 66.0) {
        g = 99.4708025861 * std::log(k) - 161.1195681661;
    }
    else {
        g = 288.1221695283 * std::pow(k - 60.0, -0.0755148492);
    }
    g = clamp_channel(g);

    double b;
    if (k >= 66.0) {
        b = 255.0;
    }
    else if (k <= 19.0) {
        b = 0.0;
    }
    else {
        b = clamp_channel(138.5177312231 * std::log(k - 10.0) - 305.0447927307);
    }

    return RgbGain(
        static_cast<float>(r / 255.0),
        static_cast<float>(g / 255.0),
        static_cast<float>(b / 255.0));
}

} // namespace swisp
