#pragma once

namespace swisp {

/**
 * @file kelvin.hpp
 * @brief Color temperature to RGB gain conversion
 *
 * Approximates the color of a black-body illuminant with the piecewise
 * curve fit popularized by Tanner Helland. Input is clamped to
 * [1000, 12000] K, so the conversion is defined for every input.
 */

/**
 * Normalized RGB gain triple, each component in [0, 1]
 */
struct RgbGain {
    float r;
    float g;
    float b;

    RgbGain() : r(1.0f), g(1.0f), b(1.0f) {}
    RgbGain(float red, float green, float blue) : r(red), g(green), b(blue) {}
};

constexpr double KELVIN_MIN = 1000.0;
constexpr double KELVIN_MAX = 12000.0;

/**
 * Convert a color temperature to a normalized RGB gain
 * @param kelvin Color temperature in Kelvin (clamped to [1000, 12000])
 * @return Gain triple, each channel in [0, 1]
 */
RgbGain kelvin_to_gain(double kelvin);

} // namespace swisp
