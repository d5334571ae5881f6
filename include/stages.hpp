#pragma once

#include "frame.hpp"

namespace swisp {

/**
 * @file stages.hpp
 * @brief Pixel transform stages of the grading pipeline
 *
 * Each stage is a pure function: the input frame is never modified and a
 * new frame of identical dimensions is returned. Every stage throws
 * InputShapeError for a malformed frame before touching any pixel.
 */

/**
 * Linear brightness/contrast adjustment
 *
 * alpha = 1 + 0.02 * max(0, contrast_units), beta = round(brightness),
 * out = saturate(round(alpha * in + beta)).
 *
 * @param frame Input frame
 * @param brightness Additive offset in 8-bit levels
 * @param contrast_units Contrast setting, 0..100 maps to gain 1..3
 */
Frame apply_brightness_contrast(const Frame& frame, double brightness, double contrast_units);

/**
 * Scale red and blue against green using the gains of a color temperature
 * @param frame Input frame
 * @param kelvin Color temperature; higher is cooler
 */
Frame apply_white_balance(const Frame& frame, double kelvin);

/**
 * Rotate hue and offset saturation in 8-bit HSV space
 *
 * Hue lives on a 180-step wheel. The shift is floor(round(hue_units * 2) / 2),
 * applied modulo 180.
 *
 * @param frame Input frame
 * @param hue_units Hue setting, -90..90
 * @param sat_units Saturation offset added to S, result clamped to 0..255
 */
Frame apply_hue_saturation(const Frame& frame, double hue_units, int sat_units);

/**
 * Unsharp mask with a sigma 1.2 Gaussian
 *
 * amount = 0.05 * max(0, sharp_units). An amount of (almost) zero returns
 * an exact copy of the input.
 */
Frame apply_sharpness(const Frame& frame, double sharp_units);

constexpr double SHARPEN_SIGMA = 1.2;

} // namespace swisp
