/**
 * @file grading.cpp
 * @brief Fixed-order composition of the grading stages
 */

#include "grading.hpp"
#include "stages.hpp"
#include <cmath>

namespace swisp {

int effective_brightness(const ParameterSet& params)
{
    // Exposure and gain have no sensor to act on; approximate both as offset
    const double extra = params.get(Setting::EXPOSURE) + 0.6 * params.get(Setting::GAIN);
    return params.get(Setting::BRIGHTNESS) + static_cast<int>(std::lround(extra));
}

Frame render(const Frame& frame, const ParameterSet& params)
{
    require_valid_frame(frame, "render");

    Frame out = apply_brightness_contrast(
        frame,
        effective_brightness(params),
        params.get(Setting::CONTRAST));
    out = apply_white_balance(out, params.get(Setting::WHITEBALANCE_TEMPERATURE));
    out = apply_hue_saturation(out, params.get(Setting::HUE), params.get(Setting::SATURATION));
    out = apply_sharpness(out, params.get(Setting::SHARPNESS));
    return out;
}

} // namespace swisp
