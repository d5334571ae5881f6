#pragma once

#include "frame.hpp"
#include "parameters.hpp"

namespace swisp {

/**
 * @brief Render one frame through the grading chain
 *
 * Stage order is fixed:
 * 1. Brightness/contrast, with EXPOSURE + 0.6 * GAIN folded into brightness
 * 2. White balance
 * 3. Hue/saturation
 * 4. Sharpness
 *
 * Stateless and deterministic: the same frame and parameters always give
 * byte-identical output.
 *
 * @param frame Input frame (not modified)
 * @param params Parameter snapshot
 * @return Graded frame with the input's dimensions and metadata
 * @throws InputShapeError if the frame is malformed
 */
Frame render(const Frame& frame, const ParameterSet& params);

/**
 * Brightness offset actually fed to the brightness/contrast stage
 * @return BRIGHTNESS + round(EXPOSURE + 0.6 * GAIN)
 */
int effective_brightness(const ParameterSet& params);

} // namespace swisp
