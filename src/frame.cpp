/**
 * @file frame.cpp
 * @brief Frame shape validation
 */

#include "frame.hpp"
#include <sstream>

namespace swisp {

constexpr uint32_t Frame::CHANNELS;

void require_valid_frame(const Frame& frame, const char* context)
{
    if (frame.is_valid()) {
        return;
    }

    std::ostringstream msg;
    msg << context << ": invalid frame shape "
        << frame.width << "x" << frame.height << "x" << frame.channels
        << " with " << frame.data.size() << " bytes";
    throw InputShapeError(msg.str());
}

} // namespace swisp
