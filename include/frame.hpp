#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>
#include <stdexcept>

namespace swisp {

/**
 * Thrown when a frame has zero width/height, a channel count other than 3,
 * or a buffer that does not match its dimensions.
 */
class InputShapeError : public std::invalid_argument {
public:
    explicit InputShapeError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * Represents a single 8-bit color frame with metadata
 *
 * Pixels are interleaved B,G,R triplets, row-major, no padding.
 * Every stage copies frame_index and timestamp through unchanged.
 */
struct Frame {
    static constexpr uint32_t CHANNELS = 3;

    std::vector<uint8_t> data;   // width * height * channels bytes
    uint32_t width;
    uint32_t height;
    uint32_t channels;
    uint64_t timestamp;          // microseconds or frame number
    uint32_t frame_index;

    Frame() : width(0), height(0), channels(CHANNELS), timestamp(0), frame_index(0) {}

    Frame(uint32_t w, uint32_t h, uint32_t idx = 0, uint64_t ts = 0)
        : data(static_cast<size_t>(w) * h * CHANNELS, 0)
        , width(w), height(h), channels(CHANNELS)
        , timestamp(ts), frame_index(idx) {}

    size_t pixel_count() const { return static_cast<size_t>(width) * height; }

    size_t byte_count() const { return pixel_count() * channels; }

    bool is_valid() const {
        return width > 0 && height > 0 && channels == CHANNELS
               && data.size() == byte_count();
    }

    uint8_t* pixel(uint32_t x, uint32_t y) {
        return &data[(static_cast<size_t>(y) * width + x) * channels];
    }

    const uint8_t* pixel(uint32_t x, uint32_t y) const {
        return &data[(static_cast<size_t>(y) * width + x) * channels];
    }

    /**
     * Fill every pixel with one B,G,R value
     */
    void fill(uint8_t b, uint8_t g, uint8_t r) {
        for (size_t i = 0; i + 2 < data.size(); i += CHANNELS) {
            data[i] = b;
            data[i + 1] = g;
            data[i + 2] = r;
        }
    }
};

/**
 * Throw InputShapeError unless the frame satisfies the shape invariants
 * @param frame Frame to check
 * @param context Name of the operation, used in the error message
 */
void require_valid_frame(const Frame& frame, const char* context);

} // namespace swisp
