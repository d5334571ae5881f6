#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "frame.hpp"

namespace swisp {

/**
 * Encoded frame data with metadata
 */
struct EncodedFrame {
    std::vector<uint8_t> compressed_data;  // JPEG-LS bitstream
    uint32_t width;
    uint32_t height;
    uint32_t frame_index;
    uint64_t timestamp;
    uint32_t near_lossless;                // 0 = lossless

    EncodedFrame()
        : width(0), height(0), frame_index(0), timestamp(0), near_lossless(0) {}
};

/**
 * @brief Encode a graded frame as 8-bit, 3-component JPEG-LS
 *
 * Samples are interleaved per pixel and stored in R,G,B order so the
 * bitstream opens correctly in other JPEG-LS readers.
 *
 * @param frame Frame to encode
 * @param output Encoded frame (output)
 * @param near_lossless NEAR parameter (0 = lossless)
 * @return true on success
 */
bool encode_frame_jpegls(const Frame& frame, EncodedFrame& output, uint32_t near_lossless = 0);

/**
 * @brief Decode a JPEG-LS bitstream produced by encode_frame_jpegls()
 * @param encoded Encoded frame
 * @param output Decoded B,G,R frame (output)
 * @return true on success
 */
bool decode_frame_jpegls(const EncodedFrame& encoded, Frame& output);

/**
 * @brief Write the raw JPEG-LS bitstream to a .jls file
 */
bool write_encoded_frame(const EncodedFrame& frame, const std::string& path);

} // namespace swisp
