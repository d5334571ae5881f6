/**
 * @file encoder.cpp
 * @brief CharLS JPEG-LS sink for graded 8-bit color frames
 *
 * Frames are B,G,R in memory; the bitstream carries R,G,B with samples
 * interleaved per pixel.
 */

#include "encoder.hpp"
#include <charls/charls_jpegls_encoder.h>
#include <charls/charls_jpegls_decoder.h>
#include <charls/public_types.h>
#include <fstream>
#include <iostream>
#include <utility>

namespace swisp {

namespace {

constexpr int CHARLS_SUCCESS = 0;
constexpr int BITS_PER_SAMPLE = 8;

// Log a failed CharLS call; true if `err` is an error
bool charls_failed(charls_jpegls_errc err, const char* step)
{
    if (static_cast<int>(err) == CHARLS_SUCCESS) {
        return false;
    }
    std::cerr << "CharLS " << step << " failed: " << static_cast<int>(err) << std::endl;
    return true;
}

void swap_red_blue(std::vector<uint8_t>& samples)
{
    for (size_t i = 0; i + 2 < samples.size(); i += Frame::CHANNELS) {
        std::swap(samples[i], samples[i + 2]);
    }
}

uint32_t row_stride(uint32_t width)
{
    return width * static_cast<uint32_t>(Frame::CHANNELS);
}

// Runs every encoder call; the caller owns and destroys `encoder`
bool run_encoder(charls_jpegls_encoder* encoder, const Frame& frame,
                 const std::vector<uint8_t>& rgb, uint32_t near_lossless,
                 std::vector<uint8_t>& destination)
{
    charls_frame_info info = {};
    info.width = frame.width;
    info.height = frame.height;
    info.bits_per_sample = BITS_PER_SAMPLE;
    info.component_count = static_cast<int32_t>(Frame::CHANNELS);

    if (charls_failed(charls_jpegls_encoder_set_frame_info(encoder, &info), "set_frame_info") ||
        charls_failed(charls_jpegls_encoder_set_interleave_mode(encoder, charls::interleave_mode::sample),
                      "set_interleave_mode") ||
        charls_failed(charls_jpegls_encoder_set_near_lossless(encoder, static_cast<int32_t>(near_lossless)),
                      "set_near_lossless")) {
        return false;
    }

    size_t estimate = 0;
    if (charls_failed(charls_jpegls_encoder_get_estimated_destination_size(encoder, &estimate),
                      "get_estimated_destination_size")) {
        return false;
    }

    // Headroom for incompressible (noisy) frames
    destination.resize(estimate + estimate / 10 + 1024);

    if (charls_failed(charls_jpegls_encoder_set_destination_buffer(
                          encoder, destination.data(), destination.size()),
                      "set_destination_buffer") ||
        charls_failed(charls_jpegls_encoder_encode_from_buffer(
                          encoder, rgb.data(), rgb.size(), row_stride(frame.width)),
                      "encode")) {
        return false;
    }

    size_t written = 0;
    if (charls_failed(charls_jpegls_encoder_get_bytes_written(encoder, &written), "get_bytes_written")) {
        return false;
    }
    destination.resize(written);
    return true;
}

bool run_decoder(charls_jpegls_decoder* decoder, const EncodedFrame& encoded, Frame& output)
{
    if (charls_failed(charls_jpegls_decoder_set_source_buffer(
                          decoder, encoded.compressed_data.data(), encoded.compressed_data.size()),
                      "set_source_buffer") ||
        charls_failed(charls_jpegls_decoder_read_header(decoder), "read_header")) {
        return false;
    }

    charls_frame_info info = {};
    if (charls_failed(charls_jpegls_decoder_get_frame_info(decoder, &info), "get_frame_info")) {
        return false;
    }

    if (info.bits_per_sample != BITS_PER_SAMPLE ||
        info.component_count != static_cast<int32_t>(Frame::CHANNELS)) {
        std::cerr << "JPEG-LS stream is " << info.bits_per_sample << "-bit with "
                  << info.component_count << " components, expected 8-bit color" << std::endl;
        return false;
    }

    Frame decoded(info.width, info.height, encoded.frame_index, encoded.timestamp);
    if (charls_failed(charls_jpegls_decoder_decode_to_buffer(
                          decoder, decoded.data.data(), decoded.data.size(), row_stride(decoded.width)),
                      "decode")) {
        return false;
    }

    swap_red_blue(decoded.data);
    output = std::move(decoded);
    return true;
}

} // anonymous namespace

bool encode_frame_jpegls(const Frame& frame, EncodedFrame& output, uint32_t near_lossless)
{
    if (!frame.is_valid()) {
        std::cerr << "Cannot encode invalid frame " << frame.frame_index << std::endl;
        return false;
    }

    std::vector<uint8_t> rgb = frame.data;
    swap_red_blue(rgb);

    charls_jpegls_encoder* encoder = charls_jpegls_encoder_create();
    if (!encoder) {
        std::cerr << "Failed to create CharLS encoder" << std::endl;
        return false;
    }

    std::vector<uint8_t> bitstream;
    const bool ok = run_encoder(encoder, frame, rgb, near_lossless, bitstream);
    charls_jpegls_encoder_destroy(encoder);
    if (!ok) {
        return false;
    }

    output.compressed_data = std::move(bitstream);
    output.width = frame.width;
    output.height = frame.height;
    output.frame_index = frame.frame_index;
    output.timestamp = frame.timestamp;
    output.near_lossless = near_lossless;
    return true;
}

bool decode_frame_jpegls(const EncodedFrame& encoded, Frame& output)
{
    if (encoded.compressed_data.empty()) {
        std::cerr << "Cannot decode empty JPEG-LS stream" << std::endl;
        return false;
    }

    charls_jpegls_decoder* decoder = charls_jpegls_decoder_create();
    if (!decoder) {
        std::cerr << "Failed to create CharLS decoder" << std::endl;
        return false;
    }

    const bool ok = run_decoder(decoder, encoded, output);
    charls_jpegls_decoder_destroy(decoder);
    return ok;
}

bool write_encoded_frame(const EncodedFrame& frame, const std::string& path)
{
    std::ofstream ofs(path, std::ios::binary);
    if (ofs) {
        ofs.write(reinterpret_cast<const char*>(frame.compressed_data.data()),
                  static_cast<std::streamsize>(frame.compressed_data.size()));
    }
    if (!ofs) {
        std::cerr << "Failed to write encoded frame: " << path << std::endl;
        return false;
    }
    return true;
}

} // namespace swisp
