#pragma once

#include <array>
#include <cstdint>
#include <string>
#include "frame.hpp"

namespace swisp {

/**
 * Per-channel mean in B,G,R order
 */
using ChannelMeans = std::array<double, 3>;

/**
 * Mean of every channel over the whole frame
 */
ChannelMeans compute_channel_means(const Frame& frame);

/**
 * Per-frame statistics
 */
struct FrameStats {
    uint32_t frame_index;
    uint32_t width;
    uint32_t height;

    double render_time_ms;

    // Channel means before and after grading
    ChannelMeans mean_in;
    ChannelMeans mean_out;

    uint64_t output_bytes;   // Size of the written file

    FrameStats()
        : frame_index(0), width(0), height(0), render_time_ms(0),
          mean_in{{0, 0, 0}}, mean_out{{0, 0, 0}}, output_bytes(0) {}

    // Format as CSV row
    std::string to_csv() const;

    // CSV header
    static std::string csv_header();
};

/**
 * Aggregate statistics for entire session
 */
struct SessionStats {
    uint32_t total_frames;
    uint64_t total_pixels;
    uint64_t total_output_bytes;

    double total_render_time_ms;
    double avg_render_time_ms;
    double max_render_time_ms;
    double throughput_fps;

    // Average shift of each channel mean caused by grading
    ChannelMeans avg_mean_shift;

    SessionStats()
        : total_frames(0), total_pixels(0), total_output_bytes(0),
          total_render_time_ms(0), avg_render_time_ms(0),
          max_render_time_ms(0), throughput_fps(0),
          avg_mean_shift{{0, 0, 0}} {}

    // Add frame stats
    void add_frame(const FrameStats& fs);

    // Compute final averages
    void finalize();

    // Export to JSON string
    std::string to_json() const;
};

} // namespace swisp
