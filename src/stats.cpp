#include "stats.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace swisp {

ChannelMeans compute_channel_means(const Frame& frame)
{
    ChannelMeans means = {{0.0, 0.0, 0.0}};
    const size_t pixels = frame.pixel_count();
    if (pixels == 0 || frame.data.size() < pixels * Frame::CHANNELS) {
        return means;
    }

    std::array<uint64_t, 3> sums = {{0, 0, 0}};
    for (size_t i = 0; i < pixels; ++i) {
        const uint8_t* px = &frame.data[i * Frame::CHANNELS];
        sums[0] += px[0];
        sums[1] += px[1];
        sums[2] += px[2];
    }

    for (size_t c = 0; c < 3; ++c) {
        means[c] = static_cast<double>(sums[c]) / pixels;
    }
    return means;
}

// ============================================================================
// FrameStats
// ============================================================================

std::string FrameStats::csv_header() {
    return "frame_index,width,height,render_time_ms,"
           "mean_in_b,mean_in_g,mean_in_r,"
           "mean_out_b,mean_out_g,mean_out_r,"
           "output_bytes";
}

std::string FrameStats::to_csv() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    oss << frame_index << ","
        << width << ","
        << height << ","
        << render_time_ms << ","
        << mean_in[0] << "," << mean_in[1] << "," << mean_in[2] << ","
        << mean_out[0] << "," << mean_out[1] << "," << mean_out[2] << ","
        << output_bytes;

    return oss.str();
}

// ============================================================================
// SessionStats
// ============================================================================

void SessionStats::add_frame(const FrameStats& fs) {
    total_frames++;
    total_pixels += static_cast<uint64_t>(fs.width) * fs.height;
    total_output_bytes += fs.output_bytes;

    total_render_time_ms += fs.render_time_ms;
    max_render_time_ms = std::max(max_render_time_ms, fs.render_time_ms);

    // Accumulate for averages
    for (size_t c = 0; c < 3; ++c) {
        avg_mean_shift[c] += fs.mean_out[c] - fs.mean_in[c];
    }
}

void SessionStats::finalize() {
    if (total_frames > 0) {
        avg_render_time_ms = total_render_time_ms / total_frames;
        for (size_t c = 0; c < 3; ++c) {
            avg_mean_shift[c] /= total_frames;
        }
    }

    if (avg_render_time_ms > 0.0) {
        throughput_fps = 1000.0 / avg_render_time_ms;
    }
}

std::string SessionStats::to_json() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    oss << "{\n";
    oss << "  \"total_frames\": " << total_frames << ",\n";
    oss << "  \"total_pixels\": " << total_pixels << ",\n";
    oss << "  \"total_output_bytes\": " << total_output_bytes << ",\n";
    oss << "  \"total_render_time_ms\": " << total_render_time_ms << ",\n";
    oss << "  \"avg_render_time_ms\": " << avg_render_time_ms << ",\n";
    oss << "  \"max_render_time_ms\": " << max_render_time_ms << ",\n";
    oss << "  \"throughput_fps\": " << throughput_fps << ",\n";
    oss << "  \"avg_mean_shift_bgr\": ["
        << avg_mean_shift[0] << ", " << avg_mean_shift[1] << ", " << avg_mean_shift[2] << "]\n";
    oss << "}";

    return oss.str();
}

} // namespace swisp
