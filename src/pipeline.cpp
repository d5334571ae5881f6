/**
 * @file pipeline.cpp
 * @brief Batch grading orchestration
 *
 * Manages the complete grading workflow:
 * - Collect PNG frames from the input file or directory
 * - Render each frame with one parameter snapshot
 * - Write graded frames as PNG or JPEG-LS
 * - Track statistics and performance metrics
 */

#include "pipeline.hpp"
#include "encoder.hpp"
#include "grading.hpp"
#include "image_io.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <chrono>
#include <sys/stat.h>

namespace swisp {

GradingPipeline::GradingPipeline(const GradingConfig& config, const ParameterSet& params)
    : config_(config)
    , params_(params)
{
}

std::string GradingPipeline::output_path_for(const std::string& input_path) const
{
    const char* extension = (config_.output_format == OutputFormat::JPEGLS) ? ".jls" : ".png";
    return config_.output_dir + "/" + path_stem(input_path) + "_graded" + extension;
}

bool GradingPipeline::write_graded_frame(const Frame& frame, const std::string& output_path, uint64_t& bytes_written)
{
    bytes_written = 0;

    if (config_.output_format == OutputFormat::JPEGLS) {
        EncodedFrame encoded;
        if (!encode_frame_jpegls(frame, encoded)) {
            return false;
        }
        if (!write_encoded_frame(encoded, output_path)) {
            return false;
        }
        bytes_written = encoded.compressed_data.size();
        return true;
    }

    if (!write_frame_to_png(frame, output_path)) {
        return false;
    }

    struct stat st;
    if (stat(output_path.c_str(), &st) == 0) {
        bytes_written = static_cast<uint64_t>(st.st_size);
    }
    return true;
}

bool GradingPipeline::run(const std::atomic<bool>* stop_requested)
{
    std::cout << "=== Software ISP Grading Pipeline ===" << std::endl;
    std::cout << "Input: " << config_.input_path << std::endl;
    std::cout << "Output: " << config_.output_dir << " (" << output_format_name(config_.output_format) << ")" << std::endl;
    for (const SettingInfo& info : all_settings()) {
        std::cout << "  " << std::left << std::setw(26) << info.name << std::right
                  << params_.get(info.setting) << std::endl;
    }
    std::cout << std::endl;

    std::vector<std::string> input_files;
    if (!list_png_inputs(config_.input_path, input_files)) {
        return false;
    }

    std::cout << "Found " << input_files.size() << " PNG files" << std::endl;

    if (!ensure_directory(config_.output_dir)) {
        return false;
    }

    session_ = SessionStats();
    frames_.clear();

    for (size_t i = 0; i < input_files.size(); ++i) {
        if (stop_requested && stop_requested->load()) {
            std::cout << "Stopping before frame " << i << std::endl;
            return false;
        }

        const std::string& input_path = input_files[i];

        Frame frame;
        frame.frame_index = static_cast<uint32_t>(i);
        frame.timestamp = i;

        if (!load_frame_from_png(input_path, frame)) {
            std::cerr << "Failed to load frame " << i << std::endl;
            return false;
        }

        const auto render_start = std::chrono::high_resolution_clock::now();
        const Frame graded = render(frame, params_);
        const auto render_end = std::chrono::high_resolution_clock::now();
        const std::chrono::duration<double, std::milli> render_duration = render_end - render_start;

        const std::string output_path = output_path_for(input_path);
        uint64_t bytes_written = 0;
        if (!write_graded_frame(graded, output_path, bytes_written)) {
            std::cerr << "Failed to write frame " << i << std::endl;
            return false;
        }

        FrameStats fs;
        fs.frame_index = frame.frame_index;
        fs.width = frame.width;
        fs.height = frame.height;
        fs.render_time_ms = render_duration.count();
        fs.mean_in = compute_channel_means(frame);
        fs.mean_out = compute_channel_means(graded);
        fs.output_bytes = bytes_written;

        session_.add_frame(fs);
        frames_.push_back(fs);

        // Print progress
        std::cout << "Frame " << std::setw(6) << i
                  << " | " << frame.width << "x" << frame.height
                  << " | " << std::fixed << std::setprecision(2) << fs.render_time_ms << " ms"
                  << " | " << bytes_written << " bytes"
                  << " | " << output_path
                  << std::endl;
    }

    session_.finalize();
    print_summary();

    if (config_.write_stats) {
        if (!write_statistics(config_.output_dir + "/grading_stats.json") ||
            !write_frame_csv(config_.output_dir + "/grading_stats.csv")) {
            return false;
        }
    }

    return true;
}

void GradingPipeline::print_summary() const
{
    std::cout << std::endl;
    std::cout << "=== Grading Summary ===" << std::endl;
    std::cout << "Frames processed: " << session_.total_frames << std::endl;

    if (session_.total_frames == 0) {
        return;
    }

    std::cout << "Output size: " << std::fixed << std::setprecision(2)
              << (session_.total_output_bytes / 1024.0 / 1024.0) << " MB" << std::endl;
    std::cout << "Average render time: " << std::fixed << std::setprecision(2)
              << session_.avg_render_time_ms << " ms/frame" << std::endl;
    std::cout << "Throughput: " << std::fixed << std::setprecision(1)
              << session_.throughput_fps << " fps" << std::endl;
}

bool GradingPipeline::write_statistics(const std::string& output_path) const
{
    std::ofstream ofs(output_path);
    if (!ofs) {
        std::cerr << "Failed to write statistics to " << output_path << std::endl;
        return false;
    }

    ofs << session_.to_json() << "\n";

    std::cout << "Statistics written to " << output_path << std::endl;
    return true;
}

bool GradingPipeline::write_frame_csv(const std::string& output_path) const
{
    std::ofstream ofs(output_path);
    if (!ofs) {
        std::cerr << "Failed to write frame statistics to " << output_path << std::endl;
        return false;
    }

    ofs << FrameStats::csv_header() << "\n";
    for (const FrameStats& fs : frames_) {
        ofs << fs.to_csv() << "\n";
    }
    return true;
}

} // namespace swisp
