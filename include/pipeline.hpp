#pragma once

#include <atomic>
#include <string>
#include <vector>
#include <cstdint>
#include "config.hpp"
#include "frame.hpp"
#include "parameters.hpp"
#include "stats.hpp"

namespace swisp {

/**
 * @brief Batch grading driver
 *
 * Manages the complete grading workflow:
 * - Collect PNG frames from the input file or directory
 * - Render each frame with one parameter snapshot
 * - Write graded frames as PNG or JPEG-LS
 * - Track per-frame statistics and timing
 */
class GradingPipeline {
public:
    /**
     * @brief Construct pipeline with configuration
     * @param config Grading configuration
     * @param params Parameter snapshot applied to every frame
     */
    GradingPipeline(const GradingConfig& config, const ParameterSet& params);

    /**
     * @brief Grade all input frames
     * @param stop_requested Checked between frames; may be null
     * @return true if every frame was graded, false on error or interruption
     */
    bool run(const std::atomic<bool>* stop_requested = nullptr);

    /**
     * @brief Print grading summary statistics
     */
    void print_summary() const;

    /**
     * @brief Write session statistics to JSON file
     * @param output_path Path to output JSON file
     */
    bool write_statistics(const std::string& output_path) const;

    /**
     * @brief Write per-frame statistics to CSV file
     */
    bool write_frame_csv(const std::string& output_path) const;

    const SessionStats& session_stats() const { return session_; }
    const std::vector<FrameStats>& frame_stats() const { return frames_; }

    /**
     * @brief Output path for a given input file
     */
    std::string output_path_for(const std::string& input_path) const;

private:
    GradingConfig config_;
    ParameterSet params_;

    SessionStats session_;
    std::vector<FrameStats> frames_;

    /**
     * @brief Encode and write one graded frame
     * @param frame Graded frame
     * @param output_path Destination
     * @param bytes_written Size of the written file (output)
     * @return true if successful, false otherwise
     */
    bool write_graded_frame(const Frame& frame, const std::string& output_path, uint64_t& bytes_written);
};

} // namespace swisp
