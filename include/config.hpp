#pragma once

#include <map>
#include <string>
#include <yaml-cpp/yaml.h>
#include "parameters.hpp"

namespace swisp {

/**
 * Encoding used for graded output frames
 */
enum class OutputFormat {
    PNG,     // 8-bit RGB PNG
    JPEGLS   // Lossless JPEG-LS via CharLS
};

const char* output_format_name(OutputFormat format);

/**
 * Parse "png" or "jls" (case-insensitive, "jpegls" also accepted)
 * @return false if the name is unknown
 */
bool parse_output_format(const std::string& name, OutputFormat& format);

/**
 * @brief Grading configuration structure
 *
 * Contains input/output paths, output options and the parameter values to
 * grade with. Values in `settings` are raw; they are clamped when applied
 * to a ParameterStore.
 */
struct GradingConfig {
    // Input/output paths
    std::string input_path;     // PNG file or directory of PNG files
    std::string output_dir;

    OutputFormat output_format = OutputFormat::PNG;

    // Output options
    bool write_stats = false;         // grading_stats.json / .csv
    std::string export_settings_path; // Empty = no export

    // Key script replayed after `settings` are applied
    std::string key_script;

    // Setting name -> value
    std::map<std::string, int> settings;

    /**
     * @brief Load configuration from YAML file
     * @param yaml_path Path to YAML configuration file
     * @param profile_name Optional profile name to load
     * @return true if successful, false otherwise
     */
    bool load_from_yaml(const std::string& yaml_path, const std::string& profile_name = "");

    /**
     * @brief Load configuration from YAML node
     * @param node YAML node containing configuration
     * @return true if successful, false otherwise
     */
    bool load_from_node(const YAML::Node& node);

    /**
     * @brief Validate configuration parameters
     * @return true if valid, false otherwise
     */
    bool validate() const;

    /**
     * @brief Apply `settings` then `key_script` to a store
     * @throws ParameterNameError if a setting name is unknown
     */
    void apply_to(ParameterStore& store) const;

    /**
     * @brief Print configuration summary to stdout
     */
    void print() const;
};

/**
 * @brief Write a settings snapshot as YAML
 *
 * Produces a `settings:` map sorted by name, readable back by
 * GradingConfig::load_from_yaml().
 *
 * @return true if the file was written
 */
bool write_settings_yaml(const ParameterStore::Snapshot& snapshot, const std::string& yaml_path);

/**
 * @brief Render a settings snapshot as a YAML string
 */
std::string settings_to_yaml(const ParameterStore::Snapshot& snapshot);

} // namespace swisp
