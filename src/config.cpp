/**
 * @file config.cpp
 * @brief Configuration file parsing and management
 *
 * Handles YAML configuration loading with support for multiple profiles,
 * parameter validation and export of settings snapshots.
 */

#include "config.hpp"
#include "controls.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <fstream>
#include <stdexcept>

namespace swisp {

// Helper function to safely get YAML value with default
template<typename T>
T get_yaml_value(const YAML::Node& node, const std::string& key, const T& default_value)
{
    if (node[key]) {
        return node[key].as<T>();
    }
    return default_value;
}

const char* output_format_name(OutputFormat format)
{
    switch (format) {
        case OutputFormat::PNG: return "png";
        case OutputFormat::JPEGLS: return "jls";
    }
    return "unknown";
}

bool parse_output_format(const std::string& name, OutputFormat& format)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "png") {
        format = OutputFormat::PNG;
        return true;
    }
    if (lower == "jls" || lower == "jpegls") {
        format = OutputFormat::JPEGLS;
        return true;
    }
    return false;
}

bool GradingConfig::load_from_yaml(const std::string& yaml_path, const std::string& profile_name)
{
    try {
        YAML::Node config_file = YAML::LoadFile(yaml_path);

        // Check for profiles section
        if (!profile_name.empty()) {
            if (!config_file["profiles"] || !config_file["profiles"][profile_name]) {
                std::cerr << "Profile not found: " << profile_name << std::endl;
                return false;
            }
            const YAML::Node profile = config_file["profiles"][profile_name];
            return load_from_node(profile);
        }

        // Load from root
        return load_from_node(config_file);
    }
    catch (const YAML::Exception& e) {
        std::cerr << "YAML parsing error: " << e.what() << std::endl;
        return false;
    }
    catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return false;
    }
}

bool GradingConfig::load_from_node(const YAML::Node& node)
{
    // Paths may also come from the command line, so only overwrite when present
    input_path = get_yaml_value(node, "input", input_path);
    output_dir = get_yaml_value(node, "output_dir", output_dir);

    if (node["format"]) {
        const std::string format_name = node["format"].as<std::string>();
        if (!parse_output_format(format_name, output_format)) {
            std::cerr << "Unknown output format: " << format_name << std::endl;
            return false;
        }
    }

    write_stats = get_yaml_value(node, "write_stats", write_stats);
    export_settings_path = get_yaml_value(node, "export_settings", export_settings_path);
    key_script = get_yaml_value(node, "keys", key_script);

    const YAML::Node settings_node = node["settings"];
    if (settings_node) {
        if (!settings_node.IsMap()) {
            std::cerr << "'settings' must be a map of NAME: value" << std::endl;
            return false;
        }
        // Known names are stored canonically so later overrides replace them;
        // unknown names are kept as written for validate() to report
        for (const auto& entry : settings_node) {
            const std::string key = entry.first.as<std::string>();
            const std::string name = is_known_setting(key) ? setting_name(setting_from_name(key)) : key;
            settings[name] = entry.second.as<int>();
        }
    }

    return true;
}

bool GradingConfig::validate() const
{
    if (input_path.empty() || output_dir.empty()) {
        std::cerr << "Input path and output directory must be specified" << std::endl;
        return false;
    }

    for (const auto& entry : settings) {
        if (!is_known_setting(entry.first)) {
            std::cerr << "Unknown camera setting in configuration: " << entry.first << std::endl;
            return false;
        }
    }

    return true;
}

void GradingConfig::apply_to(ParameterStore& store) const
{
    for (const auto& entry : settings) {
        const Setting setting = setting_from_name(entry.first);
        const int stored = store.set(setting, entry.second);
        if (stored != entry.second) {
            std::cerr << "Clamped " << setting_name(setting) << " from "
                      << entry.second << " to " << stored << std::endl;
        }
    }

    if (!key_script.empty()) {
        apply_key_script(store, key_script);
    }
}

void GradingConfig::print() const
{
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Input: " << input_path << std::endl;
    std::cout << "  Output: " << output_dir << std::endl;
    std::cout << "  Format: " << output_format_name(output_format) << std::endl;
    std::cout << "  Write stats: " << (write_stats ? "yes" : "no") << std::endl;
    if (!export_settings_path.empty()) {
        std::cout << "  Export settings: " << export_settings_path << std::endl;
    }
    if (!key_script.empty()) {
        std::cout << "  Key script: " << key_script << std::endl;
    }
    for (const auto& entry : settings) {
        std::cout << "  " << entry.first << " = " << entry.second << std::endl;
    }
}

std::string settings_to_yaml(const ParameterStore::Snapshot& snapshot)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "settings" << YAML::Value << YAML::BeginMap;
    for (const auto& entry : snapshot) {
        out << YAML::Key << entry.first << YAML::Value << entry.second;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
    return out.c_str();
}

bool write_settings_yaml(const ParameterStore::Snapshot& snapshot, const std::string& yaml_path)
{
    std::ofstream ofs(yaml_path);
    if (!ofs) {
        std::cerr << "Failed to write settings to " << yaml_path << std::endl;
        return false;
    }

    ofs << settings_to_yaml(snapshot) << "\n";
    if (!ofs) {
        std::cerr << "Failed to write settings to " << yaml_path << std::endl;
        return false;
    }

    std::cout << "Settings written to " << yaml_path << std::endl;
    return true;
}

} // namespace swisp
