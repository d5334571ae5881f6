/**
 * @file main.cpp
 * @brief Command-line interface for the software ISP grading tool
 *
 * Grades prerecorded frames with emulated camera controls (brightness,
 * contrast, hue, saturation, sharpness, gain, exposure, white balance).
 *
 * Usage:
 *   swisp_grade --config grading.yaml --profile warm
 *   swisp_grade --input frames/ --output graded/ --set CONTRAST=20 --keys "s+++"
 */

#include "pipeline.hpp"
#include "config.hpp"
#include "parameters.hpp"
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <csignal>
#include <atomic>

namespace {

std::atomic<bool> g_interrupted(false);

void signal_handler(int signal)
{
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

struct CommandLine {
    std::string config_file;
    std::string profile;
    std::string input;
    std::string output;
    std::string format;
    std::string export_path;
    std::string key_script;
    bool write_stats = false;
    std::vector<std::pair<std::string, int>> settings;
};

void print_usage(const char* program_name)
{
    std::cout << "Software ISP Grading Tool - emulated camera controls for recorded frames" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << program_name << " --config <yaml_file> [--profile <name>] [options]" << std::endl;
    std::cout << "  " << program_name << " --input <file|dir> --output <dir> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <path>        Load configuration from YAML file" << std::endl;
    std::cout << "  --profile <name>       Use specific profile from config file" << std::endl;
    std::cout << "  --input <path>         PNG file or directory of PNG frames" << std::endl;
    std::cout << "  --output <dir>         Output directory for graded frames" << std::endl;
    std::cout << "  --set NAME=VALUE       Set a camera setting (clamped), repeatable" << std::endl;
    std::cout << "  --keys <script>        Replay key commands: + - (adjust) s (next) r (reset)" << std::endl;
    std::cout << "  --format png|jls       Output format (default png)" << std::endl;
    std::cout << "  --export <path>        Write the final settings as YAML" << std::endl;
    std::cout << "  --stats                Write grading_stats.json and grading_stats.csv" << std::endl;
    std::cout << "  --help                 Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Settings:" << std::endl;
    for (const swisp::SettingInfo& info : swisp::all_settings()) {
        std::cout << "  " << info.name << " [" << info.min_value << ".." << info.max_value
                  << "] default " << info.default_value << std::endl;
    }
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program_name << " --config grading.yaml" << std::endl;
    std::cout << "  " << program_name << " --config grading.yaml --profile warm" << std::endl;
    std::cout << "  " << program_name << " --input frames/ --output graded/ --set WHITEBALANCE_TEMPERATURE=4500" << std::endl;
    std::cout << std::endl;
}

bool parse_setting_assignment(const std::string& text, std::pair<std::string, int>& setting)
{
    const size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= text.size()) {
        std::cerr << "Error: --set expects NAME=VALUE, got: " << text << std::endl;
        return false;
    }

    const std::string name = text.substr(0, eq);
    if (!swisp::is_known_setting(name)) {
        std::cerr << "Error: Unknown camera setting: " << name << std::endl;
        return false;
    }

    try {
        size_t consumed = 0;
        const std::string value_text = text.substr(eq + 1);
        const int value = std::stoi(value_text, &consumed);
        if (consumed != value_text.size()) {
            std::cerr << "Error: Invalid value for " << name << ": " << value_text << std::endl;
            return false;
        }
        setting = std::make_pair(swisp::setting_name(swisp::setting_from_name(name)), value);
    }
    catch (const std::exception&) {
        std::cerr << "Error: Invalid value in --set " << text << std::endl;
        return false;
    }
    return true;
}

bool parse_command_line(int argc, char** argv, CommandLine& cmd)
{
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        else if (arg == "--stats") {
            cmd.write_stats = true;
            continue;
        }

        // Every remaining option takes exactly one argument
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires an argument" << std::endl;
            return false;
        }
        const std::string value = argv[++i];

        if (arg == "--config") {
            cmd.config_file = value;
        }
        else if (arg == "--profile") {
            cmd.profile = value;
        }
        else if (arg == "--input") {
            cmd.input = value;
        }
        else if (arg == "--output") {
            cmd.output = value;
        }
        else if (arg == "--format") {
            cmd.format = value;
        }
        else if (arg == "--export") {
            cmd.export_path = value;
        }
        else if (arg == "--keys") {
            cmd.key_script = value;
        }
        else if (arg == "--set") {
            std::pair<std::string, int> setting;
            if (!parse_setting_assignment(value, setting)) {
                return false;
            }
            cmd.settings.push_back(setting);
        }
        else {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            return false;
        }
    }

    // Either config file or input/output must be specified
    if (cmd.config_file.empty() && (cmd.input.empty() || cmd.output.empty())) {
        std::cerr << "Error: Must specify either --config or --input/--output" << std::endl;
        return false;
    }

    return true;
}

// Command-line values take precedence over the config file
bool apply_overrides(const CommandLine& cmd, swisp::GradingConfig& config)
{
    if (!cmd.input.empty()) {
        config.input_path = cmd.input;
    }
    if (!cmd.output.empty()) {
        config.output_dir = cmd.output;
    }
    if (!cmd.format.empty() && !swisp::parse_output_format(cmd.format, config.output_format)) {
        std::cerr << "Error: Unknown output format: " << cmd.format << std::endl;
        return false;
    }
    if (!cmd.export_path.empty()) {
        config.export_settings_path = cmd.export_path;
    }
    if (cmd.write_stats) {
        config.write_stats = true;
    }
    for (const auto& setting : cmd.settings) {
        config.settings[setting.first] = setting.second;
    }
    config.key_script += cmd.key_script;
    return true;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    // Set up signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    CommandLine cmd;
    if (!parse_command_line(argc, argv, cmd)) {
        print_usage(argv[0]);
        return 1;
    }

    swisp::GradingConfig config;

    // Load configuration
    if (!cmd.config_file.empty()) {
        std::cout << "Loading configuration from: " << cmd.config_file << std::endl;
        if (!cmd.profile.empty()) {
            std::cout << "Using profile: " << cmd.profile << std::endl;
        }

        if (!config.load_from_yaml(cmd.config_file, cmd.profile)) {
            std::cerr << "Failed to load configuration" << std::endl;
            return 1;
        }
    }

    if (!apply_overrides(cmd, config)) {
        return 1;
    }

    // Validate configuration
    if (!config.validate()) {
        std::cerr << "Invalid configuration" << std::endl;
        return 1;
    }

    // Print configuration
    std::cout << std::endl;
    config.print();
    std::cout << std::endl;

    try {
        swisp::ParameterStore store;
        config.apply_to(store);

        if (!config.export_settings_path.empty() &&
            !swisp::write_settings_yaml(store.snapshot(), config.export_settings_path)) {
            return 1;
        }

        swisp::GradingPipeline pipeline(config, store.parameters());
        if (!pipeline.run(&g_interrupted)) {
            if (g_interrupted) {
                std::cout << "Grading interrupted by user" << std::endl;
                return 130; // Standard exit code for SIGINT
            }
            std::cerr << "Grading pipeline failed" << std::endl;
            return 1;
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Exception during grading: " << e.what() << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "Grading completed successfully!" << std::endl;

    return 0;
}
