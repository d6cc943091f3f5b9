/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace neuroforge {

namespace {

const char* to_string(StlEncoding encoding) {
    return encoding == StlEncoding::ASCII ? "ascii" : "binary";
}

} // namespace

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    exit_code_ = 0;

    SimpleCommandLineParser parser("neuroforge-prep",
        "Repair, scale and validate triangle meshes for 3D printing");
    register_options(parser);

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_requested() ? 0 : 1;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "NeuroForge Prep v" << NEUROFORGE_VERSION_STRING << std::endl;
        std::cout << "Watertight mesh preparation for additive manufacturing" << std::endl;
        std::cout << "Built with CGAL, Eigen, libigl, TBB" << std::endl;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return false;
    }

    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        config_.config_file = config_file.value();
    }

    if (!parse_all_options(parser)) {
        exit_code_ = 1;
        return false;
    }

    return true;
}

void CommandLineInterface::register_options(SimpleCommandLineParser& parser) const {
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Create a default configuration file at the specified path");

    // Mesh source
    parser.add_option("input", "i", "Mesh to process (STL, OBJ, OFF, PLY)");
    parser.add_option("generate", "g", "Build a primitive instead: box, sphere, cylinder");
    parser.add_option("size", "", "Edge length or diameter of the generated primitive in mm (default: 50)");
    parser.add_option("prompt", "p", "Prompt handed to the mesh source");

    // Processing
    parser.add_option("target-size", "t", "Largest bounding-box side after scaling in mm (default: 100)");
    parser.add_flag("scale", "", "Scale and centre the mesh (default)");
    parser.add_flag("no-scale", "", "Keep the original size and position");
    parser.add_flag("repair", "", "Repair meshes that are not watertight (default)");
    parser.add_flag("no-repair", "", "Validate the mesh as given");
    parser.add_flag("fill-holes", "", "Close open boundary loops (default)");
    parser.add_flag("no-fill-holes", "", "Leave holes open");
    parser.add_flag("fix-normals", "", "Make face winding consistent and outward (default)");
    parser.add_flag("no-fix-normals", "", "Keep face winding as given");
    parser.add_flag("remove-small-components", "", "Drop small disconnected bodies (default)");
    parser.add_flag("no-remove-small-components", "", "Keep every body");
    parser.add_option("min-component-ratio", "", "Share of vertices a body needs to be kept (default: 0.05)");

    // Output
    parser.add_option("output", "o", "Write the mesh here if it passes validation (.stl or .obj)");
    parser.add_option("stl-format", "", "STL encoding: binary or ascii (default: binary)");
    parser.add_option("report", "r", "JSON report file");

    // Logging and utility options
    parser.add_flag("silent", "s", "No output on stdout; errors still go to stderr (same as --log-level 0)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "0=SILENT 1=ERROR 2=WARNING 3=INFO (default) 4=DETAILED 5=DEBUG 6=TRACE");
    parser.add_option("log-config", "", "Per-component levels, e.g. \"MeshRepairer=5,default=2\"");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("dry-run", "", "Validate arguments without processing");
    parser.add_flag("version", "", "Show version information");
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    // Mesh source
    if (auto value = parser.get("input")) config_.input_file = value.value();
    if (auto value = parser.get("generate")) config_.generate_shape = value.value();
    if (auto value = parser.get("prompt")) config_.prompt = value.value();
    if (!parse_number_option(parser, "size", config_.generate_size_mm)) return false;

    // A bare file name is taken as the input mesh
    const auto& positional = parser.get_positional();
    if (positional.size() > 1) {
        std::cerr << "Expected at most one input mesh, got " << positional.size() << " file names" << std::endl;
        return false;
    }
    if (positional.size() == 1) {
        if (config_.input_file) {
            std::cerr << "Input mesh given twice: " << *config_.input_file
                      << " and " << positional.front() << std::endl;
            return false;
        }
        config_.input_file = positional.front();
    }

    // Processing
    PipelineConfig& pipeline = config_.pipeline;
    if (!parse_number_option(parser, "target-size", pipeline.target_size_mm)) return false;
    if (!parse_number_option(parser, "min-component-ratio", pipeline.repair.min_component_ratio)) return false;
    parse_boolean_option(parser, "scale", "no-scale", pipeline.auto_scale);
    parse_boolean_option(parser, "repair", "no-repair", pipeline.auto_repair);
    parse_boolean_option(parser, "fill-holes", "no-fill-holes", pipeline.repair.fill_holes);
    parse_boolean_option(parser, "fix-normals", "no-fix-normals", pipeline.repair.fix_normals);
    parse_boolean_option(parser, "remove-small-components", "no-remove-small-components",
                         pipeline.repair.remove_small_components);

    // Output
    if (auto value = parser.get("output")) config_.output_file = value.value();
    if (auto value = parser.get("report")) config_.report_file = value.value();
    if (auto value = parser.get("stl-format")) {
        auto encoding = parse_stl_encoding(value.value());
        if (!encoding) {
            std::cerr << "Invalid STL format '" << value.value() << "'. Must be one of: binary, ascii" << std::endl;
            return false;
        }
        pipeline.stl_encoding = *encoding;
    }

    if (!parse_logging_options(parser)) return false;

    dry_run_ = parser.get_flag("dry-run");
    return true;
}

bool CommandLineInterface::parse_logging_options(const SimpleCommandLineParser& parser) {
    // Priority: flags > CLI > ENV > config file > defaults
    std::optional<std::string> facility_config;

    const char* env_log_level = std::getenv("NEUROFORGE_LOG_LEVEL");
    if (env_log_level) {
        std::string env_config(env_log_level);
        if (env_config.find('=') == std::string::npos) {
            try {
                config_.log_level = std::clamp(std::stoi(env_config), 0, 6);
            } catch (const std::exception&) {
                std::cerr << "Warning: Ignoring invalid NEUROFORGE_LOG_LEVEL '" << env_config << "'" << std::endl;
            }
        } else {
            facility_config = env_config;
        }
    }

    if (parser.get("log-level")) {
        auto level = parser.get_as<int>("log-level");
        if (!level || *level < 0 || *level > 6) {
            std::cerr << "Invalid value for --log-level: '" << parser.get("log-level").value()
                      << "'. Must be an integer from 0 to 6" << std::endl;
            return false;
        }
        config_.log_level = *level;
    }

    if (auto value = parser.get("log-config")) {
        facility_config = value.value();
    }

    if (parser.get_flag("silent")) {
        config_.log_level = 0;
    }
    if (parser.get_flag("verbose")) {
        config_.log_level = 6;
    }

    const char* env_log_file = std::getenv("NEUROFORGE_LOG_FILE");
    if (env_log_file) {
        config_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();
    }

    apply_log_levels(facility_config);
    return true;
}

void CommandLineInterface::apply_log_levels(const std::optional<std::string>& facility_config) const {
    // Silent still lets errors through; they are printed on stderr and the
    // caller skips the banner and summary on stdout
    int default_level = config_.log_level == 0 ? 1 : config_.log_level;
    Logger::setDefaultLevel(static_cast<LogLevel>(default_level));

    if (facility_config && !Logger::parseLogConfig(*facility_config)) {
        std::cerr << "Warning: Some logging levels in '" << *facility_config
                  << "' could not be parsed" << std::endl;
    }
}

void CommandLineInterface::parse_boolean_option(const SimpleCommandLineParser& parser,
                                                const std::string& positive_flag,
                                                const std::string& negative_flag,
                                                bool& config_value) {
    if (parser.get_flag(positive_flag)) {
        config_value = true;
    } else if (parser.get_flag(negative_flag)) {
        config_value = false;
    }
}

bool CommandLineInterface::parse_number_option(const SimpleCommandLineParser& parser,
                                               const std::string& option_name,
                                               double& config_value) {
    auto raw = parser.get(option_name);
    if (!raw) {
        return true;
    }

    auto value = parser.get_as<double>(option_name);
    if (!value) {
        std::cerr << "Invalid value for --" << option_name << ": '" << raw.value()
                  << "'. Expected a number" << std::endl;
        return false;
    }

    config_value = value.value();
    return true;
}

std::optional<StlEncoding> CommandLineInterface::parse_stl_encoding(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "binary") return StlEncoding::BINARY;
    if (lower == "ascii") return StlEncoding::ASCII;
    return std::nullopt;
}

// ============================================================================
// Configuration files
// ============================================================================

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    const CliConfig defaults;
    const PipelineConfig& pipeline = defaults.pipeline;

    json config = {
        {"input", nullptr},
        {"generate", nullptr},
        {"size_mm", defaults.generate_size_mm},
        {"prompt", defaults.prompt},
        {"output", nullptr},
        {"report", nullptr},
        {"target_size_mm", pipeline.target_size_mm},
        {"auto_scale", pipeline.auto_scale},
        {"auto_repair", pipeline.auto_repair},
        {"fill_holes", pipeline.repair.fill_holes},
        {"fix_normals", pipeline.repair.fix_normals},
        {"remove_small_components", pipeline.repair.remove_small_components},
        {"min_component_ratio", pipeline.repair.min_component_ratio},
        {"stl_format", to_string(pipeline.stl_encoding)},
        {"log_level", defaults.log_level},
        {"log_file", nullptr}
    };

    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << config.dump(2) << std::endl;
    return file.good();
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file: " << filename << std::endl;
        return false;
    }

    try {
        json config;
        file >> config;

        if (!config.is_object()) {
            std::cerr << "Error: Config file must contain a JSON object: " << filename << std::endl;
            return false;
        }

        auto read_string = [&config](const std::string& key, std::optional<std::string>& target) {
            if (config.contains(key) && config[key].is_string()) {
                target = config[key].get<std::string>();
            }
        };
        auto read_number = [&config](const std::string& key, double& target) {
            if (config.contains(key) && config[key].is_number()) {
                target = config[key].get<double>();
            }
        };
        auto read_bool = [&config](const std::string& key, bool& target) {
            if (config.contains(key) && config[key].is_boolean()) {
                target = config[key].get<bool>();
            }
        };

        read_string("input", config_.input_file);
        read_string("generate", config_.generate_shape);
        read_number("size_mm", config_.generate_size_mm);
        if (config.contains("prompt") && config["prompt"].is_string()) {
            config_.prompt = config["prompt"].get<std::string>();
        }
        read_string("output", config_.output_file);
        read_string("report", config_.report_file);

        PipelineConfig& pipeline = config_.pipeline;
        read_number("target_size_mm", pipeline.target_size_mm);
        read_bool("auto_scale", pipeline.auto_scale);
        read_bool("auto_repair", pipeline.auto_repair);
        read_bool("fill_holes", pipeline.repair.fill_holes);
        read_bool("fix_normals", pipeline.repair.fix_normals);
        read_bool("remove_small_components", pipeline.repair.remove_small_components);
        read_number("min_component_ratio", pipeline.repair.min_component_ratio);

        if (config.contains("stl_format") && config["stl_format"].is_string()) {
            std::string text = config["stl_format"].get<std::string>();
            if (auto encoding = parse_stl_encoding(text)) {
                pipeline.stl_encoding = *encoding;
            } else {
                std::cerr << "Warning: Unknown stl_format '" << text << "', using binary" << std::endl;
            }
        }

        if (config.contains("log_level") && config["log_level"].is_number_integer()) {
            config_.log_level = std::clamp(config["log_level"].get<int>(), 0, 6);
        }
        read_string("log_file", config_.log_file);

        return true;
    } catch (const json::exception& e) {
        std::cerr << "Error: Invalid JSON in config file " << filename << ": " << e.what() << std::endl;
        return false;
    }
}

void CommandLineInterface::print_config() const {
    if (config_.log_level < 4) return;

    const PipelineConfig& pipeline = config_.pipeline;

    std::cout << "\n=== Configuration ===\n";
    if (config_.input_file) {
        std::cout << "Input: " << *config_.input_file << "\n";
    }
    if (config_.generate_shape) {
        std::cout << "Generate: " << *config_.generate_shape << " (" << config_.generate_size_mm << "mm)\n";
        std::cout << "Prompt: " << config_.prompt << "\n";
    }
    std::cout << "Output: " << config_.output_file.value_or("(none)") << "\n";
    std::cout << "Report: " << config_.report_file.value_or("(none)") << "\n";
    std::cout << "Auto scale: " << (pipeline.auto_scale ? "yes" : "no");
    if (pipeline.auto_scale) {
        std::cout << " (target " << pipeline.target_size_mm << "mm)";
    }
    std::cout << "\n";
    std::cout << "Auto repair: " << (pipeline.auto_repair ? "yes" : "no") << "\n";
    if (pipeline.auto_repair) {
        std::cout << "  Fill holes: " << (pipeline.repair.fill_holes ? "yes" : "no") << "\n";
        std::cout << "  Fix normals: " << (pipeline.repair.fix_normals ? "yes" : "no") << "\n";
        std::cout << "  Remove small components: "
                  << (pipeline.repair.remove_small_components ? "yes" : "no")
                  << " (ratio " << pipeline.repair.min_component_ratio << ")\n";
    }
    std::cout << "STL format: " << to_string(pipeline.stl_encoding) << "\n";
    std::cout << "===================\n\n";
}

} // namespace neuroforge
