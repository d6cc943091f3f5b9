/**
 * @file ConfigValidator.cpp
 * @brief Implementation of command line settings validation
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "ConfigValidator.hpp"
#include "PrimitiveMeshSource.hpp"
#include "../export/MeshExporter.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace neuroforge {

std::string ConfigValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Problem " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nNo mesh was processed.\n";
    return oss.str();
}

ConfigValidationResult ConfigValidator::validate(const CliConfig& config) const {
    ConfigValidationResult result;

    const std::optional<ParameterConflict> checks[] = {
        check_mesh_source(config),
        check_target_size(config),
        check_component_ratio(config),
        check_generator_settings(config),
        check_output_format(config),
        check_report_path(config)
    };

    for (const auto& conflict : checks) {
        if (conflict) {
            result.conflicts.push_back(*conflict);
            result.is_valid = false;
        }
    }

    return result;
}

std::optional<ParameterConflict> ConfigValidator::check_mesh_source(const CliConfig& config) const {
    if (config.input_file && config.generate_shape) {
        ParameterConflict conflict;
        conflict.description = "Both an input mesh and a generated shape were requested";
        conflict.involved_params = {
            "--input " + *config.input_file,
            "--generate " + *config.generate_shape
        };
        conflict.suggestions = {
            "Drop --generate to process the existing file",
            "Drop --input to generate a new mesh"
        };
        return conflict;
    }

    if (!config.input_file && !config.generate_shape) {
        ParameterConflict conflict;
        conflict.description = "No mesh source given";
        conflict.suggestions = {
            "Use --input <file> with an STL, OBJ, OFF or PLY mesh",
            "Use --generate <shape> to build a synthetic primitive"
        };
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> ConfigValidator::check_target_size(const CliConfig& config) const {
    if (!config.pipeline.auto_scale) {
        return std::nullopt;
    }

    double target = config.pipeline.target_size_mm;
    if (std::isfinite(target) && target > 0.0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Target size must be a positive number of millimeters";

    std::ostringstream param;
    param << "--target-size " << target;
    conflict.involved_params = {param.str()};
    conflict.suggestions = {
        "Use --target-size 100 (the default)",
        "Use --no-scale to keep the mesh at its original size"
    };
    return conflict;
}

std::optional<ParameterConflict> ConfigValidator::check_component_ratio(const CliConfig& config) const {
    double ratio = config.pipeline.repair.min_component_ratio;
    if (ratio >= 0.0 && ratio <= 1.0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Minimum component ratio must lie between 0 and 1";

    std::ostringstream param;
    param << std::fixed << std::setprecision(3) << "--min-component-ratio " << ratio;
    conflict.involved_params = {param.str()};
    conflict.suggestions = {
        "Use --min-component-ratio 0.05 (the default)",
        "Use --min-component-ratio 0 to keep every body"
    };
    return conflict;
}

std::optional<ParameterConflict> ConfigValidator::check_generator_settings(const CliConfig& config) const {
    if (!config.generate_shape) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    const auto shapes = supported_shapes();
    bool known_shape = std::find(shapes.begin(), shapes.end(), *config.generate_shape) != shapes.end();

    if (!known_shape) {
        conflict.description = "Unknown primitive shape '" + *config.generate_shape + "'";
        conflict.involved_params = {"--generate " + *config.generate_shape};
        for (const auto& shape : shapes) {
            conflict.suggestions.push_back("Use --generate " + shape);
        }
        return conflict;
    }

    double size = config.generate_size_mm;
    if (!std::isfinite(size) || size <= 0.0) {
        conflict.description = "Generated shape size must be a positive number of millimeters";
        std::ostringstream param;
        param << "--size " << size;
        conflict.involved_params = {param.str()};
        conflict.suggestions = {"Use --size 50 (the default)"};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> ConfigValidator::check_output_format(const CliConfig& config) const {
    if (!config.output_file || format_from_path(*config.output_file)) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Output file has an unsupported extension";
    conflict.involved_params = {"--output " + *config.output_file};
    conflict.suggestions = {
        "Use a .stl file name for printing",
        "Use a .obj file name for viewing in other tools"
    };
    return conflict;
}

std::optional<ParameterConflict> ConfigValidator::check_report_path(const CliConfig& config) const {
    if (!config.report_file || !config.output_file || *config.report_file != *config.output_file) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Report and mesh would be written to the same file";
    conflict.involved_params = {
        "--output " + *config.output_file,
        "--report " + *config.report_file
    };
    conflict.suggestions = {"Give the report a .json file name"};
    return conflict;
}

} // namespace neuroforge
