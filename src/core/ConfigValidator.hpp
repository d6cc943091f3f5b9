/**
 * @file ConfigValidator.hpp
 * @brief Detects contradictory or out-of-range command line settings
 *
 * Runs before any mesh work so that a bad invocation fails with a list of
 * every problem and a suggested fix for each, instead of stopping at the
 * first one deep inside the pipeline.
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include "neuroforge.hpp"
#include <optional>
#include <string>
#include <vector>

namespace neuroforge {

/**
 * @brief A single problem found in the user's settings
 */
struct ParameterConflict {
    std::string description;
    std::vector<std::string> involved_params;
    std::vector<std::string> suggestions;
};

struct ConfigValidationResult {
    bool is_valid = true;
    std::vector<ParameterConflict> conflicts;

    bool has_errors() const { return !is_valid; }

    /// Human-readable report of every conflict; empty when valid
    std::string format_error_message() const;
};

class ConfigValidator {
public:
    ConfigValidator() = default;

    ConfigValidationResult validate(const CliConfig& config) const;

private:
    std::optional<ParameterConflict> check_mesh_source(const CliConfig& config) const;
    std::optional<ParameterConflict> check_target_size(const CliConfig& config) const;
    std::optional<ParameterConflict> check_component_ratio(const CliConfig& config) const;
    std::optional<ParameterConflict> check_generator_settings(const CliConfig& config) const;
    std::optional<ParameterConflict> check_output_format(const CliConfig& config) const;
    std::optional<ParameterConflict> check_report_path(const CliConfig& config) const;
};

} // namespace neuroforge
