/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the neuroforge-prep tool
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include "neuroforge.hpp"
#include "SimpleCommandLineParser.hpp"
#include <string>

namespace neuroforge {

/**
 * @brief Parses arguments, config files and environment into a CliConfig
 *
 * Precedence, lowest first: built-in defaults, JSON config file,
 * NEUROFORGE_LOG_LEVEL / NEUROFORGE_LOG_FILE, command line.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if processing should continue; otherwise exit_code()
     *         tells whether the early stop was a success (help, version,
     *         --create-config) or a usage error
     */
    bool parse_arguments(int argc, char* argv[]);

    const CliConfig& get_config() const { return config_; }

    bool is_dry_run() const { return dry_run_; }

    /// Process exit code to use when parse_arguments() returned false
    int exit_code() const { return exit_code_; }

    /**
     * @brief Print the effective configuration (DETAILED log level and up)
     */
    void print_config() const;

    /**
     * @brief Write a JSON config file holding every setting at its default
     * @return false if the file could not be written
     */
    static bool create_default_config_file(const std::string& filename);

    /**
     * @brief Merge settings from a JSON config file into the current config
     * @return false if the file is missing or is not valid JSON
     */
    bool load_config_file(const std::string& filename);

private:
    CliConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    void register_options(SimpleCommandLineParser& parser) const;
    bool parse_all_options(const SimpleCommandLineParser& parser);
    bool parse_logging_options(const SimpleCommandLineParser& parser);
    void apply_log_levels(const std::optional<std::string>& facility_config) const;

    void parse_boolean_option(const SimpleCommandLineParser& parser,
                              const std::string& positive_flag,
                              const std::string& negative_flag,
                              bool& config_value);

    bool parse_number_option(const SimpleCommandLineParser& parser,
                             const std::string& option_name,
                             double& config_value);

    static std::optional<StlEncoding> parse_stl_encoding(const std::string& text);
};

} // namespace neuroforge
