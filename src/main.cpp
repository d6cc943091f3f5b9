/**
 * @file main.cpp
 * @brief Main entry point for neuroforge-prep
 *
 * Loads or generates a triangle mesh, repairs and rescales it, validates it
 * for 3D printing and writes it only if it passes.
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#include "neuroforge.hpp"
#include "core/ConfigValidator.hpp"
#include "core/Logger.hpp"
#include "core/MeshGenerator.hpp"
#include "core/PrimitiveMeshSource.hpp"
#include "core/ProcessingPipeline.hpp"
#include "export/MeshImporter.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ResultReporter.hpp"
#include "version.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <memory>

using namespace neuroforge;

namespace {

constexpr int EXIT_VALID = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_REJECTED = 2;

/**
 * @brief Observer that forwards component messages to a console + file logger
 *
 * Core loggers hand observers every level, so the --log-level and
 * --log-config thresholds are applied here.
 */
LogObserver make_file_observer(const std::shared_ptr<Logger>& sink) {
    return [sink](LogLevel level, const std::string& component, const std::string& message) {
        if (static_cast<int>(level) > static_cast<int>(Logger::getFacilityLevel(component))) {
            return;
        }
        sink->outputMessage(level, component + ": " + message);
    };
}

nlohmann::json run_input_mesh(const CliConfig& config, const LogObserver& observer) {
    MeshImporter importer(observer);
    Mesh mesh = importer.import_mesh(*config.input_file);

    ProcessingPipeline pipeline(config.pipeline, observer);
    PipelineResult result = pipeline.process(mesh, config.output_file);

    ResultReporter reporter(observer);
    return reporter.build_report(result);
}

nlohmann::json run_generator(const CliConfig& config, const LogObserver& observer, bool& generation_failed) {
    auto source = std::make_shared<PrimitiveMeshSource>(*config.generate_shape,
                                                        config.generate_size_mm, observer);
    auto pipeline = std::make_shared<const ProcessingPipeline>(config.pipeline, observer);
    MeshGenerator generator(source, pipeline, observer);

    GenerationResult result = generator.generate(config.prompt, config.output_file);
    generation_failed = !result.mesh.has_value();

    ResultReporter reporter(observer);
    return reporter.build_report(result, source->name(), config.prompt);
}

} // namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();
        }

        const CliConfig& config = cli.get_config();

        ConfigValidator config_validator;
        ConfigValidationResult config_check = config_validator.validate(config);
        if (config_check.has_errors()) {
            std::cerr << config_check.format_error_message();
            return EXIT_ERROR;
        }

        if (config.log_level > 0) {
            std::cout << "NeuroForge Prep v" << NEUROFORGE_VERSION_STRING << "\n";
            std::cout << "Watertight mesh preparation for 3D printing\n";
        }

        cli.print_config();

        if (cli.is_dry_run()) {
            if (config.log_level > 0) {
                std::cout << "Dry run mode - configuration validated successfully\n";
            }
            return EXIT_VALID;
        }

        std::shared_ptr<Logger> file_sink;
        LogObserver observer;
        if (config.log_file) {
            file_sink = std::make_shared<Logger>(LogLevel::TRACE, config.log_file);
            observer = make_file_observer(file_sink);
        }

        bool generation_failed = false;
        nlohmann::json report = config.generate_shape
            ? run_generator(config, observer, generation_failed)
            : run_input_mesh(config, observer);

        if (config.report_file) {
            ResultReporter reporter(observer);
            reporter.write_report(report, *config.report_file);
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        if (config.log_level > 0) {
            std::cout << "\n" << ResultReporter::format_summary(report);
            std::cout << "Finished in " << total_duration.count() << "ms\n";
        }

        if (generation_failed) {
            return EXIT_ERROR;
        }
        return report.value("is_valid", false) ? EXIT_VALID : EXIT_REJECTED;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_ERROR;
    }
}
