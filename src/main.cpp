/**
 * @file main.cpp
 * @brief Main entry point for the population relief map generator
 *
 * Renders WorldPop population density over shaded terrain relief for
 * Switzerland into a single print-resolution PNG.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "population_relief.hpp"
#include "cli/CommandLineInterface.hpp"
#include "core/Logger.hpp"
#include "version.h"
#include <chrono>
#include <iostream>
#include <memory>

using namespace poprelief;

/**
 * @brief Print performance summary
 */
void print_performance_summary(const PerformanceMetrics& metrics) {
    std::cout << "\n=== Performance Summary ===\n";
    std::cout << "Boundary: " << metrics.boundary_time.count() << "ms\n";
    std::cout << "Acquisition: " << metrics.acquisition_time.count() << "ms\n";
    std::cout << "Terrain: " << metrics.terrain_time.count() << "ms\n";
    std::cout << "Compositing: " << metrics.compositing_time.count() << "ms\n";
    std::cout << "Rendering: " << metrics.render_time.count() << "ms\n";
    std::cout << "Total time: " << metrics.total_time.count() << "ms\n";
    std::cout << "Elevation cells: " << metrics.elevation_cells << "\n";
    std::cout << "Population cells: " << metrics.population_cells << "\n";
    std::cout << "Painted terrain cells: " << metrics.terrain_rows << "\n";
    std::cout << "Painted population cells: " << metrics.population_rows << "\n";
    std::cout << "============================\n";
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help, version, --create-config or a parse error
        }

        const ReliefConfig& config = cli.get_config();
        Logger::setDefaultLogFile(config.log_file);

        if (config.log_level >= 3) {
            std::cout << "poprelief v" << POPRELIEF_VERSION_STRING << "\n";
        }
        cli.print_config();

        if (cli.is_dry_run()) {
            if (config.log_level >= 3) {
                std::cout << "Dry run mode - configuration validated successfully\n";
            }
            return 0;
        }

        auto generator = std::make_unique<ReliefMapGenerator>(config);
        if (!generator->generate_map()) {
            std::cerr << "Error: Map generation failed\n";
            return 1;
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        if (config.log_level >= 4) {
            print_performance_summary(generator->get_metrics());
        }
        if (config.log_level >= 3) {
            std::cout << "\nWrote " << generator->get_output_path() << " in "
                      << total_duration.count() << "ms\n";
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
