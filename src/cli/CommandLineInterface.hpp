/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the population relief map generator
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "population_relief.hpp"
#include "SimpleCommandLineParser.hpp"
#include <string>

namespace poprelief {

/**
 * @brief Parses arguments and the optional JSON file into a ReliefConfig
 *
 * Precedence: built-in defaults, then the configuration file, then
 * POPRELIEF_LOG_LEVEL, then the command line.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if the pipeline should run; false when help, version or
     * --create-config was handled or an error occurred (see exit_code())
     */
    bool parse_arguments(int argc, char* argv[]);

    const ReliefConfig& get_config() const { return config_; }

    bool is_dry_run() const { return dry_run_; }

    /**
     * @brief Process exit status when parse_arguments() returned false
     */
    int exit_code() const { return exit_code_; }

    /**
     * @brief Print the run-time settings at DETAILED level or above
     */
    void print_config() const;

    /**
     * @brief Write the run-time settings of a default ReliefConfig as JSON
     */
    static bool create_default_config_file(const std::string& filename);

    /**
     * @brief Merge a JSON configuration file into config
     *
     * Unknown keys are ignored. Unreadable files, malformed JSON and
     * values of the wrong type are errors.
     */
    static bool load_config_file(const std::string& filename, ReliefConfig& config);

    /**
     * @brief Apply a "3,TerrainProcessor=6" style specification
     * @return false if nothing in the specification was usable
     */
    static bool apply_log_spec(const std::string& spec, ReliefConfig& config);

private:
    ReliefConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    void parse_all_options(const SimpleCommandLineParser& parser);
};

} // namespace poprelief
