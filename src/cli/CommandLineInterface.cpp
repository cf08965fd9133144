/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface for the population relief map generator
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CommandLineInterface.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace poprelief {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("poprelief",
        "Render population density over terrain relief for Switzerland\n"
        "\n"
        "Downloads the GADM country boundary, the WorldPop 100 m population\n"
        "raster and terrain elevation tiles, shades the relief and writes one\n"
        "8 x 5 inch, 600 dpi PNG map.");

    parser.add_option("config", "c", "Load run-time settings from a JSON file");
    parser.add_option("create-config", "", "Write a default JSON configuration file and exit");

    // Output
    parser.add_option("output-dir", "", "Directory for the PNG (default: current directory)");
    parser.add_option("output", "", "PNG file name (default: switzerland_population_relief.png)");
    parser.add_option("scratch-dir", "", "Download directory (default: temporary, removed after the run)");
    parser.add_flag("keep-downloads", "", "Keep downloaded files after the run");

    // Local inputs
    parser.add_option("boundary-file", "", "Use a local boundary (GeoJSON, GeoPackage, Shapefile)");
    parser.add_option("population-file", "", "Use a local population raster");
    parser.add_option("elevation-file", "", "Use a local elevation raster");

    // Rendering
    parser.add_option("font", "", "TrueType font for map texts (default: system font)");
    parser.add_flag("no-preview", "", "Do not open the finished map in a viewer");

    // Logging and utility
    parser.add_option("log-level", "", "1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE; "
                                       "per facility: \"3,TerrainProcessor=6\"");
    parser.add_option("log-file", "", "Also log to file (append if exists)");
    parser.add_flag("silent", "s", "Errors only (same as --log-level 1)");
    parser.add_flag("verbose", "v", "Everything (same as --log-level 6)");
    parser.add_flag("dry-run", "", "Parse arguments and configuration without processing");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_requested() ? 0 : 1;
        return false;
    }

    if (!parser.get_positional().empty()) {
        std::cerr << "Unexpected argument: " << parser.get_positional().front() << std::endl;
        exit_code_ = 1;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "poprelief v" << POPRELIEF_VERSION_STRING << std::endl;
        std::cout << "Population density over terrain relief maps" << std::endl;
        std::cout << "Built with GDAL, libcurl, FreeType, nlohmann/json" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        exit_code_ = 0;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to write configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        exit_code_ = 0;
        return false;
    }

    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value(), config_)) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
    }

    const char* env_log_level = std::getenv("POPRELIEF_LOG_LEVEL");
    if (env_log_level && *env_log_level) {
        if (!apply_log_spec(env_log_level, config_)) {
            std::cerr << "Warning: ignoring POPRELIEF_LOG_LEVEL=" << env_log_level << std::endl;
        }
    }

    if (auto value = parser.get("log-level")) {
        if (!apply_log_spec(value.value(), config_)) {
            std::cerr << "Invalid log level specification: " << value.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
    }

    parse_all_options(parser);
    return true;
}

void CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    if (auto value = parser.get("output-dir")) config_.output_directory = value.value();
    if (auto value = parser.get("output")) config_.output_filename = value.value();
    if (auto value = parser.get("scratch-dir")) config_.scratch_directory = value.value();
    if (parser.get_flag("keep-downloads")) config_.keep_downloads = true;

    if (auto value = parser.get("boundary-file")) config_.boundary_file = value.value();
    if (auto value = parser.get("population-file")) config_.population_file = value.value();
    if (auto value = parser.get("elevation-file")) config_.elevation_file = value.value();

    if (auto value = parser.get("font")) config_.font_path = value.value();
    if (parser.get_flag("no-preview")) config_.preview = false;

    // Flags override any level specification
    if (parser.get_flag("silent")) {
        config_.log_level = 1;
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
    if (parser.get_flag("verbose")) {
        config_.log_level = 6;
        Logger::setDefaultLevel(LogLevel::TRACE);
    }

    if (auto value = parser.get("log-file")) config_.log_file = value.value();

    dry_run_ = parser.get_flag("dry-run");
}

bool CommandLineInterface::apply_log_spec(const std::string& spec, ReliefConfig& config) {
    if (Logger::parseLogConfig(spec) == 0) {
        return false;
    }
    config.log_level = static_cast<int>(Logger::getDefaultLevel());
    return true;
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    const ReliefConfig defaults;

    json config = {
        {"output_directory", defaults.output_directory},
        {"output_filename", defaults.output_filename},
        {"scratch_directory", defaults.scratch_directory},
        {"keep_downloads", defaults.keep_downloads},
        {"boundary_file", nullptr},
        {"population_file", nullptr},
        {"elevation_file", nullptr},
        {"font_path", defaults.font_path},
        {"preview", defaults.preview},
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

bool CommandLineInterface::load_config_file(const std::string& filename, ReliefConfig& config) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file: " << filename << std::endl;
        return false;
    }

    try {
        json j;
        file >> j;
        if (!j.is_object()) {
            std::cerr << "Error: Config file must contain a JSON object: " << filename << std::endl;
            return false;
        }

        auto read_string = [&j](const std::string& key, std::string& target) {
            if (j.contains(key) && !j[key].is_null()) target = j[key].get<std::string>();
        };
        auto read_path = [&j](const std::string& key, std::optional<std::string>& target) {
            if (!j.contains(key)) return;
            if (j[key].is_null()) {
                target.reset();
            } else {
                target = j[key].get<std::string>();
            }
        };
        auto read_bool = [&j](const std::string& key, bool& target) {
            if (j.contains(key) && !j[key].is_null()) target = j[key].get<bool>();
        };

        read_string("output_directory", config.output_directory);
        read_string("output_filename", config.output_filename);
        read_string("scratch_directory", config.scratch_directory);
        read_bool("keep_downloads", config.keep_downloads);
        read_path("boundary_file", config.boundary_file);
        read_path("population_file", config.population_file);
        read_path("elevation_file", config.elevation_file);
        read_string("font_path", config.font_path);
        read_bool("preview", config.preview);
        read_path("log_file", config.log_file);

        // Either a number or a facility specification
        if (j.contains("log_level") && !j["log_level"].is_null()) {
            const json& level = j["log_level"];
            std::string spec = level.is_string() ? level.get<std::string>()
                                                 : std::to_string(level.get<int>());
            if (!apply_log_spec(spec, config)) {
                std::cerr << "Error: Invalid log_level in " << filename << ": " << spec << std::endl;
                return false;
            }
        }

    } catch (const json::exception& e) {
        std::cerr << "Error: Invalid configuration in " << filename << ": " << e.what() << std::endl;
        return false;
    }

    return true;
}

void CommandLineInterface::print_config() const {
    if (config_.log_level < 4) return;  // DETAILED or higher

    std::cout << "\n=== Configuration ===\n";
    std::cout << "Country: " << config_.country_iso3 << " (GADM level " << config_.admin_level << ")\n";
    std::cout << "Elevation zoom: " << config_.elevation_zoom << "\n";
    std::cout << "Output: " << config_.output_directory << "/" << config_.output_filename << "\n";
    std::cout << "Scratch directory: "
              << (config_.scratch_directory.empty() ? "(temporary)" : config_.scratch_directory)
              << (config_.keep_downloads ? ", kept" : "") << "\n";
    if (config_.boundary_file) std::cout << "Boundary file: " << *config_.boundary_file << "\n";
    if (config_.population_file) std::cout << "Population file: " << *config_.population_file << "\n";
    if (config_.elevation_file) std::cout << "Elevation file: " << *config_.elevation_file << "\n";
    std::cout << "Font: " << (config_.font_path.empty() ? "(auto)" : config_.font_path) << "\n";
    std::cout << "Preview: " << (config_.preview ? "yes" : "no") << "\n";
    std::cout << "Canvas: " << config_.canvas_width_px() << "x" << config_.canvas_height_px()
              << " px at " << config_.dpi << " dpi\n";
    std::cout << "=====================\n\n";
}

} // namespace poprelief
