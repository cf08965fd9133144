/**
 * @file test_command_line.cpp
 * @brief Argument parsing, JSON configuration and log level precedence
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <doctest/doctest.h>

#include "cli/CommandLineInterface.hpp"
#include "core/Logger.hpp"
#include "core/ScratchDirectory.hpp"

#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace poprelief;

namespace {

// argv view over owned strings
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_{"poprelief"} {
        storage_.insert(storage_.end(), args.begin(), args.end());
        for (auto& s : storage_) {
            pointers_.push_back(s.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

// Restores the quiet test logging state on scope exit
struct LoggerStateGuard {
    LoggerStateGuard() { unsetenv("POPRELIEF_LOG_LEVEL"); }
    ~LoggerStateGuard() {
        unsetenv("POPRELIEF_LOG_LEVEL");
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
};

void write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

} // namespace

TEST_CASE("Parser reads long, short and inline options") {
    SimpleCommandLineParser parser("test", "Test parser");
    parser.add_option("output", "o", "Output file");
    parser.add_option("level", "", "Level", false, "3");
    parser.add_flag("quiet", "q", "Quiet");

    Args args{"-o", "map.png", "--quiet"};
    REQUIRE(parser.parse(args.argc(), args.argv()));
    CHECK(parser.get("output") == "map.png");
    CHECK(parser.get_flag("quiet"));
    CHECK(parser.get_as<int>("level") == 3);

    Args inline_args{"--output=other.png", "--level=5"};
    REQUIRE(parser.parse(inline_args.argc(), inline_args.argv()));
    CHECK(parser.get("output") == "other.png");
    CHECK(parser.get_as<int>("level") == 5);
    CHECK_FALSE(parser.get_flag("quiet"));
}

TEST_CASE("Parser rejects unknown options and missing values") {
    SimpleCommandLineParser parser("test", "Test parser");
    parser.add_option("output", "o", "Output file");
    parser.add_flag("quiet", "q", "Quiet");

    Args unknown{"--colour", "red"};
    CHECK_FALSE(parser.parse(unknown.argc(), unknown.argv()));
    CHECK_FALSE(parser.help_requested());

    Args missing{"--output"};
    CHECK_FALSE(parser.parse(missing.argc(), missing.argv()));

    Args flag_value{"--quiet=yes"};
    CHECK_FALSE(parser.parse(flag_value.argc(), flag_value.argv()));
}

TEST_CASE("Command line flags reach the configuration") {
    LoggerStateGuard guard;
    CommandLineInterface cli;
    Args args{"--output-dir", "maps", "--output", "che.png", "--no-preview",
              "--population-file", "pop.tif", "--keep-downloads", "--dry-run"};

    REQUIRE(cli.parse_arguments(args.argc(), args.argv()));
    const ReliefConfig& config = cli.get_config();
    CHECK(config.output_directory == "maps");
    CHECK(config.output_filename == "che.png");
    CHECK_FALSE(config.preview);
    CHECK(config.population_file == "pop.tif");
    CHECK_FALSE(config.boundary_file.has_value());
    CHECK(config.keep_downloads);
    CHECK(cli.is_dry_run());
}

TEST_CASE("Version and bad arguments stop with the right exit code") {
    LoggerStateGuard guard;

    CommandLineInterface version;
    Args version_args{"--version"};
    CHECK_FALSE(version.parse_arguments(version_args.argc(), version_args.argv()));
    CHECK(version.exit_code() == 0);

    CommandLineInterface bad;
    Args bad_args{"--no-such-option"};
    CHECK_FALSE(bad.parse_arguments(bad_args.argc(), bad_args.argv()));
    CHECK(bad.exit_code() == 1);

    CommandLineInterface positional;
    Args positional_args{"switzerland"};
    CHECK_FALSE(positional.parse_arguments(positional_args.argc(), positional_args.argv()));
    CHECK(positional.exit_code() == 1);

    CommandLineInterface bad_level;
    Args level_args{"--log-level", "loud"};
    CHECK_FALSE(bad_level.parse_arguments(level_args.argc(), level_args.argv()));
    CHECK(bad_level.exit_code() == 1);
}

TEST_CASE("Default configuration file round trip") {
    LoggerStateGuard guard;
    ScratchDirectory scratch;
    std::string path = scratch.file("poprelief.json").string();

    REQUIRE(CommandLineInterface::create_default_config_file(path));

    ReliefConfig config;
    config.output_filename = "changed.png";
    config.population_file = "stale.tif";
    REQUIRE(CommandLineInterface::load_config_file(path, config));

    const ReliefConfig defaults;
    CHECK(config.output_filename == defaults.output_filename);
    CHECK(config.output_directory == defaults.output_directory);
    CHECK(config.preview == defaults.preview);
    CHECK(config.log_level == defaults.log_level);
    // null clears a path
    CHECK_FALSE(config.population_file.has_value());
}

TEST_CASE("Configuration file values and errors") {
    LoggerStateGuard guard;
    ScratchDirectory scratch;

    std::string good = scratch.file("good.json").string();
    write_text(good, R"({"output_filename": "x.png", "preview": false,
                         "elevation_file": "dem.tif", "log_level": "2,BoundaryLoader=5",
                         "some_future_key": [1, 2, 3]})");
    ReliefConfig config;
    REQUIRE(CommandLineInterface::load_config_file(good, config));
    CHECK(config.output_filename == "x.png");
    CHECK_FALSE(config.preview);
    CHECK(config.elevation_file == "dem.tif");
    CHECK(config.log_level == 2);
    CHECK(Logger::getFacilityLevel("BoundaryLoader") == LogLevel::DEBUG);

    std::string malformed = scratch.file("malformed.json").string();
    write_text(malformed, "{ \"output_filename\": ");
    ReliefConfig untouched;
    CHECK_FALSE(CommandLineInterface::load_config_file(malformed, untouched));

    std::string wrong_type = scratch.file("wrong_type.json").string();
    write_text(wrong_type, R"({"preview": "sometimes"})");
    CHECK_FALSE(CommandLineInterface::load_config_file(wrong_type, untouched));

    std::string not_object = scratch.file("array.json").string();
    write_text(not_object, "[1, 2]");
    CHECK_FALSE(CommandLineInterface::load_config_file(not_object, untouched));

    CHECK_FALSE(CommandLineInterface::load_config_file(scratch.file("absent.json").string(), untouched));
}

TEST_CASE("Command line log level beats the file and the environment") {
    LoggerStateGuard guard;
    ScratchDirectory scratch;
    std::string path = scratch.file("levels.json").string();
    write_text(path, R"({"log_level": 2})");

    setenv("POPRELIEF_LOG_LEVEL", "5", 1);

    CommandLineInterface env_only;
    Args env_args{"--config", path};
    REQUIRE(env_only.parse_arguments(env_args.argc(), env_args.argv()));
    CHECK(env_only.get_config().log_level == 5);

    CommandLineInterface explicit_level;
    Args cli_args{"--config", path, "--log-level", "4"};
    REQUIRE(explicit_level.parse_arguments(cli_args.argc(), cli_args.argv()));
    CHECK(explicit_level.get_config().log_level == 4);

    CommandLineInterface silent;
    Args silent_args{"--log-level", "6", "--silent"};
    REQUIRE(silent.parse_arguments(silent_args.argc(), silent_args.argv()));
    CHECK(silent.get_config().log_level == 1);
}
