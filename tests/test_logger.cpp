/**
 * @file test_logger.cpp
 * @brief Log specification parsing and facility levels
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <doctest/doctest.h>

#include "core/Logger.hpp"

using namespace poprelief;

namespace {

struct RegistryReset {
    ~RegistryReset() {
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
};

} // namespace

TEST_CASE("Log specifications count applied entries") {
    RegistryReset reset;

    CHECK(Logger::parseLogConfig("4") == 1);
    CHECK(Logger::getDefaultLevel() == LogLevel::DETAILED);

    CHECK(Logger::parseLogConfig("2,RasterCompositor=6, BoundaryLoader = 5") == 3);
    CHECK(Logger::getDefaultLevel() == LogLevel::WARNING);
    CHECK(Logger::getFacilityLevel("RasterCompositor") == LogLevel::TRACE);
    CHECK(Logger::getFacilityLevel("BoundaryLoader") == LogLevel::DEBUG);

    CHECK(Logger::parseLogConfig("default=3") == 1);
    CHECK(Logger::getDefaultLevel() == LogLevel::INFO);
}

TEST_CASE("Malformed entries are skipped") {
    RegistryReset reset;
    Logger::setDefaultLevel(LogLevel::INFO);

    CHECK(Logger::parseLogConfig("") == 0);
    CHECK(Logger::parseLogConfig("loud") == 0);
    CHECK(Logger::parseLogConfig("3x") == 0);
    CHECK(Logger::parseLogConfig("PNGExporter=high,5") == 1);
    CHECK(Logger::getDefaultLevel() == LogLevel::DEBUG);
    CHECK(Logger::getFacilityLevel("PNGExporter") == LogLevel::DEBUG);
}

TEST_CASE("Levels are clamped to the valid range") {
    RegistryReset reset;

    CHECK(Logger::parseLogConfig("9") == 1);
    CHECK(Logger::getDefaultLevel() == LogLevel::TRACE);
    CHECK(Logger::parseLogConfig("0") == 1);
    CHECK(Logger::getDefaultLevel() == LogLevel::ERROR);
}

TEST_CASE("Facility loggers follow the registry") {
    RegistryReset reset;
    Logger::setDefaultLevel(LogLevel::WARNING);

    Logger terrain("TerrainProcessor");
    CHECK(terrain.getEffectiveLevel() == LogLevel::WARNING);
    CHECK(terrain.shouldOutput(LogLevel::ERROR));
    CHECK_FALSE(terrain.shouldOutput(LogLevel::INFO));

    Logger::setFacilityLevel("TerrainProcessor", LogLevel::DEBUG);
    CHECK(terrain.getEffectiveLevel() == LogLevel::DEBUG);
    CHECK(terrain.shouldOutput(LogLevel::DEBUG));
    CHECK_FALSE(terrain.shouldOutput(LogLevel::TRACE));

    Logger::clearFacilityLevels();
    CHECK(terrain.getEffectiveLevel() == LogLevel::WARNING);
}

TEST_CASE("Explicit instance levels apply without a facility entry") {
    RegistryReset reset;
    Logger::setDefaultLevel(LogLevel::ERROR);

    Logger explicit_logger(LogLevel::DETAILED);
    CHECK(explicit_logger.getEffectiveLevel() == LogLevel::DETAILED);

    Logger named("RasterBuilder");
    named.setLogLevel(LogLevel::INFO);
    CHECK(named.getEffectiveLevel() == LogLevel::INFO);
}
