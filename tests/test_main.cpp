/**
 * @file test_main.cpp
 * @brief doctest runner for poprelief_tests
 *
 * The only translation unit that defines DOCTEST_CONFIG_IMPLEMENT.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/Logger.hpp"

int main(int argc, char** argv) {
    doctest::Context context;

    // Deterministic ordering; command-line flags may override
    context.setOption("order-by", "name");
    context.applyCommandLine(argc, argv);

    // Components log freely; keep test output to errors
    poprelief::Logger::setDefaultLevel(poprelief::LogLevel::ERROR);

    const int res = context.run();
    if (context.shouldExit()) {
        return res;
    }
    return res;
}
