/**
 * @file test_color_scale.cpp
 * @brief Palettes, gray ramp and the log population scale
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <doctest/doctest.h>

#include "export/ColorScale.hpp"

#include <cmath>
#include <stdexcept>

using namespace poprelief;

TEST_CASE("Magma endpoints") {
    Palette magma = Palette::magma();
    REQUIRE(magma.stops().size() == 9);

    CHECK(magma.at(0.0) == Color{0x00, 0x00, 0x04, 255});
    CHECK(magma.at(1.0) == Color{0xFC, 0xFD, 0xBF, 255});

    // Clamped outside [0, 1]
    CHECK(magma.at(-3.0) == magma.at(0.0));
    CHECK(magma.at(7.0) == magma.at(1.0));

    // Halfway between the first two stops
    CHECK(magma.at(0.0625) == Color{15, 9, 38, 255});
}

TEST_CASE("Gray ramp runs dark to light") {
    GrayScale gray;
    CHECK(gray.color(0.0) == Color{0x26, 0x26, 0x26, 255});
    CHECK(gray.color(1.0) == Color{0xF2, 0xF2, 0xF2, 255});
    CHECK(gray.color(0.5)[0] == 140);
    CHECK(gray.color(std::nan("")) == gray.color(0.0));
    CHECK(gray.color(2.0) == gray.color(1.0));
}

TEST_CASE("Log scale positions") {
    LogColorScale scale(1.0, 1000.0, Palette::magma());

    CHECK(scale.position(1.0) == doctest::Approx(0.0));
    CHECK(scale.position(10.0) == doctest::Approx(1.0 / 3.0));
    CHECK(scale.position(1000.0) == doctest::Approx(1.0));
    CHECK(scale.position(1e6) == doctest::Approx(1.0));
    CHECK(scale.position(0.0) == 0.0);
    CHECK(scale.position(-5.0) == 0.0);
}

TEST_CASE("Colors come from the palette sub-range") {
    Palette magma = Palette::magma();
    LogColorScale scale(1.0, 1000.0, magma, 0.2, 1.0);

    CHECK(scale.color(1.0) == magma.at(0.2));
    CHECK(scale.color(1000.0) == magma.at(1.0));
    // Darkest magma never shows up
    CHECK(scale.color(0.5) != magma.at(0.0));
}

TEST_CASE("A single-valued range maps to the start of the palette") {
    LogColorScale scale(50.0, 50.0, Palette::magma(), 0.2, 1.0);
    CHECK(scale.position(50.0) == 0.0);
    CHECK(scale.color(50.0) == Palette::magma().at(0.2));
}

TEST_CASE("Log scale rejects bad ranges") {
    CHECK_THROWS_AS(LogColorScale(0.0, 10.0, Palette::magma()), std::invalid_argument);
    CHECK_THROWS_AS(LogColorScale(10.0, 1.0, Palette::magma()), std::invalid_argument);
    CHECK_THROWS_AS(LogColorScale(1.0, 10.0, Palette::magma(), 0.8, 0.2), std::invalid_argument);
    CHECK_THROWS_AS(LogColorScale(1.0, 10.0, Palette::magma(), 0.0, 1.5), std::invalid_argument);
}

TEST_CASE("Legend breaks and labels") {
    LogColorScale scale(5.0, 2000.0, Palette::magma());
    auto breaks = scale.visible_breaks({1.0, 10.0, 100.0, 1000.0, 10000.0});
    REQUIRE(breaks.size() == 3);
    CHECK(breaks.front() == 10.0);
    CHECK(breaks.back() == 1000.0);

    CHECK(LogColorScale::format_break(1.0) == "1");
    CHECK(LogColorScale::format_break(1000.0) == "1,000");
    CHECK(LogColorScale::format_break(1234567.0) == "1,234,567");
    CHECK(LogColorScale::format_break(0.5) == "0.5");
}

TEST_CASE("Hex colors") {
    CHECK(parse_hex_color("#FF8000") == Color{255, 128, 0, 255});
    CHECK(parse_hex_color("00ff00", 128) == Color{0, 255, 0, 128});
    CHECK_THROWS_AS(parse_hex_color("#FFF"), std::invalid_argument);
    CHECK_THROWS_AS(parse_hex_color("GG0000"), std::invalid_argument);
    CHECK_THROWS_AS(Palette(std::vector<ColorStop>{}), std::invalid_argument);
}
