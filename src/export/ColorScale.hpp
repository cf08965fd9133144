/**
 * @file ColorScale.hpp
 * @brief Value-to-color mapping for the terrain and population layers
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "RgbaCanvas.hpp"
#include <string>
#include <vector>

namespace poprelief {

/**
 * @brief Color at a normalized position [0, 1]
 */
struct ColorStop {
    double position;
    Color color;
};

/**
 * @brief Piecewise-linear palette through sorted color stops
 */
class Palette {
public:
    explicit Palette(std::vector<ColorStop> stops);

    /**
     * @brief Matplotlib "magma" sampled at nine even positions
     */
    static Palette magma();

    /**
     * @brief Color at t, clamped to [0, 1]
     */
    Color at(double t) const;

    const std::vector<ColorStop>& stops() const { return stops_; }

private:
    std::vector<ColorStop> stops_;
};

/**
 * @brief Fixed light-to-dark gray ramp for hillshade intensity
 *
 * Intensity 1 maps to the light end, 0 to the dark end.
 */
class GrayScale {
public:
    GrayScale(uint8_t dark = 0x26, uint8_t light = 0xF2) : dark_(dark), light_(light) {}

    Color color(double intensity) const;

private:
    uint8_t dark_;
    uint8_t light_;
};

/**
 * @brief Log10 mapping of a value range onto a palette sub-range
 */
class LogColorScale {
public:
    /**
     * @throws std::invalid_argument unless 0 < min <= max and
     * 0 <= begin < end <= 1
     */
    LogColorScale(double min_value, double max_value, Palette palette,
                  double palette_begin = 0.0, double palette_end = 1.0);

    /**
     * @brief Position of value in [0, 1] on the log axis (clamped)
     */
    double position(double value) const;

    Color color(double value) const;

    /**
     * @brief Breaks that fall inside the value range
     */
    std::vector<double> visible_breaks(const std::vector<double>& breaks) const;

    /**
     * @brief Tick label ("1", "10", "1,000")
     */
    static std::string format_break(double value);

    double min_value() const { return min_value_; }
    double max_value() const { return max_value_; }

private:
    double min_value_;
    double max_value_;
    double log_min_;
    double log_span_;
    Palette palette_;
    double palette_begin_;
    double palette_end_;
};

/**
 * @brief Parse "RRGGBB" or "#RRGGBB"
 * @throws std::invalid_argument on malformed input
 */
Color parse_hex_color(const std::string& hex_color, uint8_t alpha = 255);

} // namespace poprelief
