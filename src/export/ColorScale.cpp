/**
 * @file ColorScale.cpp
 * @brief Value-to-color mapping for the terrain and population layers
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ColorScale.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace poprelief {

// ============================================================================
// Palette
// ============================================================================

Palette::Palette(std::vector<ColorStop> stops) : stops_(std::move(stops)) {
    if (stops_.empty()) {
        throw std::invalid_argument("Palette needs at least one color stop");
    }
    std::sort(stops_.begin(), stops_.end(),
              [](const ColorStop& a, const ColorStop& b) { return a.position < b.position; });
}

Palette Palette::magma() {
    const char* hex[] = {"000004", "1D1147", "51127C", "822681", "B63679",
                         "E65164", "FB8861", "FEC287", "FCFDBF"};
    std::vector<ColorStop> stops;
    for (int i = 0; i < 9; ++i) {
        stops.push_back({i / 8.0, parse_hex_color(hex[i])});
    }
    return Palette(std::move(stops));
}

Color Palette::at(double t) const {
    t = std::clamp(t, 0.0, 1.0);

    if (t <= stops_.front().position) return stops_.front().color;
    if (t >= stops_.back().position) return stops_.back().color;

    for (size_t i = 0; i + 1 < stops_.size(); ++i) {
        const auto& a = stops_[i];
        const auto& b = stops_[i + 1];
        if (t >= a.position && t <= b.position) {
            double span = b.position - a.position;
            double f = span > 0.0 ? (t - a.position) / span : 0.0;
            Color out;
            for (int c = 0; c < 4; ++c) {
                out[c] = static_cast<uint8_t>(std::lround(a.color[c] * (1.0 - f) + b.color[c] * f));
            }
            return out;
        }
    }
    return stops_.back().color;
}

// ============================================================================
// GrayScale
// ============================================================================

Color GrayScale::color(double intensity) const {
    if (std::isnan(intensity)) {
        intensity = 0.0;
    }
    intensity = std::clamp(intensity, 0.0, 1.0);
    auto v = static_cast<uint8_t>(std::lround(dark_ + (light_ - dark_) * intensity));
    return {v, v, v, 255};
}

// ============================================================================
// LogColorScale
// ============================================================================

LogColorScale::LogColorScale(double min_value, double max_value, Palette palette,
                             double palette_begin, double palette_end)
    : min_value_(min_value), max_value_(max_value), palette_(std::move(palette)),
      palette_begin_(palette_begin), palette_end_(palette_end) {
    if (!(min_value > 0.0) || !(max_value >= min_value)) {
        throw std::invalid_argument("LogColorScale needs 0 < min <= max");
    }
    if (palette_begin < 0.0 || palette_end > 1.0 || palette_begin >= palette_end) {
        throw std::invalid_argument("LogColorScale palette range must satisfy 0 <= begin < end <= 1");
    }
    log_min_ = std::log10(min_value);
    log_span_ = std::log10(max_value) - log_min_;
}

double LogColorScale::position(double value) const {
    if (!(value > 0.0) || log_span_ <= 0.0) {
        return 0.0;
    }
    return std::clamp((std::log10(value) - log_min_) / log_span_, 0.0, 1.0);
}

Color LogColorScale::color(double value) const {
    double t = palette_begin_ + position(value) * (palette_end_ - palette_begin_);
    return palette_.at(t);
}

std::vector<double> LogColorScale::visible_breaks(const std::vector<double>& breaks) const {
    std::vector<double> out;
    for (double b : breaks) {
        if (b >= min_value_ && b <= max_value_) {
            out.push_back(b);
        }
    }
    return out;
}

std::string LogColorScale::format_break(double value) {
    auto rounded = static_cast<long long>(std::llround(value));
    if (std::abs(value - static_cast<double>(rounded)) > 1e-9) {
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }

    std::string digits = std::to_string(std::llabs(rounded));
    std::string grouped;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) grouped.insert(grouped.begin(), ',');
        grouped.insert(grouped.begin(), *it);
        count++;
    }
    return rounded < 0 ? "-" + grouped : grouped;
}

// ============================================================================
// Hex colors
// ============================================================================

Color parse_hex_color(const std::string& hex_color, uint8_t alpha) {
    std::string color = hex_color;
    if (!color.empty() && color[0] == '#') {
        color = color.substr(1);
    }

    if (color.length() != 6 ||
        !std::all_of(color.begin(), color.end(), [](unsigned char c) { return std::isxdigit(c); })) {
        throw std::invalid_argument("Invalid hex color: " + hex_color);
    }

    auto r = static_cast<uint8_t>(std::stoi(color.substr(0, 2), nullptr, 16));
    auto g = static_cast<uint8_t>(std::stoi(color.substr(2, 2), nullptr, 16));
    auto b = static_cast<uint8_t>(std::stoi(color.substr(4, 2), nullptr, 16));
    return {r, g, b, alpha};
}

} // namespace poprelief
