/**
 * @file TerrainProcessor.cpp
 * @brief Slope, aspect and hillshade derivation from an elevation grid
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "TerrainProcessor.hpp"
#include "GeoUtils.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <sstream>
#include <stdexcept>

namespace poprelief {

namespace {

constexpr double DEG_TO_RAD = std::numbers::pi / 180.0;
constexpr double TWO_PI = 2.0 * std::numbers::pi;

} // namespace

TerrainProcessor::TerrainProcessor() : options_() {
}

TerrainProcessor::TerrainProcessor(const Options& options) : options_(options) {
}

std::pair<double, double> TerrainProcessor::cell_size_meters(const RasterGrid& grid, size_t row) {
    if (!grid.crs().geographic) {
        return {grid.resolution_x(), grid.resolution_y()};
    }
    double lat = grid.cell_center_y(row) * DEG_TO_RAD;
    return {grid.resolution_x() * METERS_PER_DEGREE * std::cos(lat),
            grid.resolution_y() * METERS_PER_DEGREE};
}

std::optional<TerrainProcessor::Gradient> TerrainProcessor::horn_gradient(const RasterGrid& grid,
                                                                           size_t col, size_t row) {
    if (col == 0 || row == 0 || col + 1 >= grid.width() || row + 1 >= grid.height()) {
        return std::nullopt;
    }

    // 0 1 2
    // 3 4 5
    // 6 7 8
    float win[9];
    for (int dr = -1; dr <= 1; ++dr) {
        for (int dc = -1; dc <= 1; ++dc) {
            float v = grid.at(col + dc, row + dr);
            if (RasterGrid::is_nodata(v)) {
                return std::nullopt;
            }
            win[(dr + 1) * 3 + (dc + 1)] = v;
        }
    }

    auto [ew_res, ns_res] = cell_size_meters(grid, row);

    Gradient g;
    g.dz_dx_east = ((win[2] + 2.0 * win[5] + win[8]) - (win[0] + 2.0 * win[3] + win[6])) / (8.0 * ew_res);
    g.dz_dy_south = ((win[6] + 2.0 * win[7] + win[8]) - (win[0] + 2.0 * win[1] + win[2])) / (8.0 * ns_res);
    // South-up grids store row + 1 to the north
    if (grid.geotransform()[5] > 0.0) {
        g.dz_dy_south = -g.dz_dy_south;
    }
    return g;
}

RasterGrid TerrainProcessor::exaggerate(const RasterGrid& elevation) const {
    std::vector<float> values(elevation.values());
    const float factor = static_cast<float>(options_.exaggeration);
    for (float& v : values) {
        if (!RasterGrid::is_nodata(v)) {
            v *= factor;
        }
    }
    return elevation.with_values(std::move(values));
}

RasterGrid TerrainProcessor::compute_slope(const RasterGrid& elevation) const {
    std::vector<float> values(elevation.size(), RasterGrid::nodata());
    for (size_t row = 0; row < elevation.height(); ++row) {
        for (size_t col = 0; col < elevation.width(); ++col) {
            auto g = horn_gradient(elevation, col, row);
            if (!g) continue;
            values[row * elevation.width() + col] =
                static_cast<float>(std::atan(std::hypot(g->dz_dx_east, g->dz_dy_south)));
        }
    }
    return elevation.with_values(std::move(values));
}

RasterGrid TerrainProcessor::compute_aspect(const RasterGrid& elevation) const {
    std::vector<float> values(elevation.size(), RasterGrid::nodata());
    for (size_t row = 0; row < elevation.height(); ++row) {
        for (size_t col = 0; col < elevation.width(); ++col) {
            auto g = horn_gradient(elevation, col, row);
            if (!g) continue;

            // Downhill vector is (-dz/dx east, +dz/dy south) in (east, north) terms
            double bearing = 0.0;
            if (g->dz_dx_east != 0.0 || g->dz_dy_south != 0.0) {
                bearing = std::atan2(-g->dz_dx_east, g->dz_dy_south);
                if (bearing < 0.0) bearing += TWO_PI;
                if (bearing >= TWO_PI) bearing -= TWO_PI;
            }
            values[row * elevation.width() + col] = static_cast<float>(bearing);
        }
    }
    return elevation.with_values(std::move(values));
}

RasterGrid TerrainProcessor::compute_hillshade(const RasterGrid& slope, const RasterGrid& aspect) const {
    if (!slope.same_geometry(aspect)) {
        throw std::invalid_argument("Hillshade: slope and aspect grids differ in geometry");
    }

    const double zenith = (90.0 - options_.altitude_deg) * DEG_TO_RAD;
    const double azimuth = options_.azimuth_deg * DEG_TO_RAD;
    const double cos_zenith = std::cos(zenith);
    const double sin_zenith = std::sin(zenith);

    std::vector<float> values(slope.size(), RasterGrid::nodata());
    for (size_t i = 0; i < values.size(); ++i) {
        float s = slope.values()[i];
        float a = aspect.values()[i];
        if (RasterGrid::is_nodata(s) || RasterGrid::is_nodata(a)) continue;

        // Altitude enters as its zenith complement: flat ground shades to sin(altitude)
        double intensity = cos_zenith * std::cos(s) + sin_zenith * std::sin(s) * std::cos(azimuth - a);
        values[i] = static_cast<float>(std::clamp(intensity, 0.0, 1.0));
    }
    return slope.with_values(std::move(values));
}

RasterGrid TerrainProcessor::process(const RasterGrid& elevation) const {
    std::ostringstream msg;
    msg << "Deriving hillshade (exaggeration " << options_.exaggeration << ", azimuth "
        << options_.azimuth_deg << ", altitude " << options_.altitude_deg << ")";
    logger_.info(msg.str());

    RasterGrid exaggerated = exaggerate(elevation);
    RasterGrid slope = compute_slope(exaggerated);
    RasterGrid aspect = compute_aspect(exaggerated);
    logger_.detailed("Slope and aspect: " + std::to_string(slope.valid_count()) + " valid cells");

    RasterGrid hillshade = compute_hillshade(slope, aspect);
    auto [lo, hi] = hillshade.value_range();
    std::ostringstream done;
    done << "Hillshade: " << hillshade.valid_count() << " valid cells, range " << lo << " to " << hi;
    logger_.info(done.str());
    return hillshade;
}

} // namespace poprelief
