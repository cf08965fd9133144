/**
 * @file TerrainProcessor.hpp
 * @brief Slope, aspect and hillshade derivation from an elevation grid
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "population_relief.hpp"
#include "Logger.hpp"
#include <optional>
#include <utility>

namespace poprelief {

/**
 * @brief Terrain derivatives on whole grids
 *
 * Gradients use Horn's 3x3 kernel. A cell on the grid edge, or whose
 * window holds any no-data cell, is no-data in every derived grid.
 */
class TerrainProcessor {
public:
    struct Options {
        double exaggeration = 1.3;
        double azimuth_deg = 225.0;    // Light source, clockwise from north
        double altitude_deg = 40.0;    // Light source above horizon
    };

    /**
     * @brief Partial derivatives at one cell, in elevation units per meter
     */
    struct Gradient {
        double dz_dx_east;
        double dz_dy_south;
    };

    TerrainProcessor();
    explicit TerrainProcessor(const Options& options);

    /**
     * @brief Elevation times the exaggeration factor
     */
    RasterGrid exaggerate(const RasterGrid& elevation) const;

    /**
     * @brief Slope in radians from horizontal
     */
    RasterGrid compute_slope(const RasterGrid& elevation) const;

    /**
     * @brief Compass bearing of the downhill direction, radians in [0, 2pi)
     *
     * Flat cells get bearing 0.
     */
    RasterGrid compute_aspect(const RasterGrid& elevation) const;

    /**
     * @brief Lambertian illumination in [0, 1]
     * @throws std::invalid_argument if slope and aspect geometries differ
     */
    RasterGrid compute_hillshade(const RasterGrid& slope, const RasterGrid& aspect) const;

    /**
     * @brief exaggerate, slope, aspect, hillshade
     */
    RasterGrid process(const RasterGrid& elevation) const;

    /**
     * @brief Horn gradient at a cell, nullopt on edge or no-data window
     */
    static std::optional<Gradient> horn_gradient(const RasterGrid& grid, size_t col, size_t row);

    /**
     * @brief Cell width and height in meters for one row
     *
     * Projected grids use the geotransform directly. Geographic grids scale
     * degrees by 111320 m, with x shrunk by cos(latitude) of the row.
     */
    static std::pair<double, double> cell_size_meters(const RasterGrid& grid, size_t row);

    const Options& options() const { return options_; }

private:
    Options options_;
    Logger logger_{"TerrainProcessor"};
};

} // namespace poprelief
