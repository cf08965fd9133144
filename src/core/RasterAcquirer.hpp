/**
 * @file RasterAcquirer.hpp
 * @brief Population and elevation raster acquisition
 *
 * The population grid is read as published. The elevation grid is
 * assembled from terrain tiles, warped into the boundary CRS over the
 * boundary's bounding box and clipped to the boundary polygon.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "population_relief.hpp"
#include "GeoUtils.hpp"
#include "HttpClient.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace poprelief {

class RasterAcquirer {
public:
    struct Config {
        std::string population_url;
        std::string elevation_tile_url_template;
        int elevation_zoom = 10;
    };

    RasterAcquirer(const Config& config, const HttpClient& http);

    /**
     * @brief Download the population raster into scratch_dir and read band 1
     */
    std::optional<RasterGrid> fetch_population(const std::filesystem::path& scratch_dir) const;

    /**
     * @brief Download, mosaic, warp and clip terrain tiles for the boundary
     */
    std::optional<RasterGrid> fetch_elevation(const BoundaryPolygon& boundary,
                                              const std::filesystem::path& scratch_dir) const;

    /**
     * @brief Read band 1 of any GDAL raster; source no-data becomes NaN
     */
    std::optional<RasterGrid> load_raster_file(const std::string& path) const;

    /**
     * @brief Local elevation raster brought onto the boundary's CRS and extent
     *
     * A raster already in the boundary CRS is cropped without resampling;
     * anything else is warped. The result is clipped to the polygon.
     */
    std::optional<RasterGrid> load_elevation_file(const std::string& path,
                                                  const BoundaryPolygon& boundary) const;

    /**
     * @brief Tile range (Web Mercator XYZ) covering the boundary
     */
    std::optional<TileRange> tiles_for_boundary(const BoundaryPolygon& boundary) const;

    /**
     * @brief Smallest window of whole cells covering bounds
     * @throws std::invalid_argument if bounds do not overlap the grid
     */
    static RasterGrid crop_to_bounds(const RasterGrid& grid, const BoundingBox& bounds);

    /**
     * @brief Cells whose centers fall outside the polygon become no-data
     *
     * Even-odd scanline fill over all rings of all parts. The boundary is
     * reprojected into the grid CRS when the two differ.
     */
    static RasterGrid mask_to_boundary(const RasterGrid& grid, const BoundaryPolygon& boundary);

private:
    std::optional<RasterGrid> warp_to_boundary(const std::vector<std::string>& sources,
                                               const BoundaryPolygon& boundary,
                                               const std::filesystem::path& scratch_dir) const;

    Config config_;
    const HttpClient& http_;
    Logger logger_{"RasterAcquirer"};
};

} // namespace poprelief
