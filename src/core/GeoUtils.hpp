/**
 * @file GeoUtils.hpp
 * @brief CRS helpers, coordinate transformation and slippy-map tile math
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "population_relief.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

class OGRCoordinateTransformation;

namespace poprelief {

// Meters per degree of latitude on the WGS84 sphere approximation
constexpr double METERS_PER_DEGREE = 111320.0;

// Web Mercator latitude limit
constexpr double MAX_MERCATOR_LATITUDE = 85.0511287798066;

// ============================================================================
// CRS helpers
// ============================================================================

/**
 * @brief CRS tag for EPSG:4326 in traditional lon/lat order
 */
CrsTag wgs84_crs();

/**
 * @brief True when both tags describe the same CRS
 *
 * Identical WKT is equal; otherwise OGR decides. An empty WKT only
 * matches another empty WKT.
 */
bool crs_equivalent(const CrsTag& a, const CrsTag& b);

/**
 * @brief Transforms points between two CRSes (lon/lat axis order)
 */
class CoordinateTransformer {
public:
    CoordinateTransformer(const CrsTag& source, const CrsTag& target);
    ~CoordinateTransformer();

    CoordinateTransformer(const CoordinateTransformer&) = delete;
    CoordinateTransformer& operator=(const CoordinateTransformer&) = delete;

    bool valid() const { return transform_ != nullptr; }

    /**
     * @brief Transform one point, nullopt on failure
     */
    std::optional<Point2D> transform(double x, double y) const;

    /**
     * @brief Transform in place; returns per-point success flags
     */
    std::vector<bool> transform(std::vector<double>& xs, std::vector<double>& ys) const;

private:
    struct Deleter {
        void operator()(OGRCoordinateTransformation* ct) const;
    };
    std::unique_ptr<OGRCoordinateTransformation, Deleter> transform_;
};

/**
 * @brief Bounding box transformed by densified edge sampling
 */
std::optional<BoundingBox> transform_bounds(const BoundingBox& bounds, const CrsTag& source,
                                            const CrsTag& target, int samples_per_edge = 21);

/**
 * @brief Boundary with every vertex transformed into target; vertices that
 * fail to transform are dropped
 * @throws std::invalid_argument if no transformation exists
 */
BoundaryPolygon reproject_boundary(const BoundaryPolygon& boundary, const CrsTag& target);

// ============================================================================
// Slippy-map tiles
// ============================================================================

/**
 * @brief Inclusive XYZ tile range at one zoom level
 */
struct TileRange {
    int zoom = 0;
    int min_x = 0;
    int max_x = -1;
    int min_y = 0;
    int max_y = -1;

    int count_x() const { return max_x - min_x + 1; }
    int count_y() const { return max_y - min_y + 1; }
    int count() const { return (max_x < min_x || max_y < min_y) ? 0 : count_x() * count_y(); }
};

int lon_to_tile_x(double lon, int zoom);
int lat_to_tile_y(double lat, int zoom);

/**
 * @brief Tiles covering a lon/lat bounding box
 * @throws std::invalid_argument for zoom outside 0..24
 */
TileRange tile_range_for_bounds(const BoundingBox& lonlat_bounds, int zoom);

/**
 * @brief Substitute {z}, {x}, {y} in a tile URL template
 */
std::string format_tile_url(const std::string& url_template, int zoom, int x, int y);

/**
 * @brief Replace every occurrence of a {key} placeholder
 */
std::string replace_placeholder(std::string text, const std::string& key, const std::string& value);

} // namespace poprelief
