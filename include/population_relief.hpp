#pragma once

/**
 * @file population_relief.hpp
 * @brief Main header for the population relief map generator
 *
 * Core data model (grids, boundary geometry, pixel tables), the fixed
 * pipeline configuration and the generator that sequences the five
 * pipeline stages into a single rendered map.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <array>
#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace poprelief {

// ============================================================================
// Geometry primitives
// ============================================================================

/**
 * @brief 2D point with x, y coordinates
 */
struct Point2D {
    double x_, y_;

    Point2D() : x_(0), y_(0) {}
    Point2D(double x, double y) : x_(x), y_(y) {}

    double x() const { return x_; }
    double y() const { return y_; }

    bool operator==(const Point2D& other) const {
        return x_ == other.x_ && y_ == other.y_;
    }
};

/**
 * @brief Bounding box for spatial queries
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    bool contains(const Point2D& point) const {
        return point.x() >= min_x && point.x() <= max_x &&
               point.y() >= min_y && point.y() <= max_y;
    }

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    bool empty() const { return width() <= 0.0 || height() <= 0.0; }
};

/**
 * @brief Coordinate reference system tag
 *
 * Carries the WKT definition and whether coordinates are angular degrees
 * (geographic) or linear meters (projected).
 */
struct CrsTag {
    std::string wkt;
    bool geographic = false;

    bool operator==(const CrsTag& other) const {
        return wkt == other.wkt && geographic == other.geographic;
    }
    bool operator!=(const CrsTag& other) const { return !(*this == other); }
};

/**
 * @brief GDAL-ordered affine transform
 *
 * [0] origin x, [1] pixel width, [2] row rotation,
 * [3] origin y, [4] column rotation, [5] pixel height (negative north-up)
 */
using GeoTransform = std::array<double, 6>;

// ============================================================================
// Raster grid
// ============================================================================

/**
 * @brief Dense single-band raster with georeferencing
 *
 * Row-major float storage. No-data cells are NaN. A grid has no mutators:
 * every transform in the pipeline produces a new grid.
 */
class RasterGrid {
public:
    RasterGrid() = default;

    /**
     * @brief Construct a grid filled with no-data
     */
    RasterGrid(size_t width, size_t height, const GeoTransform& geotransform, CrsTag crs);

    /**
     * @brief Construct a grid from existing row-major values
     * @throws std::invalid_argument if values.size() != width * height
     */
    RasterGrid(size_t width, size_t height, const GeoTransform& geotransform, CrsTag crs,
               std::vector<float> values);

    static float nodata() { return std::numeric_limits<float>::quiet_NaN(); }
    static bool is_nodata(float value) { return std::isnan(value); }

    size_t width() const { return width_; }
    size_t height() const { return height_; }
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    const GeoTransform& geotransform() const { return geotransform_; }
    const CrsTag& crs() const { return crs_; }
    const std::vector<float>& values() const { return values_; }

    /**
     * @brief Cell value
     * @throws std::out_of_range outside the grid
     */
    float at(size_t col, size_t row) const;

    /**
     * @brief Cell value, NaN outside the grid
     */
    float value_or_nodata(long col, long row) const;

    // Cell centers in world coordinates
    double cell_center_x(size_t col) const;
    double cell_center_y(size_t row) const;

    double resolution_x() const { return std::abs(geotransform_[1]); }
    double resolution_y() const { return std::abs(geotransform_[5]); }

    /**
     * @brief World coordinate to fractional pixel coordinate (cell corner origin)
     */
    std::pair<double, double> world_to_pixel(double x, double y) const;

    /**
     * @brief Outer extent of the grid in world coordinates
     */
    BoundingBox extent() const;

    /**
     * @brief True if origin, resolution, size and CRS match
     */
    bool same_geometry(const RasterGrid& other, double tolerance = 1e-9) const;

    /**
     * @brief New grid with this grid's geometry and the given values
     */
    RasterGrid with_values(std::vector<float> values) const;

    size_t valid_count() const;

    /**
     * @brief Min/max over valid cells ({NaN, NaN} if none)
     */
    std::pair<float, float> value_range() const;

private:
    size_t width_ = 0;
    size_t height_ = 0;
    GeoTransform geotransform_{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
    CrsTag crs_;
    std::vector<float> values_;
};

// ============================================================================
// Boundary geometry
// ============================================================================

using Ring = std::vector<Point2D>;

/**
 * @brief One polygon of a (multi)polygon: rings[0] exterior, rest holes
 */
struct PolygonPart {
    std::vector<Ring> rings;

    const Ring& exterior() const { return rings.front(); }
};

/**
 * @brief Administrative boundary, possibly multi-part
 */
struct BoundaryPolygon {
    std::vector<PolygonPart> parts;
    CrsTag crs;

    bool empty() const { return parts.empty(); }
    size_t vertex_count() const;

    BoundingBox bounds() const;

    /**
     * @brief Point-in-polygon (inside an exterior, outside its holes)
     */
    bool contains(double x, double y) const;
};

// ============================================================================
// Renderer hand-off
// ============================================================================

/**
 * @brief One valid cell: center coordinates and value
 */
struct PixelRecord {
    double x;
    double y;
    float value;
};

using PixelTable = std::vector<PixelRecord>;

/**
 * @brief Output of the compositing stage
 */
struct CompositeMasks {
    RasterGrid terrain;     ///< Hillshade where population is no-data
    RasterGrid population;  ///< Population above threshold
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Configuration for the relief map pipeline
 *
 * The pipeline parameters are fixed for one country, one population
 * dataset, one elevation dataset and one rendering style. Only the I/O and
 * logging settings at the bottom are meant to be changed at run time.
 */
struct ReliefConfig {
    // Boundary (GADM 4.1)
    std::string country_iso3 = "CHE";
    int admin_level = 0;
    std::string boundary_url_template =
        "https://geodata.ucdavis.edu/gadm/gadm4.1/json/gadm41_{iso3}_{level}.json";

    // Population (WorldPop constrained, 100 m, 2020)
    std::string population_url =
        "https://data.worldpop.org/GIS/Population/Global_2000_2020_Constrained/2020/BSGM/CHE/"
        "che_ppp_2020_constrained.tif";

    // Elevation (terrain tiles, Web Mercator GeoTIFF)
    std::string elevation_tile_url_template =
        "https://s3.amazonaws.com/elevation-tiles-prod/geotiff/{z}/{x}/{y}.tif";
    int elevation_zoom = 10;

    // Terrain
    double exaggeration = 1.3;
    double light_azimuth_deg = 225.0;
    double light_altitude_deg = 40.0;

    // Compositing
    float population_threshold = 0.1f;

    // Rendering
    double palette_begin = 0.2;
    double palette_end = 1.0;
    std::vector<double> legend_breaks = {1.0, 10.0, 100.0, 1000.0};
    double width_in = 8.0;
    double height_in = 5.0;
    double dpi = 600.0;
    std::string title = "Switzerland";
    std::string subtitle = "Population density over terrain relief";
    std::string caption = "Data: WorldPop 2020 (100 m), GADM 4.1, AWS Terrain Tiles (z10)";
    std::string legend_title = "People per 100 m cell";

    // Run-time settings
    std::string output_directory = ".";
    std::string output_filename = "switzerland_population_relief.png";
    std::string scratch_directory = "";   // Empty = system temp directory
    bool keep_downloads = false;
    std::optional<std::string> boundary_file;
    std::optional<std::string> population_file;
    std::optional<std::string> elevation_file;
    std::string font_path = "";           // Empty = auto-detect system font
    bool preview = true;
    int timeout_seconds = 120;

    // Logging
    int log_level = 3;  // 1=ERROR .. 6=TRACE
    std::optional<std::string> log_file;

    int canvas_width_px() const { return static_cast<int>(std::lround(width_in * dpi)); }
    int canvas_height_px() const { return static_cast<int>(std::lround(height_in * dpi)); }
};

/**
 * @brief Timing and size figures for one run
 */
struct PerformanceMetrics {
    std::chrono::milliseconds boundary_time{0};
    std::chrono::milliseconds acquisition_time{0};
    std::chrono::milliseconds terrain_time{0};
    std::chrono::milliseconds compositing_time{0};
    std::chrono::milliseconds render_time{0};
    std::chrono::milliseconds total_time{0};

    size_t elevation_cells = 0;
    size_t population_cells = 0;
    size_t terrain_rows = 0;
    size_t population_rows = 0;
};

// ============================================================================
// Generator
// ============================================================================

/**
 * @brief Runs boundary loading, acquisition, terrain processing,
 * compositing and rendering in order
 *
 * Each stage keeps its output for inspection. A failed stage stops the run.
 */
class ReliefMapGenerator {
public:
    explicit ReliefMapGenerator(const ReliefConfig& config);
    ~ReliefMapGenerator();

    // Full pipeline
    bool generate_map();

    // Individual pipeline stages
    bool load_boundary();
    bool acquire_rasters();
    bool process_terrain();
    bool composite_rasters();
    bool render_map();

    // Accessors
    const BoundaryPolygon& get_boundary() const;
    const RasterGrid& get_elevation() const;
    const RasterGrid& get_population() const;
    const RasterGrid& get_hillshade() const;
    const CompositeMasks& get_masks() const;
    const PerformanceMetrics& get_metrics() const;
    std::string get_output_path() const;

    const ReliefConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace poprelief
