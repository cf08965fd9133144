/**
 * @file RasterBuilder.hpp
 * @brief Page layout and cell painting for the relief map
 *
 * Lays out the fixed-size page (title band, map panel, legend column,
 * caption band) and paints pixel tables into the map panel. World
 * coordinates map to the panel with equal scale on both axes after
 * shrinking x by cos(mid-latitude) for geographic data.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "population_relief.hpp"
#include "ColorScale.hpp"
#include "RasterAnnotator.hpp"
#include "RgbaCanvas.hpp"
#include <functional>
#include <string>
#include <utility>

namespace poprelief {

/**
 * @brief Configuration for page generation
 */
struct RasterConfig {
    int width_px = 4800;
    int height_px = 3000;
    double dpi = 600.0;

    Color background_color = {255, 255, 255, 255};  // White
    Color outline_color = {0, 0, 0, 255};           // Black
    double outline_width_pt = 0.35;

    // Typography (points)
    double title_pt = 14.0;
    double subtitle_pt = 9.0;
    double caption_pt = 6.0;
    double legend_pt = 6.5;

    double margin_in = 0.15;
    double legend_width_in = 1.25;
};

/**
 * @brief Pixel rectangles of the page and the world-to-panel mapping
 */
struct MapLayout {
    int canvas_width = 0;
    int canvas_height = 0;
    int margin = 0;

    // Map panel (fitted to the data aspect)
    int panel_x = 0;
    int panel_y = 0;
    int panel_width = 0;
    int panel_height = 0;

    // Legend column
    int legend_x = 0;
    int legend_y = 0;
    int legend_width = 0;
    int legend_height = 0;

    // Text baselines
    int title_baseline = 0;
    int subtitle_baseline = 0;
    int caption_baseline = 0;

    // World mapping
    BoundingBox bounds;
    bool geographic = false;
    double x_scale = 1.0;        // cos(mid-latitude) for geographic data
    double px_per_unit = 1.0;    // Panel pixels per (scaled) world unit

    /**
     * @brief World coordinate to fractional canvas pixel
     */
    std::pair<double, double> to_pixel(double x, double y) const {
        return {panel_x + (x - bounds.min_x) * x_scale * px_per_unit,
                panel_y + (bounds.max_y - y) * px_per_unit};
    }

    /**
     * @brief Ground width of the panel in meters
     */
    double ground_width_m() const;
};

class RasterBuilder {
public:
    explicit RasterBuilder(const RasterConfig& config = RasterConfig{});

    /**
     * @brief Blank page in the background color
     */
    RgbaCanvas create_canvas() const;

    /**
     * @brief Page layout for data covering bounds
     * @throws std::invalid_argument for empty bounds
     */
    MapLayout compute_layout(const BoundingBox& bounds, bool geographic) const;

    /**
     * @brief Paint each record as its cell's footprint
     * @return Number of records painted
     */
    size_t paint_table(RgbaCanvas& canvas, const MapLayout& layout, const PixelTable& table,
                       double cell_width, double cell_height,
                       const std::function<Color(float)>& color_for) const;

    /**
     * @brief Every ring of every part as a thin line
     * @return Number of segments drawn
     */
    size_t add_boundary_outline(RgbaCanvas& canvas, const MapLayout& layout,
                                const BoundaryPolygon& boundary, RasterAnnotator& annotator) const;

    /**
     * @brief Largest 1/2/5 x 10^k length not above target_m
     */
    static double nice_scale_length(double target_m);

    /**
     * @brief "250 m", "20 km"
     */
    static std::string format_distance(double meters);

    int pt_to_px(double points) const;

    const RasterConfig& get_config() const { return config_; }

private:
    RasterConfig config_;
};

} // namespace poprelief
