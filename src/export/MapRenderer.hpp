/**
 * @file MapRenderer.hpp
 * @brief Draws the two masked layers, map furniture and text into one PNG
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "population_relief.hpp"
#include "ColorScale.hpp"
#include "RasterAnnotator.hpp"
#include "RasterBuilder.hpp"
#include "RgbaCanvas.hpp"
#include "../core/Logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace poprelief {

/**
 * @brief Rendering style and page texts
 */
struct RenderOptions {
    RasterConfig page;
    std::string font_path = "";

    double palette_begin = 0.2;
    double palette_end = 1.0;
    std::vector<double> legend_breaks = {1.0, 10.0, 100.0, 1000.0};

    std::string title;
    std::string subtitle;
    std::string caption;
    std::string legend_title;

    bool preview = true;

    static RenderOptions from_config(const ReliefConfig& config);
};

/**
 * @brief Counts from the last render
 */
struct RenderStats {
    size_t terrain_rows = 0;
    size_t population_rows = 0;
    size_t outline_segments = 0;
    bool text_drawn = false;
};

class MapRenderer {
public:
    explicit MapRenderer(const RenderOptions& options);

    /**
     * @brief Render both masks and the outline into a page canvas
     *
     * Terrain goes down first on the gray scale, population on top on the
     * log color scale. The color legend is omitted when no cell survives
     * the population mask.
     *
     * @throws std::invalid_argument if the masks differ in geometry or
     * cover an empty extent
     */
    RgbaCanvas render(const CompositeMasks& masks, const BoundaryPolygon& boundary);

    /**
     * @brief render() followed by a single PNG write and the optional preview
     */
    bool render_to_file(const CompositeMasks& masks, const BoundaryPolygon& boundary,
                        const std::string& filename);

    const RenderStats& get_stats() const { return stats_; }

    /**
     * @brief Log color scale for the population table, nullopt if the
     * table has no positive value
     */
    std::optional<LogColorScale> population_scale(const PixelTable& table) const;

    /**
     * @brief True when a desktop session can show the image
     */
    static bool display_available();

private:
    RenderOptions options_;
    RenderStats stats_;
    Logger logger_{"MapRenderer"};

    void draw_texts(RgbaCanvas& canvas, const MapLayout& layout, RasterAnnotator& annotator);
    void draw_furniture(RgbaCanvas& canvas, const MapLayout& layout, RasterAnnotator& annotator,
                        const RasterBuilder& builder);
    void draw_legend(RgbaCanvas& canvas, const MapLayout& layout, RasterAnnotator& annotator,
                     const RasterBuilder& builder, const LogColorScale& scale);

    bool open_preview(const std::string& filename);
};

} // namespace poprelief
