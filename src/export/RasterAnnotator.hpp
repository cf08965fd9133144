/**
 * @file RasterAnnotator.hpp
 * @brief Draws lines, shapes, text and map furniture on an RGBA canvas
 *
 * Text goes through FreeType with antialiased alpha blending. Everything
 * else is integer pixel drawing.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "RgbaCanvas.hpp"
#include "../core/Logger.hpp"
#include <ft2build.h>
#include FT_FREETYPE_H
#include <string>
#include <utility>
#include <vector>

namespace poprelief {

/**
 * @brief Configuration for raster annotations
 */
struct AnnotationConfig {
    Color stroke_color = {0, 0, 0, 255};
    Color text_color = {0, 0, 0, 255};
    Color fill_light = {255, 255, 255, 255};

    std::string font_path = "";           ///< Font file path (empty = auto-detect)
    double dpi = 600.0;                   ///< For point-to-pixel conversion
};

class RasterAnnotator {
public:
    explicit RasterAnnotator(const AnnotationConfig& config = AnnotationConfig{});
    ~RasterAnnotator();

    RasterAnnotator(const RasterAnnotator&) = delete;
    RasterAnnotator& operator=(const RasterAnnotator&) = delete;

    /**
     * @brief Thick line, square brush of the given width
     */
    void draw_line(RgbaCanvas& canvas, int x1, int y1, int x2, int y2,
                   const Color& color, double width = 1.0);

    /**
     * @brief Closed outline through pixel-space vertices
     */
    void draw_ring(RgbaCanvas& canvas, const std::vector<std::pair<double, double>>& points,
                   const Color& color, double width = 1.0);

    void draw_rectangle(RgbaCanvas& canvas, int x, int y, int width, int height,
                        const Color& color, double stroke_width = 1.0);

    /**
     * @brief Even-odd scanline fill of a pixel-space polygon
     */
    void fill_polygon(RgbaCanvas& canvas, const std::vector<std::pair<double, double>>& points,
                      const Color& color);

    /**
     * @brief True if a usable font was found and loaded
     */
    bool font_available();

    /**
     * @brief Draw text with its baseline at y
     * @param anchor "start", "middle" or "end"
     * @return false if no font is available
     */
    bool draw_text(RgbaCanvas& canvas, const std::string& text, int x, int y,
                   int font_size_px, const Color& color, const std::string& anchor = "start");

    /**
     * @brief Advance width in pixels, or -1 without a font
     */
    int measure_text_width(const std::string& text, int font_size_px);

    /**
     * @brief North arrow with "N" label inside a size x size box at (x, y)
     */
    void draw_north_arrow(RgbaCanvas& canvas, int x, int y, int size);

    /**
     * @brief Segmented scale bar ending at (right, bottom) with a centered label
     * @param bar_length_px Total bar length
     * @param segments Number of alternating black/white segments
     */
    void draw_scale_bar(RgbaCanvas& canvas, int right, int bottom, int bar_length_px,
                        int bar_height_px, int segments, const std::string& label, int font_size_px);

    /**
     * @brief Points to pixels at the configured dpi
     */
    int pt_to_px(double points) const;

    const AnnotationConfig& get_config() const { return config_; }

private:
    AnnotationConfig config_;

    // FreeType state
    FT_Library ft_library_;
    FT_Face ft_face_;
    bool ft_initialized_;
    bool font_lookup_done_;
    std::string loaded_font_path_;

    Logger logger_{"RasterAnnotator"};

    bool initialize_freetype();
    bool load_font(const std::string& font_path);
    void cleanup_freetype();
    bool ensure_font();

    /**
     * @brief Preferred path if it exists, else the first common Linux system font
     */
    std::string resolve_font_path(const std::string& preferred_path) const;
};

} // namespace poprelief
