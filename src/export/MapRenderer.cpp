/**
 * @file MapRenderer.cpp
 * @brief Draws the two masked layers, map furniture and text into one PNG
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "MapRenderer.hpp"
#include "PNGExporter.hpp"
#include "PixelTable.hpp"
#include "../core/GeoUtils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <spawn.h>
#include <stdexcept>
#include <sys/wait.h>

extern char** environ;

namespace poprelief {

RenderOptions RenderOptions::from_config(const ReliefConfig& config) {
    RenderOptions options;
    options.page.width_px = config.canvas_width_px();
    options.page.height_px = config.canvas_height_px();
    options.page.dpi = config.dpi;
    options.font_path = config.font_path;
    options.palette_begin = config.palette_begin;
    options.palette_end = config.palette_end;
    options.legend_breaks = config.legend_breaks;
    options.title = config.title;
    options.subtitle = config.subtitle;
    options.caption = config.caption;
    options.legend_title = config.legend_title;
    options.preview = config.preview;
    return options;
}

MapRenderer::MapRenderer(const RenderOptions& options)
    : options_(options) {
}

std::optional<LogColorScale> MapRenderer::population_scale(const PixelTable& table) const {
    if (table.empty()) {
        return std::nullopt;
    }
    auto [min_value, max_value] = table_value_range(table);
    if (!(max_value > 0.0f)) {
        return std::nullopt;
    }
    // The log axis needs a positive floor
    double floor_value = min_value > 0.0f ? min_value : max_value * 1e-3;
    return LogColorScale(floor_value, max_value, Palette::magma(),
                         options_.palette_begin, options_.palette_end);
}

RgbaCanvas MapRenderer::render(const CompositeMasks& masks, const BoundaryPolygon& boundary) {
    if (!masks.terrain.same_geometry(masks.population)) {
        throw std::invalid_argument("Terrain and population masks differ in geometry");
    }

    stats_ = RenderStats{};

    RasterBuilder builder(options_.page);
    RgbaCanvas canvas = builder.create_canvas();
    MapLayout layout = builder.compute_layout(masks.terrain.extent(), masks.terrain.crs().geographic);

    AnnotationConfig annotation;
    annotation.font_path = options_.font_path;
    annotation.dpi = options_.page.dpi;
    RasterAnnotator annotator(annotation);

    const double cell_w = masks.terrain.resolution_x();
    const double cell_h = masks.terrain.resolution_y();

    // Layer A: terrain where nobody lives
    PixelTable terrain_table = to_pixel_table(masks.terrain);
    GrayScale gray;
    stats_.terrain_rows = builder.paint_table(canvas, layout, terrain_table, cell_w, cell_h,
                                              [&gray](float v) { return gray.color(v); });
    logger_.detailed("Painted " + std::to_string(stats_.terrain_rows) + " terrain cells");

    // Layer B: population on the log scale
    PixelTable population_table = to_pixel_table(masks.population);
    std::optional<LogColorScale> scale = population_scale(population_table);
    if (scale) {
        stats_.population_rows = builder.paint_table(canvas, layout, population_table, cell_w, cell_h,
                                                     [&scale](float v) { return scale->color(v); });
        logger_.detailed("Painted " + std::to_string(stats_.population_rows) + " population cells");
    } else {
        logger_.warning("Population layer is empty; legend omitted");
    }

    // Outline in the grid's CRS
    if (!boundary.empty()) {
        if (crs_equivalent(boundary.crs, masks.terrain.crs())) {
            stats_.outline_segments = builder.add_boundary_outline(canvas, layout, boundary, annotator);
        } else {
            BoundaryPolygon projected = reproject_boundary(boundary, masks.terrain.crs());
            stats_.outline_segments = builder.add_boundary_outline(canvas, layout, projected, annotator);
        }
    }

    stats_.text_drawn = annotator.font_available();
    if (!stats_.text_drawn) {
        logger_.warning("No usable font; map texts and labels are skipped");
    }

    draw_furniture(canvas, layout, annotator, builder);
    if (scale) {
        draw_legend(canvas, layout, annotator, builder, *scale);
    }
    draw_texts(canvas, layout, annotator);

    return canvas;
}

void MapRenderer::draw_texts(RgbaCanvas& canvas, const MapLayout& layout, RasterAnnotator& annotator) {
    if (!stats_.text_drawn) return;

    const RasterConfig& page = options_.page;
    const Color& ink = annotator.get_config().text_color;
    annotator.draw_text(canvas, options_.title, layout.margin, layout.title_baseline,
                        annotator.pt_to_px(page.title_pt), ink);
    annotator.draw_text(canvas, options_.subtitle, layout.margin, layout.subtitle_baseline,
                        annotator.pt_to_px(page.subtitle_pt), ink);
    annotator.draw_text(canvas, options_.caption, layout.margin, layout.caption_baseline,
                        annotator.pt_to_px(page.caption_pt), ink);
}

void MapRenderer::draw_furniture(RgbaCanvas& canvas, const MapLayout& layout, RasterAnnotator& annotator,
                                 const RasterBuilder& builder) {
    const int inset = layout.margin / 2;

    // North arrow, top-left of the panel
    const int arrow_size = builder.pt_to_px(22.0);
    annotator.draw_north_arrow(canvas, layout.panel_x + inset, layout.panel_y + inset, arrow_size);

    // Scale bar, bottom-right of the panel
    const double ground_m = layout.ground_width_m();
    if (!(ground_m > 0.0) || layout.panel_width <= 0) {
        return;
    }
    const double length_m = RasterBuilder::nice_scale_length(ground_m / 4.0);
    const int bar_px = static_cast<int>(std::lround(length_m / ground_m * layout.panel_width));
    annotator.draw_scale_bar(canvas,
                             layout.panel_x + layout.panel_width - inset,
                             layout.panel_y + layout.panel_height - inset,
                             bar_px, builder.pt_to_px(2.5), 4,
                             RasterBuilder::format_distance(length_m),
                             builder.pt_to_px(options_.page.legend_pt));
    logger_.debug("Scale bar " + RasterBuilder::format_distance(length_m) + " = " +
                  std::to_string(bar_px) + " px");
}

void MapRenderer::draw_legend(RgbaCanvas& canvas, const MapLayout& layout, RasterAnnotator& annotator,
                              const RasterBuilder& builder, const LogColorScale& scale) {
    const int font_px = builder.pt_to_px(options_.page.legend_pt);
    const Color& ink = annotator.get_config().text_color;

    const int bar_x = layout.legend_x + layout.legend_width / 8;
    const int bar_w = std::max(1, layout.legend_width / 6);
    const int bar_top = layout.legend_y + font_px * 3;
    const int bar_h = std::max(2, layout.legend_height * 3 / 5);
    const int bar_bottom = bar_top + bar_h;

    if (stats_.text_drawn) {
        annotator.draw_text(canvas, options_.legend_title, layout.legend_x, layout.legend_y + font_px * 2,
                            font_px, ink);
    }

    // Gradient: top row is the maximum
    const double log_min = std::log10(scale.min_value());
    const double log_max = std::log10(scale.max_value());
    for (int row = 0; row < bar_h; ++row) {
        double t = bar_h > 1 ? 1.0 - static_cast<double>(row) / (bar_h - 1) : 1.0;
        double value = std::pow(10.0, log_min + t * (log_max - log_min));
        canvas.fill_rect(bar_x, bar_top + row, bar_w, 1, scale.color(value));
    }
    annotator.draw_rectangle(canvas, bar_x, bar_top, bar_w, bar_h, annotator.get_config().stroke_color, 2.0);

    const int tick_len = std::max(2, bar_w / 4);
    for (double brk : scale.visible_breaks(options_.legend_breaks)) {
        int y = bar_bottom - static_cast<int>(std::lround(scale.position(brk) * bar_h));
        annotator.draw_line(canvas, bar_x + bar_w, y, bar_x + bar_w + tick_len, y,
                            annotator.get_config().stroke_color, 2.0);
        if (stats_.text_drawn) {
            annotator.draw_text(canvas, LogColorScale::format_break(brk),
                                bar_x + bar_w + tick_len * 2, y + font_px / 3, font_px, ink);
        }
    }
}

bool MapRenderer::render_to_file(const CompositeMasks& masks, const BoundaryPolygon& boundary,
                                 const std::string& filename) {
    RgbaCanvas canvas = render(masks, boundary);

    PNGExporter::Options png_options;
    png_options.dpi = options_.page.dpi;
    PNGExporter exporter(png_options);
    if (!exporter.export_canvas(canvas, filename)) {
        return false;
    }

    if (options_.preview) {
        if (display_available()) {
            open_preview(filename);
        } else {
            logger_.debug("No display; preview skipped");
        }
    }
    return true;
}

bool MapRenderer::display_available() {
    const char* x11 = std::getenv("DISPLAY");
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    return (x11 && *x11) || (wayland && *wayland);
}

bool MapRenderer::open_preview(const std::string& filename) {
    std::string program = "xdg-open";
    std::string argument = filename;
    char* argv[] = {program.data(), argument.data(), nullptr};

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, program.c_str(), nullptr, nullptr, argv, environ);
    if (rc != 0) {
        logger_.warning("Could not launch " + program + " for preview (error " + std::to_string(rc) + ")");
        return false;
    }

    int status = 0;
    if (waitpid(pid, &status, 0) < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        logger_.warning("Preview viewer reported a failure for " + filename);
        return false;
    }
    logger_.detailed("Opened preview of " + filename);
    return true;
}

} // namespace poprelief
