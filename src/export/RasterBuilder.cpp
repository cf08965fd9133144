/**
 * @file RasterBuilder.cpp
 * @brief Page layout and cell painting for the relief map
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterBuilder.hpp"
#include "../core/GeoUtils.hpp"
#include "../core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <sstream>
#include <stdexcept>

namespace poprelief {

double MapLayout::ground_width_m() const {
    double width = bounds.width();
    if (geographic) {
        return width * METERS_PER_DEGREE * x_scale;
    }
    return width;
}

RasterBuilder::RasterBuilder(const RasterConfig& config)
    : config_(config) {
}

int RasterBuilder::pt_to_px(double points) const {
    return static_cast<int>(std::lround(points * config_.dpi / 72.0));
}

RgbaCanvas RasterBuilder::create_canvas() const {
    return RgbaCanvas(config_.width_px, config_.height_px, config_.background_color);
}

MapLayout RasterBuilder::compute_layout(const BoundingBox& bounds, bool geographic) const {
    if (bounds.empty()) {
        throw std::invalid_argument("Cannot lay out a map for empty bounds");
    }

    MapLayout layout;
    layout.canvas_width = config_.width_px;
    layout.canvas_height = config_.height_px;
    layout.margin = static_cast<int>(std::lround(config_.margin_in * config_.dpi));
    layout.bounds = bounds;
    layout.geographic = geographic;

    // Header band: title then subtitle
    const int title_px = pt_to_px(config_.title_pt);
    const int subtitle_px = pt_to_px(config_.subtitle_pt);
    const int caption_px = pt_to_px(config_.caption_pt);
    layout.title_baseline = layout.margin + title_px;
    layout.subtitle_baseline = layout.title_baseline + static_cast<int>(subtitle_px * 1.5);
    const int header_bottom = layout.subtitle_baseline + subtitle_px;

    // Footer band: caption
    layout.caption_baseline = config_.height_px - layout.margin;
    const int footer_top = layout.caption_baseline - static_cast<int>(caption_px * 1.8);

    // Legend column on the right
    layout.legend_width = static_cast<int>(std::lround(config_.legend_width_in * config_.dpi));
    layout.legend_x = config_.width_px - layout.margin - layout.legend_width;
    layout.legend_y = header_bottom;
    layout.legend_height = footer_top - header_bottom;

    // Map panel: fit the scaled data extent into what is left
    const int avail_x = layout.margin;
    const int avail_y = header_bottom;
    const int avail_w = layout.legend_x - layout.margin - avail_x;
    const int avail_h = footer_top - header_bottom;
    if (avail_w <= 0 || avail_h <= 0) {
        throw std::invalid_argument("Canvas too small for the page layout");
    }

    if (geographic) {
        double mid_lat = (bounds.min_y + bounds.max_y) / 2.0;
        layout.x_scale = std::cos(mid_lat * std::numbers::pi / 180.0);
    }

    const double data_w = bounds.width() * layout.x_scale;
    const double data_h = bounds.height();
    layout.px_per_unit = std::min(avail_w / data_w, avail_h / data_h);

    layout.panel_width = static_cast<int>(std::lround(data_w * layout.px_per_unit));
    layout.panel_height = static_cast<int>(std::lround(data_h * layout.px_per_unit));
    layout.panel_x = avail_x + (avail_w - layout.panel_width) / 2;
    layout.panel_y = avail_y + (avail_h - layout.panel_height) / 2;

    Logger logger("RasterBuilder");
    std::ostringstream msg;
    msg << "Layout: canvas " << layout.canvas_width << "x" << layout.canvas_height
        << ", panel " << layout.panel_width << "x" << layout.panel_height
        << " at (" << layout.panel_x << ", " << layout.panel_y << ")";
    logger.detailed(msg.str());

    return layout;
}

size_t RasterBuilder::paint_table(RgbaCanvas& canvas, const MapLayout& layout, const PixelTable& table,
                                  double cell_width, double cell_height,
                                  const std::function<Color(float)>& color_for) const {
    const double half_w = cell_width / 2.0;
    const double half_h = cell_height / 2.0;

    size_t painted = 0;
    for (const auto& record : table) {
        auto [left, top] = layout.to_pixel(record.x - half_w, record.y + half_h);
        auto [right, bottom] = layout.to_pixel(record.x + half_w, record.y - half_h);

        // Pixel centers inside the footprint; at least one pixel per cell
        int x0 = static_cast<int>(std::lround(left));
        int x1 = std::max(x0 + 1, static_cast<int>(std::lround(right)));
        int y0 = static_cast<int>(std::lround(top));
        int y1 = std::max(y0 + 1, static_cast<int>(std::lround(bottom)));

        canvas.fill_rect(x0, y0, x1 - x0, y1 - y0, color_for(record.value));
        painted++;
    }
    return painted;
}

size_t RasterBuilder::add_boundary_outline(RgbaCanvas& canvas, const MapLayout& layout,
                                           const BoundaryPolygon& boundary,
                                           RasterAnnotator& annotator) const {
    const double width_px = std::max(1.0, config_.outline_width_pt * config_.dpi / 72.0);

    size_t segments = 0;
    for (const auto& part : boundary.parts) {
        for (const auto& ring : part.rings) {
            if (ring.size() < 2) continue;

            std::vector<std::pair<double, double>> pixels;
            pixels.reserve(ring.size());
            for (const auto& pt : ring) {
                pixels.push_back(layout.to_pixel(pt.x(), pt.y()));
            }
            annotator.draw_ring(canvas, pixels, config_.outline_color, width_px);
            segments += pixels.size();
        }
    }

    Logger logger("RasterBuilder");
    logger.debug("Drew boundary outline: " + std::to_string(boundary.parts.size()) + " parts, " +
                 std::to_string(segments) + " segments");
    return segments;
}

double RasterBuilder::nice_scale_length(double target_m) {
    if (!(target_m > 0.0)) {
        throw std::invalid_argument("Scale bar target length must be positive");
    }
    double magnitude = std::pow(10.0, std::floor(std::log10(target_m)));
    for (double step : {5.0, 2.0, 1.0}) {
        if (step * magnitude <= target_m) {
            return step * magnitude;
        }
    }
    return magnitude;
}

std::string RasterBuilder::format_distance(double meters) {
    std::ostringstream ss;
    if (meters >= 1000.0) {
        double km = meters / 1000.0;
        if (std::abs(km - std::round(km)) < 1e-9) {
            ss << static_cast<long long>(std::llround(km)) << " km";
        } else {
            ss << km << " km";
        }
    } else {
        ss << static_cast<long long>(std::llround(meters)) << " m";
    }
    return ss.str();
}

} // namespace poprelief
