/**
 * @file RasterAnnotator.cpp
 * @brief Implementation of canvas annotation drawing
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterAnnotator.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>

namespace poprelief {

RasterAnnotator::RasterAnnotator(const AnnotationConfig& config)
    : config_(config)
    , ft_library_(nullptr)
    , ft_face_(nullptr)
    , ft_initialized_(false)
    , font_lookup_done_(false)
    , loaded_font_path_("") {
}

RasterAnnotator::~RasterAnnotator() {
    cleanup_freetype();
}

int RasterAnnotator::pt_to_px(double points) const {
    return std::max(1, static_cast<int>(std::lround(points * config_.dpi / 72.0)));
}

// ============================================================================
// Lines and shapes
// ============================================================================

void RasterAnnotator::draw_line(RgbaCanvas& canvas, int x1, int y1, int x2, int y2,
                                const Color& color, double width) {
    // Bresenham's line algorithm
    int dx = std::abs(x2 - x1);
    int dy = std::abs(y2 - y1);
    int sx = (x1 < x2) ? 1 : -1;
    int sy = (y1 < y2) ? 1 : -1;
    int err = dx - dy;

    int x = x1;
    int y = y1;

    // Square brush; width 2 covers [-1, 0], width 3 covers [-1, 1]
    int brush = std::max(1, static_cast<int>(std::lround(width)));
    int lo = -(brush / 2);
    int hi = lo + brush - 1;

    while (true) {
        for (int oy = lo; oy <= hi; ++oy) {
            for (int ox = lo; ox <= hi; ++ox) {
                canvas.set_pixel(x + ox, y + oy, color);
            }
        }

        if (x == x2 && y == y2) break;

        int e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            x += sx;
        }
        if (e2 < dx) {
            err += dx;
            y += sy;
        }
    }
}

void RasterAnnotator::draw_ring(RgbaCanvas& canvas, const std::vector<std::pair<double, double>>& points,
                                const Color& color, double width) {
    if (points.size() < 2) return;

    for (size_t i = 0; i < points.size(); ++i) {
        const auto& [x1, y1] = points[i];
        const auto& [x2, y2] = points[(i + 1) % points.size()];
        draw_line(canvas,
                  static_cast<int>(std::lround(x1)), static_cast<int>(std::lround(y1)),
                  static_cast<int>(std::lround(x2)), static_cast<int>(std::lround(y2)),
                  color, width);
    }
}

void RasterAnnotator::draw_rectangle(RgbaCanvas& canvas, int x, int y, int width, int height,
                                     const Color& color, double stroke_width) {
    draw_line(canvas, x, y, x + width, y, color, stroke_width);
    draw_line(canvas, x, y + height, x + width, y + height, color, stroke_width);
    draw_line(canvas, x, y, x, y + height, color, stroke_width);
    draw_line(canvas, x + width, y, x + width, y + height, color, stroke_width);
}

void RasterAnnotator::fill_polygon(RgbaCanvas& canvas, const std::vector<std::pair<double, double>>& points,
                                   const Color& color) {
    if (points.size() < 3) return;

    double min_y = points.front().second;
    double max_y = min_y;
    for (const auto& p : points) {
        min_y = std::min(min_y, p.second);
        max_y = std::max(max_y, p.second);
    }

    int row0 = std::max(0, static_cast<int>(std::floor(min_y)));
    int row1 = std::min(canvas.height() - 1, static_cast<int>(std::ceil(max_y)));

    std::vector<double> crossings;
    for (int row = row0; row <= row1; ++row) {
        double yc = row + 0.5;
        crossings.clear();
        for (size_t i = 0, j = points.size() - 1; i < points.size(); j = i++) {
            double yi = points[i].second, yj = points[j].second;
            if ((yi > yc) != (yj > yc)) {
                double xi = points[i].first, xj = points[j].first;
                crossings.push_back(xj + (yc - yj) * (xi - xj) / (yi - yj));
            }
        }
        std::sort(crossings.begin(), crossings.end());
        for (size_t k = 0; k + 1 < crossings.size(); k += 2) {
            int c0 = static_cast<int>(std::ceil(crossings[k] - 0.5));
            int c1 = static_cast<int>(std::ceil(crossings[k + 1] - 0.5));
            for (int col = c0; col < c1; ++col) {
                canvas.set_pixel(col, row, color);
            }
        }
    }
}

// ============================================================================
// Map furniture
// ============================================================================

void RasterAnnotator::draw_north_arrow(RgbaCanvas& canvas, int x, int y, int size) {
    const double cx = x + size / 2.0;
    const double label_h = size * 0.3;
    const double top = y + label_h;
    const double bottom = y + size;
    const double half_w = size * 0.22;
    const double notch = bottom - size * 0.18;
    const double stroke = std::max(1.0, size / 40.0);

    // Left half filled, right half outlined
    std::vector<std::pair<double, double>> left = {{cx, top}, {cx - half_w, bottom}, {cx, notch}};
    std::vector<std::pair<double, double>> right = {{cx, top}, {cx + half_w, bottom}, {cx, notch}};

    fill_polygon(canvas, right, config_.fill_light);
    fill_polygon(canvas, left, config_.stroke_color);
    draw_ring(canvas, left, config_.stroke_color, stroke);
    draw_ring(canvas, right, config_.stroke_color, stroke);

    int font_px = static_cast<int>(label_h * 0.9);
    if (!draw_text(canvas, "N", static_cast<int>(cx), static_cast<int>(y + label_h * 0.85),
                   font_px, config_.text_color, "middle")) {
        logger_.debug("North arrow drawn without label");
    }
}

void RasterAnnotator::draw_scale_bar(RgbaCanvas& canvas, int right, int bottom, int bar_length_px,
                                     int bar_height_px, int segments, const std::string& label,
                                     int font_size_px) {
    segments = std::max(1, segments);
    const int left = right - bar_length_px;
    const int top = bottom - bar_height_px;
    const double stroke = std::max(1.0, bar_height_px / 8.0);

    for (int s = 0; s < segments; ++s) {
        int x0 = left + bar_length_px * s / segments;
        int x1 = left + bar_length_px * (s + 1) / segments;
        const Color& fill = (s % 2 == 0) ? config_.stroke_color : config_.fill_light;
        canvas.fill_rect(x0, top, x1 - x0, bar_height_px, fill);
    }
    draw_rectangle(canvas, left, top, bar_length_px, bar_height_px, config_.stroke_color, stroke);

    if (!label.empty()) {
        int baseline = top - std::max(2, bar_height_px / 2);
        if (!draw_text(canvas, label, left + bar_length_px / 2, baseline, font_size_px,
                       config_.text_color, "middle")) {
            logger_.debug("Scale bar drawn without label");
        }
    }
}

// ============================================================================
// FreeType
// ============================================================================

bool RasterAnnotator::initialize_freetype() {
    if (ft_initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ft_library_);
    if (error) {
        logger_.error("Failed to initialize FreeType library (error " + std::to_string(error) + ")");
        return false;
    }

    ft_initialized_ = true;
    return true;
}

bool RasterAnnotator::load_font(const std::string& font_path) {
    if (!ft_initialized_ && !initialize_freetype()) {
        return false;
    }

    if (ft_face_ != nullptr && loaded_font_path_ == font_path) {
        return true;
    }

    if (ft_face_ != nullptr) {
        FT_Done_Face(ft_face_);
        ft_face_ = nullptr;
    }

    FT_Error error = FT_New_Face(ft_library_, font_path.c_str(), 0, &ft_face_);
    if (error) {
        logger_.warning("Failed to load font from " + font_path + " (error " + std::to_string(error) + ")");
        ft_face_ = nullptr;
        return false;
    }

    loaded_font_path_ = font_path;
    logger_.debug("Loaded font " + font_path);
    return true;
}

void RasterAnnotator::cleanup_freetype() {
    if (ft_face_ != nullptr) {
        FT_Done_Face(ft_face_);
        ft_face_ = nullptr;
    }

    if (ft_initialized_) {
        FT_Done_FreeType(ft_library_);
        ft_library_ = nullptr;
        ft_initialized_ = false;
    }

    loaded_font_path_.clear();
}

std::string RasterAnnotator::resolve_font_path(const std::string& preferred_path) const {
    if (!preferred_path.empty()) {
        if (std::filesystem::exists(preferred_path)) {
            return preferred_path;
        }
        logger_.warning("Specified font not found: " + preferred_path);
    }

    const std::vector<std::string> font_search_paths = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
        "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
        "/usr/share/fonts/noto/NotoSans-Regular.ttf",
    };

    for (const auto& path : font_search_paths) {
        if (std::filesystem::exists(path)) {
            return path;
        }
    }

    logger_.warning("No system font found; text will be skipped");
    return "";
}

bool RasterAnnotator::ensure_font() {
    if (ft_face_ != nullptr) {
        return true;
    }
    if (font_lookup_done_) {
        return false;
    }
    font_lookup_done_ = true;

    std::string font_path = resolve_font_path(config_.font_path);
    if (font_path.empty()) {
        return false;
    }
    return load_font(font_path);
}

bool RasterAnnotator::font_available() {
    return ensure_font();
}

int RasterAnnotator::measure_text_width(const std::string& text, int font_size_px) {
    if (text.empty()) return 0;
    if (!ensure_font()) return -1;

    if (FT_Set_Pixel_Sizes(ft_face_, 0, static_cast<FT_UInt>(font_size_px))) {
        return -1;
    }

    int total_width = 0;
    for (unsigned char c : text) {
        if (FT_Load_Char(ft_face_, c, FT_LOAD_DEFAULT)) continue;
        total_width += static_cast<int>(ft_face_->glyph->advance.x >> 6);  // 26.6 fixed-point
    }
    return total_width;
}

bool RasterAnnotator::draw_text(RgbaCanvas& canvas, const std::string& text, int x, int y,
                                int font_size_px, const Color& color, const std::string& anchor) {
    if (text.empty()) return true;

    int total_width = measure_text_width(text, font_size_px);
    if (total_width < 0) {
        return false;
    }

    int pen_x = x;
    if (anchor == "middle") {
        pen_x = x - total_width / 2;
    } else if (anchor == "end") {
        pen_x = x - total_width;
    }

    for (unsigned char c : text) {
        FT_Error error = FT_Load_Char(ft_face_, c, FT_LOAD_RENDER);
        if (error) {
            logger_.debug("Failed to load glyph for '" + std::string(1, static_cast<char>(c)) + "'");
            continue;
        }

        FT_GlyphSlot glyph = ft_face_->glyph;
        const FT_Bitmap& bitmap = glyph->bitmap;

        int glyph_x = pen_x + glyph->bitmap_left;
        int glyph_y = y - glyph->bitmap_top;  // Baseline coordinates

        for (unsigned int row = 0; row < bitmap.rows; ++row) {
            for (unsigned int col = 0; col < bitmap.width; ++col) {
                uint8_t alpha = bitmap.buffer[row * static_cast<unsigned int>(bitmap.pitch) + col];
                if (alpha > 0) {
                    canvas.blend_pixel(glyph_x + static_cast<int>(col), glyph_y + static_cast<int>(row),
                                       color, alpha);
                }
            }
        }

        pen_x += static_cast<int>(glyph->advance.x >> 6);
    }

    return true;
}

} // namespace poprelief
