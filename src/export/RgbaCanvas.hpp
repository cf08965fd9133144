/**
 * @file RgbaCanvas.hpp
 * @brief In-memory 8-bit RGBA image the renderer paints into
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace poprelief {

using Color = std::array<uint8_t, 4>;

/**
 * @brief Pixel-interleaved RGBA buffer, origin top-left
 */
class RgbaCanvas {
public:
    RgbaCanvas(int width, int height, const Color& background = {255, 255, 255, 255})
        : width_(width), height_(height),
          pixels_(static_cast<size_t>(width) * static_cast<size_t>(height) * 4) {
        fill(background);
    }

    int width() const { return width_; }
    int height() const { return height_; }
    const std::vector<uint8_t>& pixels() const { return pixels_; }

    bool contains(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    void fill(const Color& color) {
        for (size_t i = 0; i < pixels_.size(); i += 4) {
            pixels_[i] = color[0];
            pixels_[i + 1] = color[1];
            pixels_[i + 2] = color[2];
            pixels_[i + 3] = color[3];
        }
    }

    Color get_pixel(int x, int y) const {
        if (!contains(x, y)) return {0, 0, 0, 0};
        size_t i = index(x, y);
        return {pixels_[i], pixels_[i + 1], pixels_[i + 2], pixels_[i + 3]};
    }

    // Out-of-canvas writes are ignored
    void set_pixel(int x, int y, const Color& color) {
        if (!contains(x, y)) return;
        size_t i = index(x, y);
        pixels_[i] = color[0];
        pixels_[i + 1] = color[1];
        pixels_[i + 2] = color[2];
        pixels_[i + 3] = color[3];
    }

    // result = fg * alpha + bg * (1 - alpha)
    void blend_pixel(int x, int y, const Color& color, uint8_t alpha) {
        if (!contains(x, y)) return;
        size_t i = index(x, y);
        float a = (alpha / 255.0f) * (color[3] / 255.0f);
        for (int c = 0; c < 3; ++c) {
            pixels_[i + c] = static_cast<uint8_t>(color[c] * a + pixels_[i + c] * (1.0f - a) + 0.5f);
        }
        pixels_[i + 3] = 255;
    }

    void fill_rect(int x, int y, int w, int h, const Color& color) {
        for (int yy = y; yy < y + h; ++yy) {
            for (int xx = x; xx < x + w; ++xx) {
                set_pixel(xx, yy, color);
            }
        }
    }

    /**
     * @brief One band of the image as a contiguous plane
     */
    std::vector<uint8_t> band(int b) const {
        std::vector<uint8_t> plane(static_cast<size_t>(width_) * static_cast<size_t>(height_));
        for (size_t p = 0; p < plane.size(); ++p) {
            plane[p] = pixels_[p * 4 + static_cast<size_t>(b)];
        }
        return plane;
    }

private:
    size_t index(int x, int y) const {
        return (static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x)) * 4;
    }

    int width_;
    int height_;
    std::vector<uint8_t> pixels_;
};

} // namespace poprelief
