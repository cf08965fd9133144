/**
 * @file RasterGrid.cpp
 * @brief Raster grid and boundary polygon implementation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "population_relief.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace poprelief {

// ============================================================================
// RasterGrid
// ============================================================================

RasterGrid::RasterGrid(size_t width, size_t height, const GeoTransform& geotransform, CrsTag crs)
    : width_(width), height_(height), geotransform_(geotransform), crs_(std::move(crs)),
      values_(width * height, nodata()) {
}

RasterGrid::RasterGrid(size_t width, size_t height, const GeoTransform& geotransform, CrsTag crs,
                       std::vector<float> values)
    : width_(width), height_(height), geotransform_(geotransform), crs_(std::move(crs)),
      values_(std::move(values)) {
    if (values_.size() != width_ * height_) {
        throw std::invalid_argument("RasterGrid: expected " + std::to_string(width_ * height_) +
                                    " values, got " + std::to_string(values_.size()));
    }
}

float RasterGrid::at(size_t col, size_t row) const {
    if (col >= width_ || row >= height_) {
        throw std::out_of_range("RasterGrid: cell (" + std::to_string(col) + ", " +
                                std::to_string(row) + ") outside " + std::to_string(width_) +
                                "x" + std::to_string(height_));
    }
    return values_[row * width_ + col];
}

float RasterGrid::value_or_nodata(long col, long row) const {
    if (col < 0 || row < 0 || col >= static_cast<long>(width_) || row >= static_cast<long>(height_)) {
        return nodata();
    }
    return values_[static_cast<size_t>(row) * width_ + static_cast<size_t>(col)];
}

double RasterGrid::cell_center_x(size_t col) const {
    return geotransform_[0] + (static_cast<double>(col) + 0.5) * geotransform_[1];
}

double RasterGrid::cell_center_y(size_t row) const {
    return geotransform_[3] + (static_cast<double>(row) + 0.5) * geotransform_[5];
}

std::pair<double, double> RasterGrid::world_to_pixel(double x, double y) const {
    // North-up grids only; rotation terms are ignored
    return {(x - geotransform_[0]) / geotransform_[1],
            (y - geotransform_[3]) / geotransform_[5]};
}

BoundingBox RasterGrid::extent() const {
    double x0 = geotransform_[0];
    double x1 = geotransform_[0] + static_cast<double>(width_) * geotransform_[1];
    double y0 = geotransform_[3];
    double y1 = geotransform_[3] + static_cast<double>(height_) * geotransform_[5];
    return BoundingBox(std::min(x0, x1), std::min(y0, y1), std::max(x0, x1), std::max(y0, y1));
}

bool RasterGrid::same_geometry(const RasterGrid& other, double tolerance) const {
    if (width_ != other.width_ || height_ != other.height_) {
        return false;
    }
    if (crs_ != other.crs_) {
        return false;
    }
    for (size_t i = 0; i < geotransform_.size(); ++i) {
        if (std::abs(geotransform_[i] - other.geotransform_[i]) > tolerance) {
            return false;
        }
    }
    return true;
}

RasterGrid RasterGrid::with_values(std::vector<float> values) const {
    return RasterGrid(width_, height_, geotransform_, crs_, std::move(values));
}

size_t RasterGrid::valid_count() const {
    return static_cast<size_t>(std::count_if(values_.begin(), values_.end(),
                                             [](float v) { return !is_nodata(v); }));
}

std::pair<float, float> RasterGrid::value_range() const {
    float min_value = nodata();
    float max_value = nodata();
    for (float v : values_) {
        if (is_nodata(v)) continue;
        if (is_nodata(min_value) || v < min_value) min_value = v;
        if (is_nodata(max_value) || v > max_value) max_value = v;
    }
    return {min_value, max_value};
}

// ============================================================================
// BoundaryPolygon
// ============================================================================

namespace {

// Even-odd crossing test against one ring
bool ring_contains(const Ring& ring, double x, double y) {
    bool inside = false;
    size_t n = ring.size();
    if (n < 3) return false;

    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        double xi = ring[i].x(), yi = ring[i].y();
        double xj = ring[j].x(), yj = ring[j].y();
        if ((yi > y) != (yj > y)) {
            double x_cross = xj + (y - yj) * (xi - xj) / (yi - yj);
            if (x < x_cross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

} // namespace

size_t BoundaryPolygon::vertex_count() const {
    size_t count = 0;
    for (const auto& part : parts) {
        for (const auto& ring : part.rings) {
            count += ring.size();
        }
    }
    return count;
}

BoundingBox BoundaryPolygon::bounds() const {
    bool first = true;
    BoundingBox box;
    for (const auto& part : parts) {
        if (part.rings.empty()) continue;
        for (const auto& pt : part.exterior()) {
            if (first) {
                box = BoundingBox(pt.x(), pt.y(), pt.x(), pt.y());
                first = false;
            } else {
                box.min_x = std::min(box.min_x, pt.x());
                box.min_y = std::min(box.min_y, pt.y());
                box.max_x = std::max(box.max_x, pt.x());
                box.max_y = std::max(box.max_y, pt.y());
            }
        }
    }
    return box;
}

bool BoundaryPolygon::contains(double x, double y) const {
    for (const auto& part : parts) {
        if (part.rings.empty()) continue;
        if (!ring_contains(part.exterior(), x, y)) continue;

        bool in_hole = false;
        for (size_t r = 1; r < part.rings.size(); ++r) {
            if (ring_contains(part.rings[r], x, y)) {
                in_hole = true;
                break;
            }
        }
        if (!in_hole) return true;
    }
    return false;
}

} // namespace poprelief
