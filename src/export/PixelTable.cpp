/**
 * @file PixelTable.cpp
 * @brief Grid to (x, y, value) records for painting
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "PixelTable.hpp"
#include <algorithm>

namespace poprelief {

PixelTable to_pixel_table(const RasterGrid& grid) {
    PixelTable table;
    table.reserve(grid.valid_count());

    for (size_t row = 0; row < grid.height(); ++row) {
        double y = grid.cell_center_y(row);
        for (size_t col = 0; col < grid.width(); ++col) {
            float v = grid.values()[row * grid.width() + col];
            if (RasterGrid::is_nodata(v)) continue;
            table.push_back({grid.cell_center_x(col), y, v});
        }
    }
    return table;
}

std::pair<float, float> table_value_range(const PixelTable& table) {
    if (table.empty()) {
        return {RasterGrid::nodata(), RasterGrid::nodata()};
    }
    auto [lo, hi] = std::minmax_element(table.begin(), table.end(),
                                        [](const PixelRecord& a, const PixelRecord& b) {
                                            return a.value < b.value;
                                        });
    return {lo->value, hi->value};
}

} // namespace poprelief
