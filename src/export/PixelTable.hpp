/**
 * @file PixelTable.hpp
 * @brief Grid to (x, y, value) records for painting
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "population_relief.hpp"

namespace poprelief {

/**
 * @brief One record per valid cell, row-major, cell-center coordinates
 *
 * No-data cells are dropped here and nowhere earlier.
 */
PixelTable to_pixel_table(const RasterGrid& grid);

/**
 * @brief Min/max of record values ({NaN, NaN} for an empty table)
 */
std::pair<float, float> table_value_range(const PixelTable& table);

} // namespace poprelief
