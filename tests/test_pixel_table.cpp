/**
 * @file test_pixel_table.cpp
 * @brief Grid to record conversion
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <doctest/doctest.h>

#include "export/PixelTable.hpp"

using namespace poprelief;

TEST_CASE("Pixel table is row-major over valid cells") {
    const float nan = RasterGrid::nodata();
    RasterGrid grid(3, 2, GeoTransform{100.0, 10.0, 0.0, 50.0, 0.0, -10.0}, CrsTag{},
                    {1.0f, nan, 3.0f,
                     nan, 5.0f, 6.0f});

    PixelTable table = to_pixel_table(grid);
    REQUIRE(table.size() == 4);

    CHECK(table[0].x == doctest::Approx(105.0));
    CHECK(table[0].y == doctest::Approx(45.0));
    CHECK(table[0].value == 1.0f);

    CHECK(table[1].x == doctest::Approx(125.0));
    CHECK(table[1].value == 3.0f);

    CHECK(table[2].x == doctest::Approx(115.0));
    CHECK(table[2].y == doctest::Approx(35.0));
    CHECK(table[2].value == 5.0f);

    CHECK(table[3].value == 6.0f);
}

TEST_CASE("Pixel table value range") {
    PixelTable table = {{0.0, 0.0, 4.0f}, {1.0, 0.0, -1.0f}, {2.0, 0.0, 9.5f}};
    auto [lo, hi] = table_value_range(table);
    CHECK(lo == -1.0f);
    CHECK(hi == 9.5f);

    auto [elo, ehi] = table_value_range(PixelTable{});
    CHECK(RasterGrid::is_nodata(elo));
    CHECK(RasterGrid::is_nodata(ehi));
}

TEST_CASE("An all no-data grid gives an empty table") {
    RasterGrid grid(2, 2, GeoTransform{0.0, 1.0, 0.0, 0.0, 0.0, -1.0}, CrsTag{});
    CHECK(to_pixel_table(grid).empty());
}
