/**
 * @file test_raster_grid.cpp
 * @brief RasterGrid and BoundaryPolygon basics
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <doctest/doctest.h>

#include "population_relief.hpp"

#include <stdexcept>

using namespace poprelief;

namespace {

RasterGrid make_grid(size_t w, size_t h, std::vector<float> values) {
    return RasterGrid(w, h, GeoTransform{100.0, 10.0, 0.0, 200.0, 0.0, -10.0}, CrsTag{}, std::move(values));
}

} // namespace

TEST_CASE("RasterGrid rejects a value count that does not match its shape") {
    CHECK_THROWS_AS(make_grid(2, 2, {1.0f, 2.0f, 3.0f}), std::invalid_argument);
}

TEST_CASE("RasterGrid default construction fills with no-data") {
    RasterGrid grid(3, 2, GeoTransform{0.0, 1.0, 0.0, 0.0, 0.0, -1.0}, CrsTag{});
    CHECK(grid.size() == 6);
    CHECK(grid.valid_count() == 0);
    CHECK(RasterGrid::is_nodata(grid.at(2, 1)));
}

TEST_CASE("RasterGrid cell access") {
    RasterGrid grid = make_grid(2, 2, {1.0f, 2.0f, 3.0f, 4.0f});

    CHECK(grid.at(1, 0) == 2.0f);
    CHECK(grid.at(0, 1) == 3.0f);
    CHECK_THROWS_AS(grid.at(2, 0), std::out_of_range);
    CHECK_THROWS_AS(grid.at(0, 2), std::out_of_range);
    CHECK(RasterGrid::is_nodata(grid.value_or_nodata(-1, 0)));
    CHECK(RasterGrid::is_nodata(grid.value_or_nodata(0, 5)));
    CHECK(grid.value_or_nodata(1, 1) == 4.0f);
}

TEST_CASE("RasterGrid georeferencing") {
    RasterGrid grid = make_grid(2, 3, std::vector<float>(6, 0.0f));

    CHECK(grid.cell_center_x(0) == doctest::Approx(105.0));
    CHECK(grid.cell_center_y(0) == doctest::Approx(195.0));
    CHECK(grid.cell_center_y(2) == doctest::Approx(175.0));

    auto [px, py] = grid.world_to_pixel(115.0, 185.0);
    CHECK(px == doctest::Approx(1.5));
    CHECK(py == doctest::Approx(1.5));

    BoundingBox box = grid.extent();
    CHECK(box.min_x == doctest::Approx(100.0));
    CHECK(box.max_x == doctest::Approx(120.0));
    CHECK(box.min_y == doctest::Approx(170.0));
    CHECK(box.max_y == doctest::Approx(200.0));
}

TEST_CASE("RasterGrid value range ignores no-data") {
    const float nan = RasterGrid::nodata();
    RasterGrid grid = make_grid(2, 2, {nan, 5.0f, -2.0f, nan});

    auto [lo, hi] = grid.value_range();
    CHECK(lo == -2.0f);
    CHECK(hi == 5.0f);
    CHECK(grid.valid_count() == 2);

    RasterGrid empty = make_grid(1, 1, {nan});
    auto [elo, ehi] = empty.value_range();
    CHECK(RasterGrid::is_nodata(elo));
    CHECK(RasterGrid::is_nodata(ehi));
}

TEST_CASE("RasterGrid geometry comparison") {
    RasterGrid a = make_grid(2, 2, std::vector<float>(4, 1.0f));
    RasterGrid b = a.with_values({9.0f, 9.0f, 9.0f, 9.0f});
    CHECK(a.same_geometry(b));
    CHECK(b.at(0, 0) == 9.0f);

    RasterGrid shifted(2, 2, GeoTransform{101.0, 10.0, 0.0, 200.0, 0.0, -10.0}, CrsTag{},
                       std::vector<float>(4, 1.0f));
    CHECK_FALSE(a.same_geometry(shifted));

    CrsTag geographic;
    geographic.geographic = true;
    RasterGrid other_crs(2, 2, a.geotransform(), geographic, std::vector<float>(4, 1.0f));
    CHECK_FALSE(a.same_geometry(other_crs));
}

TEST_CASE("BoundaryPolygon containment honours holes and multiple parts") {
    BoundaryPolygon boundary;

    PolygonPart square;
    square.rings.push_back({{0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}});
    square.rings.push_back({{4, 4}, {6, 4}, {6, 6}, {4, 6}, {4, 4}});
    boundary.parts.push_back(square);

    PolygonPart island;
    island.rings.push_back({{20, 20}, {22, 20}, {22, 22}, {20, 22}, {20, 20}});
    boundary.parts.push_back(island);

    CHECK(boundary.contains(1.0, 1.0));
    CHECK_FALSE(boundary.contains(5.0, 5.0));
    CHECK(boundary.contains(21.0, 21.0));
    CHECK_FALSE(boundary.contains(15.0, 15.0));

    CHECK(boundary.vertex_count() == 15);

    BoundingBox box = boundary.bounds();
    CHECK(box.min_x == 0.0);
    CHECK(box.max_x == 22.0);
    CHECK(box.max_y == 22.0);
}
