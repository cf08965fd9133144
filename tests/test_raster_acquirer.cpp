/**
 * @file test_raster_acquirer.cpp
 * @brief Raster reading, cropping and polygon clipping
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <doctest/doctest.h>

#include "core/GDALHandles.hpp"
#include "core/GeoUtils.hpp"
#include "core/HttpClient.hpp"
#include "core/RasterAcquirer.hpp"
#include "core/ScratchDirectory.hpp"

#include <gdal_priv.h>
#include <cmath>
#include <filesystem>
#include <stdexcept>

using namespace poprelief;

namespace {

// 4x4 grid of 10 m cells, top-left corner at (0, 40), value = row * 10 + col
RasterGrid numbered_grid() {
    std::vector<float> values;
    for (int row = 0; row < 4; ++row) {
        for (int col = 0; col < 4; ++col) {
            values.push_back(static_cast<float>(row * 10 + col));
        }
    }
    return RasterGrid(4, 4, GeoTransform{0.0, 10.0, 0.0, 40.0, 0.0, -10.0}, CrsTag{}, values);
}

Ring square(double x0, double y0, double x1, double y1) {
    return {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}, {x0, y0}};
}

bool write_geotiff(const std::string& path, int width, int height, const GeoTransform& gt,
                   const std::vector<float>& values, double nodata) {
    ensure_gdal_registered();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!driver) return false;

    GDALDatasetPtr dataset(driver->Create(path.c_str(), width, height, 1, GDT_Float32, nullptr));
    if (!dataset) return false;

    GeoTransform copy = gt;
    dataset->SetGeoTransform(copy.data());
    dataset->SetProjection(wgs84_crs().wkt.c_str());
    GDALRasterBand* band = dataset->GetRasterBand(1);
    band->SetNoDataValue(nodata);
    std::vector<float> buffer(values);
    return band->RasterIO(GF_Write, 0, 0, width, height, buffer.data(), width, height,
                          GDT_Float32, 0, 0) == CE_None;
}

} // namespace

TEST_CASE("Cropping keeps whole cells covering the bounds") {
    RasterGrid cropped = RasterAcquirer::crop_to_bounds(numbered_grid(), BoundingBox(10.0, 10.0, 30.0, 30.0));

    CHECK(cropped.width() == 2);
    CHECK(cropped.height() == 2);
    CHECK(cropped.geotransform()[0] == doctest::Approx(10.0));
    CHECK(cropped.geotransform()[3] == doctest::Approx(30.0));
    CHECK(cropped.at(0, 0) == 11.0f);
    CHECK(cropped.at(1, 1) == 22.0f);
}

TEST_CASE("Cropping to disjoint bounds is rejected") {
    CHECK_THROWS_AS(RasterAcquirer::crop_to_bounds(numbered_grid(), BoundingBox(100.0, 100.0, 200.0, 200.0)),
                    std::invalid_argument);
}

TEST_CASE("Clipping to a polygon with a hole") {
    BoundaryPolygon boundary;
    PolygonPart part;
    part.rings.push_back(square(10.0, 10.0, 30.0, 30.0));
    part.rings.push_back(square(12.0, 12.0, 18.0, 18.0));
    boundary.parts.push_back(part);

    RasterGrid clipped = RasterAcquirer::mask_to_boundary(numbered_grid(), boundary);
    CHECK(clipped.same_geometry(numbered_grid()));
    CHECK(clipped.valid_count() == 3);

    // Centers (15, 25), (25, 25), (25, 15) are inside; (15, 15) sits in the hole
    CHECK(clipped.at(1, 1) == 11.0f);
    CHECK(clipped.at(2, 1) == 12.0f);
    CHECK(clipped.at(2, 2) == 22.0f);
    CHECK(RasterGrid::is_nodata(clipped.at(1, 2)));
    CHECK(RasterGrid::is_nodata(clipped.at(0, 0)));

    // Every surviving cell agrees with point-in-polygon
    for (size_t row = 0; row < clipped.height(); ++row) {
        for (size_t col = 0; col < clipped.width(); ++col) {
            bool inside = boundary.contains(clipped.cell_center_x(col), clipped.cell_center_y(row));
            CHECK(inside == !RasterGrid::is_nodata(clipped.at(col, row)));
        }
    }
}

TEST_CASE("Raster files load with no-data as NaN") {
    ScratchDirectory scratch;
    std::string path = scratch.file("population.tif").string();

    GeoTransform gt{8.0, 0.01, 0.0, 47.0, 0.0, -0.01};
    REQUIRE(write_geotiff(path, 2, 2, gt, {5.0f, -99999.0f, 0.5f, 12.0f}, -99999.0));

    HttpClient http;
    RasterAcquirer acquirer(RasterAcquirer::Config{}, http);
    auto grid = acquirer.load_raster_file(path);
    REQUIRE(grid.has_value());

    CHECK(grid->width() == 2);
    CHECK(grid->height() == 2);
    CHECK(grid->crs().geographic);
    CHECK(grid->geotransform()[1] == doctest::Approx(0.01));
    CHECK(grid->at(0, 0) == 5.0f);
    CHECK(RasterGrid::is_nodata(grid->at(1, 0)));
    CHECK(grid->valid_count() == 3);
}

TEST_CASE("Missing raster files are reported, not thrown") {
    HttpClient http;
    RasterAcquirer acquirer(RasterAcquirer::Config{}, http);
    CHECK_FALSE(acquirer.load_raster_file("/nonexistent/poprelief/raster.tif").has_value());
}

TEST_CASE("Local elevation outside the boundary is rejected") {
    ScratchDirectory scratch;
    std::string path = scratch.file("elevation.tif").string();
    GeoTransform gt{8.0, 0.01, 0.0, 47.0, 0.0, -0.01};
    REQUIRE(write_geotiff(path, 3, 3, gt, std::vector<float>(9, 500.0f), -32768.0));

    HttpClient http;
    RasterAcquirer acquirer(RasterAcquirer::Config{}, http);

    BoundaryPolygon far_away;
    far_away.crs = acquirer.load_raster_file(path)->crs();
    PolygonPart part;
    part.rings.push_back(square(20.0, 10.0, 21.0, 11.0));
    far_away.parts.push_back(part);

    CHECK_FALSE(acquirer.load_elevation_file(path, far_away).has_value());
}

TEST_CASE("Elevation tiles cover the boundary") {
    BoundaryPolygon boundary;
    boundary.crs = wgs84_crs();
    PolygonPart part;
    part.rings.push_back(square(5.9559, 45.818, 10.4921, 47.8084));
    boundary.parts.push_back(part);

    HttpClient http;
    RasterAcquirer acquirer(RasterAcquirer::Config{}, http);
    auto range = acquirer.tiles_for_boundary(boundary);
    REQUIRE(range.has_value());
    CHECK(range->zoom == 10);
    CHECK(range->min_x == 528);
    CHECK(range->max_y == 365);
}

TEST_CASE("South-up elevation files are warped north-up") {
    ScratchDirectory scratch;
    std::string path = scratch.file("south_up.tif").string();

    // Origin on the southern edge, rows run north, elevation rises northwards
    std::vector<float> values;
    for (int row = 0; row < 6; ++row) {
        for (int col = 0; col < 6; ++col) {
            values.push_back(100.0f + 10.0f * static_cast<float>(row));
        }
    }
    GeoTransform gt{8.0, 0.01, 0.0, 46.94, 0.0, 0.01};
    REQUIRE(write_geotiff(path, 6, 6, gt, values, -32768.0));

    BoundaryPolygon boundary;
    boundary.crs = wgs84_crs();
    PolygonPart part;
    part.rings.push_back(square(8.0, 46.94, 8.06, 47.0));
    boundary.parts.push_back(part);

    HttpClient http;
    RasterAcquirer acquirer(RasterAcquirer::Config{}, http);
    auto grid = acquirer.load_elevation_file(path, boundary);
    REQUIRE(grid.has_value());
    CHECK(grid->geotransform()[5] < 0.0);

    size_t col = grid->width() / 2;
    std::vector<float> column;
    for (size_t row = 0; row < grid->height(); ++row) {
        float v = grid->at(col, row);
        if (!RasterGrid::is_nodata(v)) {
            column.push_back(v);
        }
    }
    REQUIRE(column.size() >= 2);
    CHECK(column.front() > column.back());
}

TEST_CASE("Population downloads never reuse a file left in the scratch directory") {
    ScratchDirectory scratch;
    std::filesystem::path seeded = scratch.file("che_ppp_2020_constrained.tif");
    GeoTransform gt{8.0, 0.01, 0.0, 47.0, 0.0, -0.01};
    REQUIRE(write_geotiff(seeded.string(), 2, 2, gt, {1.0f, 2.0f, 3.0f, 4.0f}, -99999.0));

    RasterAcquirer::Config config;
    config.population_url = "file:///nonexistent/poprelief/che_ppp_2020_constrained.tif";
    HttpClient http;
    RasterAcquirer acquirer(config, http);

    // The fetch is attempted and fails instead of reading the stale copy
    CHECK_FALSE(acquirer.fetch_population(scratch.path()).has_value());
    CHECK_FALSE(std::filesystem::exists(seeded));
}
