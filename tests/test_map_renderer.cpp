/**
 * @file test_map_renderer.cpp
 * @brief Layer painting, legend scale and PNG output
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <doctest/doctest.h>

#include "core/ScratchDirectory.hpp"
#include "export/MapRenderer.hpp"

#include <filesystem>
#include <stdexcept>

using namespace poprelief;

namespace {

RenderOptions small_options() {
    RenderOptions options;
    options.page.width_px = 480;
    options.page.height_px = 300;
    options.page.dpi = 60.0;
    options.title = "Population density";
    options.subtitle = "Synthetic test";
    options.caption = "Test data";
    options.legend_title = "People per cell";
    options.preview = false;
    return options;
}

// 8x8 grid on 10 m cells; the left half is populated
CompositeMasks split_masks() {
    const float nan = RasterGrid::nodata();
    GeoTransform gt{0.0, 10.0, 0.0, 80.0, 0.0, -10.0};
    std::vector<float> terrain(64, nan);
    std::vector<float> population(64, nan);
    for (size_t row = 0; row < 8; ++row) {
        for (size_t col = 0; col < 8; ++col) {
            size_t i = row * 8 + col;
            if (col < 4) {
                population[i] = static_cast<float>(1 + row * 100 + col * 10);
            } else {
                terrain[i] = static_cast<float>(col) / 8.0f;
            }
        }
    }
    return CompositeMasks{RasterGrid(8, 8, gt, CrsTag{}, terrain),
                          RasterGrid(8, 8, gt, CrsTag{}, population)};
}

BoundaryPolygon frame() {
    BoundaryPolygon boundary;
    PolygonPart part;
    part.rings.push_back({{0, 0}, {80, 0}, {80, 80}, {0, 80}, {0, 0}});
    boundary.parts.push_back(part);
    return boundary;
}

} // namespace

TEST_CASE("Render paints both layers on the configured page") {
    MapRenderer renderer(small_options());
    RgbaCanvas canvas = renderer.render(split_masks(), frame());

    CHECK(canvas.width() == 480);
    CHECK(canvas.height() == 300);

    const RenderStats& stats = renderer.get_stats();
    CHECK(stats.terrain_rows == 32);
    CHECK(stats.population_rows == 32);
    CHECK(stats.outline_segments == 5);
}

TEST_CASE("Rendering is deterministic") {
    MapRenderer renderer(small_options());
    RgbaCanvas first = renderer.render(split_masks(), frame());
    RgbaCanvas second = renderer.render(split_masks(), frame());
    CHECK(first.pixels() == second.pixels());
}

TEST_CASE("Terrain cells are gray and population cells are colored") {
    RenderOptions options = small_options();
    MapRenderer renderer(options);
    CompositeMasks masks = split_masks();
    RgbaCanvas canvas = renderer.render(masks, BoundaryPolygon{});

    RasterBuilder builder(options.page);
    MapLayout layout = builder.compute_layout(masks.terrain.extent(), false);

    // Terrain cell (6, 6), away from the furniture
    auto [tx, ty] = layout.to_pixel(masks.terrain.cell_center_x(6), masks.terrain.cell_center_y(5));
    Color terrain_px = canvas.get_pixel(static_cast<int>(tx), static_cast<int>(ty));
    CHECK(terrain_px == GrayScale().color(6.0 / 8.0));

    // Brightest population cell gets the light end of the palette
    auto [px, py] = layout.to_pixel(masks.population.cell_center_x(3), masks.population.cell_center_y(7));
    Color population_px = canvas.get_pixel(static_cast<int>(px), static_cast<int>(py));
    CHECK(population_px == Palette::magma().at(1.0));
}

TEST_CASE("Population scale floors and empties") {
    MapRenderer renderer(small_options());

    CHECK_FALSE(renderer.population_scale(PixelTable{}).has_value());
    CHECK_FALSE(renderer.population_scale(PixelTable{{0.0, 0.0, 0.0f}, {1.0, 0.0, -4.0f}}).has_value());

    auto scale = renderer.population_scale(PixelTable{{0.0, 0.0, 0.0f}, {1.0, 0.0, 500.0f}});
    REQUIRE(scale.has_value());
    CHECK(scale->min_value() == doctest::Approx(0.5));
    CHECK(scale->max_value() == doctest::Approx(500.0));

    auto positive = renderer.population_scale(PixelTable{{0.0, 0.0, 2.0f}, {1.0, 0.0, 200.0f}});
    REQUIRE(positive.has_value());
    CHECK(positive->min_value() == doctest::Approx(2.0));
}

TEST_CASE("An empty population layer still renders terrain") {
    CompositeMasks masks = split_masks();
    masks.population = masks.population.with_values(std::vector<float>(64, RasterGrid::nodata()));

    MapRenderer renderer(small_options());
    CHECK_NOTHROW(renderer.render(masks, frame()));
    CHECK(renderer.get_stats().population_rows == 0);
    CHECK(renderer.get_stats().terrain_rows == 32);
}

TEST_CASE("Masks with different geometry are rejected") {
    CompositeMasks masks = split_masks();
    masks.population = RasterGrid(2, 2, GeoTransform{0.0, 40.0, 0.0, 80.0, 0.0, -40.0}, CrsTag{});

    MapRenderer renderer(small_options());
    CHECK_THROWS_AS(renderer.render(masks, frame()), std::invalid_argument);
}

TEST_CASE("Render to file writes one PNG and no sidecar") {
    ScratchDirectory scratch;
    std::filesystem::path output = scratch.file("relief.png");

    MapRenderer renderer(small_options());
    REQUIRE(renderer.render_to_file(split_masks(), frame(), output.string()));

    CHECK(std::filesystem::exists(output));
    CHECK(std::filesystem::file_size(output) > 0);
    CHECK_FALSE(std::filesystem::exists(output.string() + ".aux.xml"));
}

TEST_CASE("Options follow the run configuration") {
    ReliefConfig config;
    config.preview = false;
    config.title = "Relief";

    RenderOptions options = RenderOptions::from_config(config);
    CHECK(options.page.width_px == config.canvas_width_px());
    CHECK(options.page.height_px == config.canvas_height_px());
    CHECK(options.palette_begin == doctest::Approx(0.2));
    CHECK(options.palette_end == doctest::Approx(1.0));
    CHECK(options.title == "Relief");
    CHECK_FALSE(options.preview);
}
