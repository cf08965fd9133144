/**
 * @file RasterCompositor.cpp
 * @brief Aligns population onto the hillshade grid and splits coverage
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterCompositor.hpp"
#include "GeoUtils.hpp"
#include <cmath>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace poprelief {

namespace {

// Fractional offsets this close to a cell center count as on it
constexpr double SNAP_EPSILON = 1e-6;

// Bilinear sample at fractional cell-center coordinates
float sample_bilinear(const RasterGrid& source, double fx, double fy) {
    double c0 = std::floor(fx);
    double r0 = std::floor(fy);
    double tx = fx - c0;
    double ty = fy - r0;

    if (tx < SNAP_EPSILON) {
        tx = 0.0;
    } else if (tx > 1.0 - SNAP_EPSILON) {
        tx = 0.0;
        c0 += 1.0;
    }
    if (ty < SNAP_EPSILON) {
        ty = 0.0;
    } else if (ty > 1.0 - SNAP_EPSILON) {
        ty = 0.0;
        r0 += 1.0;
    }

    const long col = static_cast<long>(c0);
    const long row = static_cast<long>(r0);

    double sum = 0.0;
    for (int dr = 0; dr <= 1; ++dr) {
        double wy = dr == 0 ? 1.0 - ty : ty;
        if (wy == 0.0) continue;
        for (int dc = 0; dc <= 1; ++dc) {
            double wx = dc == 0 ? 1.0 - tx : tx;
            if (wx == 0.0) continue;

            float v = source.value_or_nodata(col + dc, row + dr);
            if (RasterGrid::is_nodata(v)) {
                return RasterGrid::nodata();
            }
            sum += wx * wy * v;
        }
    }
    return static_cast<float>(sum);
}

void require_same_geometry(const RasterGrid& a, const RasterGrid& b, const char* what) {
    if (!a.same_geometry(b)) {
        std::ostringstream msg;
        msg << what << ": grid geometry mismatch (" << a.width() << "x" << a.height()
            << " vs " << b.width() << "x" << b.height() << ")";
        throw std::invalid_argument(msg.str());
    }
}

} // namespace

RasterCompositor::RasterCompositor() : options_() {
}

RasterCompositor::RasterCompositor(const Options& options) : options_(options) {
}

RasterGrid RasterCompositor::resample_bilinear(const RasterGrid& source, const RasterGrid& target) const {
    std::vector<float> values(target.size(), RasterGrid::nodata());

    std::optional<CoordinateTransformer> transformer;
    if (!crs_equivalent(source.crs(), target.crs())) {
        transformer.emplace(target.crs(), source.crs());
        if (!transformer->valid()) {
            throw std::invalid_argument("Resample: no transformation between source and target CRS");
        }
        logger_.detailed("Resampling across CRSes");
    }

    std::vector<double> xs(target.width());
    std::vector<double> ys(target.width());

    for (size_t row = 0; row < target.height(); ++row) {
        for (size_t col = 0; col < target.width(); ++col) {
            xs[col] = target.cell_center_x(col);
            ys[col] = target.cell_center_y(row);
        }

        std::vector<bool> ok(target.width(), true);
        if (transformer) {
            ok = transformer->transform(xs, ys);
        }

        for (size_t col = 0; col < target.width(); ++col) {
            if (!ok[col]) continue;
            auto [px, py] = source.world_to_pixel(xs[col], ys[col]);
            values[row * target.width() + col] = sample_bilinear(source, px - 0.5, py - 0.5);
        }
    }

    return target.with_values(std::move(values));
}

RasterGrid RasterCompositor::terrain_only_mask(const RasterGrid& hillshade, const RasterGrid& population) const {
    require_same_geometry(hillshade, population, "Terrain mask");

    std::vector<float> values(hillshade.size(), RasterGrid::nodata());
    for (size_t i = 0; i < values.size(); ++i) {
        if (RasterGrid::is_nodata(population.values()[i])) {
            values[i] = hillshade.values()[i];
        }
    }
    return hillshade.with_values(std::move(values));
}

RasterGrid RasterCompositor::population_mask(const RasterGrid& population) const {
    std::vector<float> values(population.values());
    for (float& v : values) {
        if (!RasterGrid::is_nodata(v) && v <= options_.population_threshold) {
            v = RasterGrid::nodata();
        }
    }
    return population.with_values(std::move(values));
}

CompositeMasks RasterCompositor::composite(const RasterGrid& hillshade, const RasterGrid& population) const {
    logger_.info("Resampling population onto " + std::to_string(hillshade.width()) + "x" +
                 std::to_string(hillshade.height()) + " hillshade grid");

    RasterGrid aligned = resample_bilinear(population, hillshade);
    logger_.detailed("Resampled population: " + std::to_string(aligned.valid_count()) + " valid cells");

    CompositeMasks masks{terrain_only_mask(hillshade, aligned), population_mask(aligned)};
    require_same_geometry(masks.terrain, masks.population, "Composite");

    logger_.info("Masks: " + std::to_string(masks.terrain.valid_count()) + " terrain cells, " +
                 std::to_string(masks.population.valid_count()) + " populated cells");
    return masks;
}

} // namespace poprelief
