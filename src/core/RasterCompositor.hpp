/**
 * @file RasterCompositor.hpp
 * @brief Aligns population onto the hillshade grid and splits coverage
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "population_relief.hpp"
#include "Logger.hpp"

namespace poprelief {

class RasterCompositor {
public:
    struct Options {
        float population_threshold = 0.1f;  // Values at or below become no-data
    };

    RasterCompositor();
    explicit RasterCompositor(const Options& options);

    /**
     * @brief Bilinear resampling of source onto target's cell geometry
     *
     * Only neighbors with non-zero weight participate. A participating
     * neighbor that is no-data or outside the source makes the result
     * no-data. Target cell centers are reprojected when the CRSes differ.
     */
    RasterGrid resample_bilinear(const RasterGrid& source, const RasterGrid& target) const;

    /**
     * @brief Hillshade where population is no-data
     * @throws std::invalid_argument on geometry mismatch
     */
    RasterGrid terrain_only_mask(const RasterGrid& hillshade, const RasterGrid& population) const;

    /**
     * @brief Population above the threshold
     */
    RasterGrid population_mask(const RasterGrid& population) const;

    /**
     * @brief Resample population onto the hillshade and build both masks
     */
    CompositeMasks composite(const RasterGrid& hillshade, const RasterGrid& population) const;

private:
    Options options_;
    Logger logger_{"RasterCompositor"};
};

} // namespace poprelief
