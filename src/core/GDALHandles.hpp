/**
 * @file GDALHandles.hpp
 * @brief RAII ownership for GDAL datasets and one-time driver registration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <gdal_priv.h>
#include <memory>
#include <mutex>

namespace poprelief {

// RAII wrapper for GDAL dataset
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) const {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

inline void ensure_gdal_registered() {
    static std::once_flag gdal_once;
    std::call_once(gdal_once, [] { GDALAllRegister(); });
}

} // namespace poprelief
