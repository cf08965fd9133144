/**
 * @file PNGExporter.hpp
 * @brief Writes an RGBA canvas to PNG through GDAL
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "RgbaCanvas.hpp"
#include <gdal_priv.h>
#include <string>

namespace poprelief {

class PNGExporter {
public:
    struct Options {
        double dpi = 600.0;   // Stored as pHYs resolution
        int zlevel = 6;       // zlib compression level

        Options() = default;
    };

    PNGExporter();
    explicit PNGExporter(const Options& options);

    /**
     * @brief Write canvas to filename, replacing any existing file
     *
     * No .aux.xml sidecar is produced.
     */
    bool export_canvas(const RgbaCanvas& canvas, const std::string& filename) const;

    const Options& get_options() const { return options_; }

private:
    Options options_;

    /**
     * @brief 4-band Byte MEM dataset holding the canvas (caller must GDALClose())
     */
    GDALDataset* create_dataset(const RgbaCanvas& canvas) const;

    bool write_png_with_copy(GDALDataset* source, const std::string& filename) const;
};

} // namespace poprelief
