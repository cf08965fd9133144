/**
 * @file PNGExporter.cpp
 * @brief Writes an RGBA canvas to PNG through GDAL
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "PNGExporter.hpp"
#include "../core/GDALHandles.hpp"
#include "../core/Logger.hpp"
#include <cpl_conv.h>
#include <cpl_string.h>
#include <filesystem>
#include <optional>
#include <system_error>

namespace poprelief {

PNGExporter::PNGExporter()
    : options_() {
    ensure_gdal_registered();
}

PNGExporter::PNGExporter(const Options& options)
    : options_(options) {
    ensure_gdal_registered();
}

GDALDataset* PNGExporter::create_dataset(const RgbaCanvas& canvas) const {
    Logger logger("PNGExporter");

    GDALDriver* mem_driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (!mem_driver) {
        logger.error("MEM driver not available");
        return nullptr;
    }

    GDALDataset* dataset = mem_driver->Create("", canvas.width(), canvas.height(), 4, GDT_Byte, nullptr);
    if (!dataset) {
        logger.error("Failed to create MEM dataset");
        return nullptr;
    }

    for (int band = 1; band <= 4; ++band) {
        GDALRasterBand* raster_band = dataset->GetRasterBand(band);
        std::vector<uint8_t> plane = canvas.band(band - 1);

        CPLErr err = raster_band->RasterIO(GF_Write, 0, 0, canvas.width(), canvas.height(),
                                           plane.data(), canvas.width(), canvas.height(),
                                           GDT_Byte, 0, 0);
        if (err != CE_None) {
            logger.error("Failed to write raster band " + std::to_string(band));
            GDALClose(dataset);
            return nullptr;
        }
        raster_band->SetColorInterpretation(static_cast<GDALColorInterp>(GCI_RedBand + band - 1));
    }

    // The PNG driver turns these into a pHYs chunk
    std::string dpi = std::to_string(static_cast<int>(options_.dpi));
    dataset->SetMetadataItem("TIFFTAG_XRESOLUTION", dpi.c_str());
    dataset->SetMetadataItem("TIFFTAG_YRESOLUTION", dpi.c_str());
    dataset->SetMetadataItem("TIFFTAG_RESOLUTIONUNIT", "2");  // Inches

    return dataset;
}

bool PNGExporter::write_png_with_copy(GDALDataset* source, const std::string& filename) const {
    Logger logger("PNGExporter");

    if (!source) {
        logger.error("Null source dataset");
        return false;
    }

    GDALDriver* png_driver = GetGDALDriverManager()->GetDriverByName("PNG");
    if (!png_driver) {
        logger.error("PNG driver not available");
        return false;
    }

    // Disable PAM for this write so no .aux.xml lands next to the image
    std::optional<std::string> old_pam_setting;
    if (const char* current = CPLGetConfigOption("GDAL_PAM_ENABLED", nullptr)) {
        old_pam_setting = current;
    }
    CPLSetConfigOption("GDAL_PAM_ENABLED", "NO");

    char** create_options = nullptr;
    create_options = CSLSetNameValue(create_options, "ZLEVEL", std::to_string(options_.zlevel).c_str());

    GDALDatasetPtr png_dataset(png_driver->CreateCopy(
        filename.c_str(),
        source,
        FALSE,          // Not strict
        create_options,
        nullptr,        // Progress function
        nullptr         // Progress data
    ));

    CSLDestroy(create_options);
    const bool created = png_dataset != nullptr;
    png_dataset.reset();  // Flush before PAM is restored
    CPLSetConfigOption("GDAL_PAM_ENABLED", old_pam_setting ? old_pam_setting->c_str() : nullptr);

    if (!created) {
        logger.error("Failed to create PNG file: " + filename);
        return false;
    }

    return true;
}

bool PNGExporter::export_canvas(const RgbaCanvas& canvas, const std::string& filename) const {
    Logger logger("PNGExporter");

    std::filesystem::path out_path(filename);
    if (out_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(out_path.parent_path(), ec);
        if (ec) {
            logger.error("Cannot create output directory " + out_path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    GDALDatasetPtr dataset(create_dataset(canvas));
    if (!dataset) {
        return false;
    }

    bool success = write_png_with_copy(dataset.get(), filename);
    if (success) {
        logger.info("Wrote PNG: " + filename + " (" + std::to_string(canvas.width()) + "x" +
                    std::to_string(canvas.height()) + " px at " +
                    std::to_string(static_cast<int>(options_.dpi)) + " dpi)");
    }
    return success;
}

} // namespace poprelief
