/**
 * @file RasterAcquirer.cpp
 * @brief Population and elevation raster acquisition with GDAL
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterAcquirer.hpp"
#include "GDALHandles.hpp"
#include <gdal_utils.h>
#include <ogr_spatialref.h>
#include <cpl_string.h>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace poprelief {

namespace {

std::string url_basename(const std::string& url) {
    auto query = url.find('?');
    std::string path = url.substr(0, query);
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string format_coord(double v) {
    std::ostringstream ss;
    ss << std::setprecision(17) << v;
    return ss.str();
}

// Band 1 of an open dataset as a grid; no-data values become NaN
std::optional<RasterGrid> read_dataset(GDALDataset* dataset, const std::string& name, const Logger& logger) {
    GeoTransform gt{};
    if (dataset->GetGeoTransform(gt.data()) != CE_None) {
        logger.error("Raster has no geotransform: " + name);
        return std::nullopt;
    }
    if (gt[2] != 0.0 || gt[4] != 0.0) {
        logger.error("Rotated rasters are not supported: " + name);
        return std::nullopt;
    }

    GDALRasterBand* band = dataset->GetRasterBand(1);
    if (!band) {
        logger.error("Failed to get raster band: " + name);
        return std::nullopt;
    }

    int width = dataset->GetRasterXSize();
    int height = dataset->GetRasterYSize();
    std::vector<float> values(static_cast<size_t>(width) * static_cast<size_t>(height));

    CPLErr err = band->RasterIO(GF_Read, 0, 0, width, height, values.data(), width, height,
                                GDT_Float32, 0, 0);
    if (err != CE_None) {
        logger.error("Failed to read raster data: " + name);
        return std::nullopt;
    }

    int has_nodata = 0;
    double nodata = band->GetNoDataValue(&has_nodata);
    if (has_nodata && !std::isnan(nodata)) {
        const float nodata_f = static_cast<float>(nodata);
        for (float& v : values) {
            if (v == nodata_f) {
                v = RasterGrid::nodata();
            }
        }
    }

    CrsTag crs;
    const char* wkt = dataset->GetProjectionRef();
    crs.wkt = wkt ? wkt : "";
    const OGRSpatialReference* srs = dataset->GetSpatialRef();
    crs.geographic = srs && srs->IsGeographic();

    return RasterGrid(static_cast<size_t>(width), static_cast<size_t>(height), gt, crs, std::move(values));
}

} // namespace

RasterAcquirer::RasterAcquirer(const Config& config, const HttpClient& http)
    : config_(config), http_(http) {
    ensure_gdal_registered();
}

// ============================================================================
// Population
// ============================================================================

std::optional<RasterGrid> RasterAcquirer::fetch_population(const std::filesystem::path& scratch_dir) const {
    auto local_path = scratch_dir / url_basename(config_.population_url);

    logger_.info("Fetching population raster");
    if (!http_.download_file(config_.population_url, local_path)) {
        logger_.error("Could not obtain population raster from " + config_.population_url);
        return std::nullopt;
    }

    return load_raster_file(local_path.string());
}

std::optional<RasterGrid> RasterAcquirer::load_raster_file(const std::string& path) const {
    GDALDatasetPtr dataset(static_cast<GDALDataset*>(GDALOpen(path.c_str(), GA_ReadOnly)));
    if (!dataset) {
        logger_.error("Failed to open raster: " + path);
        return std::nullopt;
    }

    auto grid = read_dataset(dataset.get(), path, logger_);
    if (grid) {
        std::ostringstream msg;
        msg << "Loaded " << std::filesystem::path(path).filename().string() << ": "
            << grid->width() << "x" << grid->height() << " cells, " << grid->valid_count() << " valid";
        logger_.info(msg.str());
    }
    return grid;
}

// ============================================================================
// Elevation
// ============================================================================

std::optional<TileRange> RasterAcquirer::tiles_for_boundary(const BoundaryPolygon& boundary) const {
    auto lonlat = transform_bounds(boundary.bounds(), boundary.crs, wgs84_crs());
    if (!lonlat) {
        logger_.error("Cannot express boundary bounds in longitude/latitude");
        return std::nullopt;
    }
    return tile_range_for_bounds(*lonlat, config_.elevation_zoom);
}

std::optional<RasterGrid> RasterAcquirer::fetch_elevation(const BoundaryPolygon& boundary,
                                                          const std::filesystem::path& scratch_dir) const {
    auto range = tiles_for_boundary(boundary);
    if (!range) {
        return std::nullopt;
    }

    std::ostringstream msg;
    msg << "Fetching " << range->count() << " elevation tiles at zoom " << range->zoom
        << " (x " << range->min_x << ".." << range->max_x
        << ", y " << range->min_y << ".." << range->max_y << ")";
    logger_.info(msg.str());

    auto tile_dir = scratch_dir / "tiles";
    std::vector<std::string> tile_paths;
    for (int y = range->min_y; y <= range->max_y; ++y) {
        for (int x = range->min_x; x <= range->max_x; ++x) {
            std::string url = format_tile_url(config_.elevation_tile_url_template, range->zoom, x, y);
            auto path = tile_dir / (std::to_string(range->zoom) + "_" + std::to_string(x) + "_" +
                                    std::to_string(y) + ".tif");
            if (!http_.download_file(url, path)) {
                logger_.error("Elevation tile download failed: " + url);
                return std::nullopt;
            }
            tile_paths.push_back(path.string());
        }
    }

    logger_.detailed("Downloaded " + std::to_string(tile_paths.size()) + " tiles");
    return warp_to_boundary(tile_paths, boundary, scratch_dir);
}

std::optional<RasterGrid> RasterAcquirer::load_elevation_file(const std::string& path,
                                                              const BoundaryPolygon& boundary) const {
    auto grid = load_raster_file(path);
    if (!grid) {
        return std::nullopt;
    }

    if (!crs_equivalent(grid->crs(), boundary.crs)) {
        logger_.detailed("Elevation file CRS differs from boundary CRS, warping");
        return warp_to_boundary({path}, boundary, std::filesystem::path(path).parent_path());
    }
    if (grid->geotransform()[5] >= 0.0) {
        logger_.detailed("Elevation file is not north-up, warping");
        return warp_to_boundary({path}, boundary, std::filesystem::path(path).parent_path());
    }

    try {
        auto cropped = crop_to_bounds(*grid, boundary.bounds());
        auto clipped = mask_to_boundary(cropped, boundary);
        logger_.info("Elevation clipped to boundary: " + std::to_string(clipped.width()) + "x" +
                     std::to_string(clipped.height()) + " cells, " +
                     std::to_string(clipped.valid_count()) + " valid");
        return clipped;
    } catch (const std::invalid_argument& e) {
        logger_.error(std::string("Elevation file does not cover the boundary: ") + e.what());
        return std::nullopt;
    }
}

std::optional<RasterGrid> RasterAcquirer::warp_to_boundary(const std::vector<std::string>& sources,
                                                           const BoundaryPolygon& boundary,
                                                           const std::filesystem::path& scratch_dir) const {
    if (sources.empty()) {
        logger_.error("No elevation sources to warp");
        return std::nullopt;
    }

    GDALDatasetPtr source;
    if (sources.size() == 1) {
        source.reset(static_cast<GDALDataset*>(GDALOpen(sources.front().c_str(), GA_ReadOnly)));
    } else {
        std::string vrt_path = (scratch_dir / "elevation_mosaic.vrt").string();

        char** input_filenames = nullptr;
        for (const auto& file : sources) {
            input_filenames = CSLAddString(input_filenames, file.c_str());
        }

        GDALBuildVRTOptions* build_options = GDALBuildVRTOptionsNew(nullptr, nullptr);
        int usage_error = 0;
        source.reset(static_cast<GDALDataset*>(
            GDALBuildVRT(vrt_path.c_str(), static_cast<int>(sources.size()), nullptr,
                         const_cast<const char**>(input_filenames), build_options, &usage_error)));
        GDALBuildVRTOptionsFree(build_options);
        CSLDestroy(input_filenames);
    }

    if (!source) {
        logger_.error("Failed to open elevation mosaic");
        return std::nullopt;
    }

    BoundingBox box = boundary.bounds();
    char** warp_args = nullptr;
    warp_args = CSLAddString(warp_args, "-of");
    warp_args = CSLAddString(warp_args, "MEM");
    warp_args = CSLAddString(warp_args, "-ot");
    warp_args = CSLAddString(warp_args, "Float32");
    warp_args = CSLAddString(warp_args, "-r");
    warp_args = CSLAddString(warp_args, "bilinear");
    warp_args = CSLAddString(warp_args, "-dstnodata");
    warp_args = CSLAddString(warp_args, "nan");
    if (!boundary.crs.wkt.empty()) {
        warp_args = CSLAddString(warp_args, "-t_srs");
        warp_args = CSLAddString(warp_args, boundary.crs.wkt.c_str());
    }
    warp_args = CSLAddString(warp_args, "-te");
    for (double v : {box.min_x, box.min_y, box.max_x, box.max_y}) {
        warp_args = CSLAddString(warp_args, format_coord(v).c_str());
    }

    GDALWarpAppOptions* warp_options = GDALWarpAppOptionsNew(warp_args, nullptr);
    CSLDestroy(warp_args);
    if (!warp_options) {
        logger_.error("Invalid warp options");
        return std::nullopt;
    }

    GDALDatasetH source_handle = static_cast<GDALDatasetH>(source.get());
    int usage_error = 0;
    GDALDatasetPtr warped(static_cast<GDALDataset*>(
        GDALWarp("", nullptr, 1, &source_handle, warp_options, &usage_error)));
    GDALWarpAppOptionsFree(warp_options);

    if (!warped || usage_error) {
        logger_.error("Elevation warp failed");
        return std::nullopt;
    }

    auto grid = read_dataset(warped.get(), "warped elevation", logger_);
    if (!grid) {
        return std::nullopt;
    }
    // Keep the boundary's own tag so downstream CRS comparisons are exact
    RasterGrid tagged(grid->width(), grid->height(), grid->geotransform(), boundary.crs, grid->values());

    RasterGrid clipped = mask_to_boundary(tagged, boundary);
    auto [lo, hi] = clipped.value_range();
    std::ostringstream msg;
    msg << "Elevation grid: " << clipped.width() << "x" << clipped.height() << " cells, "
        << clipped.valid_count() << " inside boundary, range " << lo << " to " << hi << " m";
    logger_.info(msg.str());
    return clipped;
}

// ============================================================================
// Pure grid operations
// ============================================================================

RasterGrid RasterAcquirer::crop_to_bounds(const RasterGrid& grid, const BoundingBox& bounds) {
    const auto& gt = grid.geotransform();

    auto [px0, py0] = grid.world_to_pixel(bounds.min_x, bounds.max_y);
    auto [px1, py1] = grid.world_to_pixel(bounds.max_x, bounds.min_y);

    long col0 = std::max(0L, static_cast<long>(std::floor(std::min(px0, px1))));
    long row0 = std::max(0L, static_cast<long>(std::floor(std::min(py0, py1))));
    long col1 = std::min(static_cast<long>(grid.width()), static_cast<long>(std::ceil(std::max(px0, px1))));
    long row1 = std::min(static_cast<long>(grid.height()), static_cast<long>(std::ceil(std::max(py0, py1))));

    if (col1 <= col0 || row1 <= row0) {
        throw std::invalid_argument("Bounds do not overlap the raster");
    }

    size_t w = static_cast<size_t>(col1 - col0);
    size_t h = static_cast<size_t>(row1 - row0);
    std::vector<float> values;
    values.reserve(w * h);
    for (long r = row0; r < row1; ++r) {
        auto begin = grid.values().begin() + r * static_cast<long>(grid.width()) + col0;
        values.insert(values.end(), begin, begin + static_cast<long>(w));
    }

    GeoTransform cropped_gt = gt;
    cropped_gt[0] = gt[0] + static_cast<double>(col0) * gt[1];
    cropped_gt[3] = gt[3] + static_cast<double>(row0) * gt[5];
    return RasterGrid(w, h, cropped_gt, grid.crs(), std::move(values));
}

RasterGrid RasterAcquirer::mask_to_boundary(const RasterGrid& grid, const BoundaryPolygon& boundary) {
    std::optional<BoundaryPolygon> reprojected;
    if (!crs_equivalent(grid.crs(), boundary.crs)) {
        reprojected = reproject_boundary(boundary, grid.crs());
    }
    const BoundaryPolygon* active = reprojected ? &*reprojected : &boundary;

    const auto& gt = grid.geotransform();
    std::vector<float> values(grid.size(), RasterGrid::nodata());
    std::vector<double> crossings;

    for (size_t row = 0; row < grid.height(); ++row) {
        double y = grid.cell_center_y(row);
        crossings.clear();

        for (const auto& part : active->parts) {
            for (const auto& ring : part.rings) {
                size_t n = ring.size();
                if (n < 3) continue;
                for (size_t i = 0, j = n - 1; i < n; j = i++) {
                    double yi = ring[i].y(), yj = ring[j].y();
                    if ((yi > y) != (yj > y)) {
                        double xi = ring[i].x(), xj = ring[j].x();
                        crossings.push_back(xj + (y - yj) * (xi - xj) / (yi - yj));
                    }
                }
            }
        }

        if (crossings.size() < 2) continue;
        std::sort(crossings.begin(), crossings.end());

        for (size_t k = 0; k + 1 < crossings.size(); k += 2) {
            // Cell centers in [a, b) are inside
            double fa = (crossings[k] - gt[0]) / gt[1] - 0.5;
            double fb = (crossings[k + 1] - gt[0]) / gt[1] - 0.5;
            long c0 = std::max(0L, static_cast<long>(std::ceil(fa)));
            long c1 = std::min(static_cast<long>(grid.width()), static_cast<long>(std::ceil(fb)));
            for (long c = c0; c < c1; ++c) {
                size_t idx = row * grid.width() + static_cast<size_t>(c);
                values[idx] = grid.values()[idx];
            }
        }
    }

    return grid.with_values(std::move(values));
}

} // namespace poprelief
