/**
 * @file BoundaryLoader.cpp
 * @brief Administrative boundary download and OGR parsing
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "BoundaryLoader.hpp"
#include "GDALHandles.hpp"
#include "GeoUtils.hpp"
#include <ogrsf_frmts.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <cpl_conv.h>
#include <sstream>

namespace poprelief {

namespace {

Ring ring_from_ogr(const OGRLinearRing* ring) {
    Ring out;
    if (!ring) return out;
    int n = ring->getNumPoints();
    out.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        out.emplace_back(ring->getX(i), ring->getY(i));
    }
    return out;
}

// Appends polygon parts; returns the number of parts added
size_t collect_polygons(const OGRGeometry* geom, std::vector<PolygonPart>& parts) {
    if (!geom || geom->IsEmpty()) return 0;

    switch (wkbFlatten(geom->getGeometryType())) {
        case wkbPolygon: {
            const OGRPolygon* poly = geom->toPolygon();
            PolygonPart part;
            part.rings.push_back(ring_from_ogr(poly->getExteriorRing()));
            for (int i = 0; i < poly->getNumInteriorRings(); ++i) {
                part.rings.push_back(ring_from_ogr(poly->getInteriorRing(i)));
            }
            if (part.exterior().size() < 4) {
                return 0;
            }
            parts.push_back(std::move(part));
            return 1;
        }
        case wkbMultiPolygon:
        case wkbGeometryCollection: {
            const OGRGeometryCollection* coll = geom->toGeometryCollection();
            size_t added = 0;
            for (int i = 0; i < coll->getNumGeometries(); ++i) {
                added += collect_polygons(coll->getGeometryRef(i), parts);
            }
            return added;
        }
        default:
            return 0;
    }
}

CrsTag crs_from_layer(OGRLayer* layer) {
    const OGRSpatialReference* srs = layer->GetSpatialRef();
    if (!srs) {
        return wgs84_crs();
    }
    char* wkt = nullptr;
    srs->exportToWkt(&wkt);
    CrsTag tag;
    tag.wkt = wkt ? wkt : "";
    tag.geographic = srs->IsGeographic() != 0;
    CPLFree(wkt);
    return tag;
}

} // namespace

BoundaryLoader::BoundaryLoader(const Config& config, const HttpClient& http)
    : config_(config), http_(http) {
    ensure_gdal_registered();
}

std::string BoundaryLoader::boundary_url(const std::string& url_template, const std::string& iso3, int level) {
    std::string url = replace_placeholder(url_template, "iso3", iso3);
    return replace_placeholder(url, "level", std::to_string(level));
}

std::string BoundaryLoader::boundary_filename(const std::string& iso3, int level) {
    return "gadm41_" + iso3 + "_" + std::to_string(level) + ".json";
}

std::optional<BoundaryPolygon> BoundaryLoader::fetch(const std::filesystem::path& scratch_dir) const {
    std::string url = boundary_url(config_.url_template, config_.iso3, config_.admin_level);
    auto local_path = scratch_dir / boundary_filename(config_.iso3, config_.admin_level);

    logger_.info("Fetching boundary " + config_.iso3 + " level " + std::to_string(config_.admin_level));
    if (!http_.fetch_to(url, local_path)) {
        logger_.error("Could not obtain boundary from " + url);
        return std::nullopt;
    }

    return load_file(local_path.string());
}

std::optional<BoundaryPolygon> BoundaryLoader::load_file(const std::string& path) const {
    GDALDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dataset) {
        logger_.error("Failed to open boundary file: " + path);
        return std::nullopt;
    }

    BoundaryPolygon boundary;
    bool crs_set = false;
    size_t feature_count = 0;

    for (int l = 0; l < dataset->GetLayerCount(); ++l) {
        OGRLayer* layer = dataset->GetLayer(l);
        if (!layer) continue;

        if (!crs_set) {
            boundary.crs = crs_from_layer(layer);
            crs_set = true;
        }

        layer->ResetReading();
        OGRFeature* feature = nullptr;
        while ((feature = layer->GetNextFeature()) != nullptr) {
            feature_count++;
            collect_polygons(feature->GetGeometryRef(), boundary.parts);
            OGRFeature::DestroyFeature(feature);
        }
    }

    if (boundary.empty()) {
        logger_.error("No polygon geometry in " + path + " (" + std::to_string(feature_count) + " features read)");
        return std::nullopt;
    }

    auto box = boundary.bounds();
    std::ostringstream msg;
    msg << "Boundary: " << boundary.parts.size() << " part(s), " << boundary.vertex_count()
        << " vertices, bounds (" << box.min_x << ", " << box.min_y << ") to ("
        << box.max_x << ", " << box.max_y << ")";
    logger_.info(msg.str());
    logger_.debug(std::string("Boundary CRS is ") + (boundary.crs.geographic ? "geographic" : "projected"));

    return boundary;
}

} // namespace poprelief
