/**
 * @file GeoUtils.cpp
 * @brief CRS helpers, coordinate transformation and slippy-map tile math
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "GeoUtils.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <ogr_spatialref.h>
#include <cpl_conv.h>
#include <stdexcept>

namespace poprelief {

namespace {

std::string export_wkt(const OGRSpatialReference& srs) {
    char* wkt = nullptr;
    srs.exportToWkt(&wkt);
    std::string result = wkt ? wkt : "";
    CPLFree(wkt);
    return result;
}

CrsTag tag_from_srs(const OGRSpatialReference& srs) {
    CrsTag tag;
    tag.wkt = export_wkt(srs);
    tag.geographic = srs.IsGeographic() != 0;
    return tag;
}

bool import_tag(const CrsTag& tag, OGRSpatialReference& srs) {
    if (tag.wkt.empty()) {
        return false;
    }
    if (srs.SetFromUserInput(tag.wkt.c_str()) != OGRERR_NONE) {
        return false;
    }
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return true;
}

} // namespace

// ============================================================================
// CRS helpers
// ============================================================================

CrsTag wgs84_crs() {
    OGRSpatialReference srs;
    srs.SetWellKnownGeogCS("WGS84");
    return tag_from_srs(srs);
}

bool crs_equivalent(const CrsTag& a, const CrsTag& b) {
    if (a.wkt == b.wkt) {
        return true;
    }
    if (a.wkt.empty() || b.wkt.empty()) {
        return false;
    }
    OGRSpatialReference sa;
    OGRSpatialReference sb;
    if (!import_tag(a, sa) || !import_tag(b, sb)) {
        return false;
    }
    return sa.IsSame(&sb) != 0;
}

// ============================================================================
// CoordinateTransformer
// ============================================================================

void CoordinateTransformer::Deleter::operator()(OGRCoordinateTransformation* ct) const {
    OGRCoordinateTransformation::DestroyCT(ct);
}

CoordinateTransformer::CoordinateTransformer(const CrsTag& source, const CrsTag& target) {
    OGRSpatialReference src;
    OGRSpatialReference dst;
    if (!import_tag(source, src) || !import_tag(target, dst)) {
        return;
    }
    transform_.reset(OGRCreateCoordinateTransformation(&src, &dst));
}

CoordinateTransformer::~CoordinateTransformer() = default;

std::optional<Point2D> CoordinateTransformer::transform(double x, double y) const {
    if (!transform_) {
        return std::nullopt;
    }
    if (!transform_->Transform(1, &x, &y)) {
        return std::nullopt;
    }
    return Point2D(x, y);
}

std::vector<bool> CoordinateTransformer::transform(std::vector<double>& xs, std::vector<double>& ys) const {
    std::vector<bool> ok(xs.size(), false);
    if (!transform_ || xs.size() != ys.size() || xs.empty()) {
        return ok;
    }

    std::vector<int> success(xs.size(), 0);
    transform_->Transform(static_cast<size_t>(xs.size()), xs.data(), ys.data(), nullptr, success.data());
    for (size_t i = 0; i < xs.size(); ++i) {
        ok[i] = success[i] != 0;
    }
    return ok;
}

std::optional<BoundingBox> transform_bounds(const BoundingBox& bounds, const CrsTag& source,
                                            const CrsTag& target, int samples_per_edge) {
    if (crs_equivalent(source, target)) {
        return bounds;
    }

    CoordinateTransformer transformer(source, target);
    if (!transformer.valid()) {
        return std::nullopt;
    }

    samples_per_edge = std::max(samples_per_edge, 2);
    std::vector<double> xs;
    std::vector<double> ys;
    for (int i = 0; i < samples_per_edge; ++i) {
        double t = static_cast<double>(i) / (samples_per_edge - 1);
        double x = bounds.min_x + t * bounds.width();
        double y = bounds.min_y + t * bounds.height();
        xs.insert(xs.end(), {x, x, bounds.min_x, bounds.max_x});
        ys.insert(ys.end(), {bounds.min_y, bounds.max_y, y, y});
    }

    auto ok = transformer.transform(xs, ys);

    bool any = false;
    BoundingBox out;
    for (size_t i = 0; i < xs.size(); ++i) {
        if (!ok[i]) continue;
        if (!any) {
            out = BoundingBox(xs[i], ys[i], xs[i], ys[i]);
            any = true;
        } else {
            out.min_x = std::min(out.min_x, xs[i]);
            out.min_y = std::min(out.min_y, ys[i]);
            out.max_x = std::max(out.max_x, xs[i]);
            out.max_y = std::max(out.max_y, ys[i]);
        }
    }
    if (!any) {
        return std::nullopt;
    }
    return out;
}

BoundaryPolygon reproject_boundary(const BoundaryPolygon& boundary, const CrsTag& target) {
    CoordinateTransformer transformer(boundary.crs, target);
    if (!transformer.valid()) {
        throw std::invalid_argument("Cannot transform boundary into the target CRS");
    }

    BoundaryPolygon out;
    out.crs = target;
    for (const auto& part : boundary.parts) {
        PolygonPart reprojected;
        for (const auto& ring : part.rings) {
            std::vector<double> xs;
            std::vector<double> ys;
            for (const auto& pt : ring) {
                xs.push_back(pt.x());
                ys.push_back(pt.y());
            }
            auto ok = transformer.transform(xs, ys);
            Ring r;
            for (size_t i = 0; i < xs.size(); ++i) {
                if (ok[i]) r.emplace_back(xs[i], ys[i]);
            }
            reprojected.rings.push_back(std::move(r));
        }
        out.parts.push_back(std::move(reprojected));
    }
    return out;
}

// ============================================================================
// Slippy-map tiles
// ============================================================================

int lon_to_tile_x(double lon, int zoom) {
    int n = 1 << zoom;
    int x = static_cast<int>(std::floor((lon + 180.0) / 360.0 * n));
    return std::clamp(x, 0, n - 1);
}

int lat_to_tile_y(double lat, int zoom) {
    int n = 1 << zoom;
    double lat_rad = std::clamp(lat, -MAX_MERCATOR_LATITUDE, MAX_MERCATOR_LATITUDE) * std::numbers::pi / 180.0;
    double y = (1.0 - std::asinh(std::tan(lat_rad)) / std::numbers::pi) / 2.0 * n;
    return std::clamp(static_cast<int>(std::floor(y)), 0, n - 1);
}

TileRange tile_range_for_bounds(const BoundingBox& lonlat_bounds, int zoom) {
    if (zoom < 0 || zoom > 24) {
        throw std::invalid_argument("Tile zoom out of range: " + std::to_string(zoom));
    }

    TileRange range;
    range.zoom = zoom;
    range.min_x = lon_to_tile_x(lonlat_bounds.min_x, zoom);
    range.max_x = lon_to_tile_x(lonlat_bounds.max_x, zoom);
    // Tile rows grow southwards
    range.min_y = lat_to_tile_y(lonlat_bounds.max_y, zoom);
    range.max_y = lat_to_tile_y(lonlat_bounds.min_y, zoom);
    return range;
}

std::string replace_placeholder(std::string text, const std::string& key, const std::string& value) {
    const std::string token = "{" + key + "}";
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
    return text;
}

std::string format_tile_url(const std::string& url_template, int zoom, int x, int y) {
    std::string url = replace_placeholder(url_template, "z", std::to_string(zoom));
    url = replace_placeholder(url, "x", std::to_string(x));
    return replace_placeholder(url, "y", std::to_string(y));
}

} // namespace poprelief
