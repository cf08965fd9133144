/**
 * @file BoundaryLoader.hpp
 * @brief Administrative boundary download and OGR parsing
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "population_relief.hpp"
#include "HttpClient.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace poprelief {

/**
 * @brief Obtains the country polygon from GADM or a local vector file
 */
class BoundaryLoader {
public:
    struct Config {
        std::string iso3 = "CHE";
        int admin_level = 0;
        std::string url_template;
    };

    BoundaryLoader(const Config& config, const HttpClient& http);

    /**
     * @brief Download (or reuse from scratch_dir) and parse the boundary
     */
    std::optional<BoundaryPolygon> fetch(const std::filesystem::path& scratch_dir) const;

    /**
     * @brief Parse any OGR-readable vector file
     *
     * Polygons, multipolygons and collections of them from every feature of
     * every layer are merged into one multi-part boundary.
     */
    std::optional<BoundaryPolygon> load_file(const std::string& path) const;

    /**
     * @brief GADM URL with {iso3} and {level} substituted
     */
    static std::string boundary_url(const std::string& url_template, const std::string& iso3, int level);

    /**
     * @brief Local file name for a downloaded boundary (gadm41_CHE_0.json)
     */
    static std::string boundary_filename(const std::string& iso3, int level);

private:
    Config config_;
    const HttpClient& http_;
    Logger logger_{"BoundaryLoader"};
};

} // namespace poprelief
