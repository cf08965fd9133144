/**
 * @file ReliefMapGenerator.cpp
 * @brief Pipeline sequencing for the population relief map
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "population_relief.hpp"
#include "BoundaryLoader.hpp"
#include "HttpClient.hpp"
#include "Logger.hpp"
#include "RasterAcquirer.hpp"
#include "RasterCompositor.hpp"
#include "ScratchDirectory.hpp"
#include "TerrainProcessor.hpp"
#include "../export/MapRenderer.hpp"
#include <chrono>
#include <filesystem>

namespace poprelief {

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::high_resolution_clock::time_point start) {
    auto end_time = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start);
}

} // namespace

// ============================================================================
// ReliefMapGenerator::Impl - Private implementation
// ============================================================================

class ReliefMapGenerator::Impl {
public:
    explicit Impl(const ReliefConfig& config)
        : config_(config),
          logger_("ReliefMapGenerator"),
          http_(make_http_config(config)) {
    }

    bool generate_map() {
        auto start_time = std::chrono::high_resolution_clock::now();
        metrics_ = {};

        logger_.info("Starting relief map pipeline for " + config_.country_iso3);

        // Stages run in order; the first failure stops the run
        bool success = load_boundary()
                    && acquire_rasters()
                    && process_terrain()
                    && composite_rasters()
                    && render_map();

        metrics_.total_time = elapsed_since(start_time);

        // Downloads live only as long as the run
        scratch_.reset();

        if (success) {
            logger_.info("Completed in " + std::to_string(metrics_.total_time.count()) + "ms: " +
                         get_output_path());
        } else {
            logger_.error("Pipeline stopped after " + std::to_string(metrics_.total_time.count()) + "ms");
        }
        log_metrics();
        return success;
    }

    bool load_boundary() {
        auto start_time = std::chrono::high_resolution_clock::now();

        BoundaryLoader::Config loader_config;
        loader_config.iso3 = config_.country_iso3;
        loader_config.admin_level = config_.admin_level;
        loader_config.url_template = config_.boundary_url_template;
        BoundaryLoader loader(loader_config, http_);

        std::optional<BoundaryPolygon> boundary;
        if (config_.boundary_file) {
            logger_.info("Loading boundary from " + *config_.boundary_file);
            boundary = loader.load_file(*config_.boundary_file);
        } else {
            boundary = loader.fetch(scratch().path());
        }

        metrics_.boundary_time = elapsed_since(start_time);
        if (!boundary) {
            logger_.error("Boundary stage failed");
            return false;
        }

        boundary_ = std::move(*boundary);
        logger_.info("Boundary: " + std::to_string(boundary_.parts.size()) + " parts, " +
                     std::to_string(boundary_.vertex_count()) + " vertices");
        return true;
    }

    bool acquire_rasters() {
        if (boundary_.empty()) {
            logger_.error("Cannot acquire rasters without a boundary");
            return false;
        }

        auto start_time = std::chrono::high_resolution_clock::now();

        RasterAcquirer::Config acquirer_config;
        acquirer_config.population_url = config_.population_url;
        acquirer_config.elevation_tile_url_template = config_.elevation_tile_url_template;
        acquirer_config.elevation_zoom = config_.elevation_zoom;
        RasterAcquirer acquirer(acquirer_config, http_);

        std::optional<RasterGrid> population = config_.population_file
            ? acquirer.load_raster_file(*config_.population_file)
            : acquirer.fetch_population(scratch().path());
        if (!population) {
            metrics_.acquisition_time = elapsed_since(start_time);
            logger_.error("Population raster unavailable");
            return false;
        }

        std::optional<RasterGrid> elevation = config_.elevation_file
            ? acquirer.load_elevation_file(*config_.elevation_file, boundary_)
            : acquirer.fetch_elevation(boundary_, scratch().path());
        metrics_.acquisition_time = elapsed_since(start_time);
        if (!elevation) {
            logger_.error("Elevation raster unavailable");
            return false;
        }

        population_ = std::move(*population);
        elevation_ = std::move(*elevation);
        metrics_.population_cells = population_.valid_count();
        metrics_.elevation_cells = elevation_.valid_count();

        logger_.info("Population grid " + std::to_string(population_.width()) + "x" +
                     std::to_string(population_.height()) + ", elevation grid " +
                     std::to_string(elevation_.width()) + "x" + std::to_string(elevation_.height()));
        return true;
    }

    bool process_terrain() {
        if (elevation_.empty()) {
            logger_.error("Cannot shade terrain without elevation");
            return false;
        }

        auto start_time = std::chrono::high_resolution_clock::now();

        TerrainProcessor::Options options;
        options.exaggeration = config_.exaggeration;
        options.azimuth_deg = config_.light_azimuth_deg;
        options.altitude_deg = config_.light_altitude_deg;
        hillshade_ = TerrainProcessor(options).process(elevation_);

        metrics_.terrain_time = elapsed_since(start_time);
        return true;
    }

    bool composite_rasters() {
        if (hillshade_.empty() || population_.empty()) {
            logger_.error("Cannot composite before terrain and population are ready");
            return false;
        }

        auto start_time = std::chrono::high_resolution_clock::now();

        RasterCompositor::Options options;
        options.population_threshold = config_.population_threshold;
        masks_ = RasterCompositor(options).composite(hillshade_, population_);

        metrics_.compositing_time = elapsed_since(start_time);
        return true;
    }

    bool render_map() {
        if (masks_.terrain.empty()) {
            logger_.error("Cannot render before compositing");
            return false;
        }

        auto start_time = std::chrono::high_resolution_clock::now();

        MapRenderer renderer(RenderOptions::from_config(config_));
        bool success = renderer.render_to_file(masks_, boundary_, get_output_path());

        metrics_.render_time = elapsed_since(start_time);
        metrics_.terrain_rows = renderer.get_stats().terrain_rows;
        metrics_.population_rows = renderer.get_stats().population_rows;
        return success;
    }

    const BoundaryPolygon& get_boundary() const { return boundary_; }
    const RasterGrid& get_elevation() const { return elevation_; }
    const RasterGrid& get_population() const { return population_; }
    const RasterGrid& get_hillshade() const { return hillshade_; }
    const CompositeMasks& get_masks() const { return masks_; }
    const PerformanceMetrics& get_metrics() const { return metrics_; }
    const ReliefConfig& get_config() const { return config_; }

    std::string get_output_path() const {
        return (std::filesystem::path(config_.output_directory) / config_.output_filename).string();
    }

private:
    ReliefConfig config_;
    Logger logger_;
    HttpClient http_;
    std::unique_ptr<ScratchDirectory> scratch_;

    BoundaryPolygon boundary_;
    RasterGrid elevation_;
    RasterGrid population_;
    RasterGrid hillshade_;
    CompositeMasks masks_;
    PerformanceMetrics metrics_;

    static HttpClient::Config make_http_config(const ReliefConfig& config) {
        HttpClient::Config http_config;
        http_config.timeout_seconds = config.timeout_seconds;
        return http_config;
    }

    ScratchDirectory& scratch() {
        if (!scratch_) {
            scratch_ = std::make_unique<ScratchDirectory>(config_.scratch_directory, config_.keep_downloads);
        }
        return *scratch_;
    }

    void log_metrics() {
        logger_.detailed("Timings: boundary " + std::to_string(metrics_.boundary_time.count()) +
                         "ms, acquisition " + std::to_string(metrics_.acquisition_time.count()) +
                         "ms, terrain " + std::to_string(metrics_.terrain_time.count()) +
                         "ms, compositing " + std::to_string(metrics_.compositing_time.count()) +
                         "ms, render " + std::to_string(metrics_.render_time.count()) + "ms");
        logger_.detailed("Cells: elevation " + std::to_string(metrics_.elevation_cells) +
                         ", population " + std::to_string(metrics_.population_cells) +
                         "; painted terrain " + std::to_string(metrics_.terrain_rows) +
                         ", population " + std::to_string(metrics_.population_rows));
    }
};

// ============================================================================
// ReliefMapGenerator Public Interface
// ============================================================================

ReliefMapGenerator::ReliefMapGenerator(const ReliefConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

ReliefMapGenerator::~ReliefMapGenerator() = default;

bool ReliefMapGenerator::generate_map() {
    return impl_->generate_map();
}

bool ReliefMapGenerator::load_boundary() {
    return impl_->load_boundary();
}

bool ReliefMapGenerator::acquire_rasters() {
    return impl_->acquire_rasters();
}

bool ReliefMapGenerator::process_terrain() {
    return impl_->process_terrain();
}

bool ReliefMapGenerator::composite_rasters() {
    return impl_->composite_rasters();
}

bool ReliefMapGenerator::render_map() {
    return impl_->render_map();
}

const BoundaryPolygon& ReliefMapGenerator::get_boundary() const {
    return impl_->get_boundary();
}

const RasterGrid& ReliefMapGenerator::get_elevation() const {
    return impl_->get_elevation();
}

const RasterGrid& ReliefMapGenerator::get_population() const {
    return impl_->get_population();
}

const RasterGrid& ReliefMapGenerator::get_hillshade() const {
    return impl_->get_hillshade();
}

const CompositeMasks& ReliefMapGenerator::get_masks() const {
    return impl_->get_masks();
}

const PerformanceMetrics& ReliefMapGenerator::get_metrics() const {
    return impl_->get_metrics();
}

std::string ReliefMapGenerator::get_output_path() const {
    return impl_->get_output_path();
}

const ReliefConfig& ReliefMapGenerator::get_config() const {
    return impl_->get_config();
}

} // namespace poprelief
