/**
 * @file HttpClient.hpp
 * @brief Blocking single-attempt HTTP downloads
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Logger.hpp"
#include <filesystem>
#include <string>

namespace poprelief {

/**
 * @brief Downloads remote files to disk with libcurl
 *
 * One request per call, no retries. A failed or non-2xx transfer removes
 * the partial file and returns false.
 */
class HttpClient {
public:
    struct Config {
        int timeout_seconds = 120;
        int connect_timeout_seconds = 30;
        std::string user_agent = "PopRelief/1.0";
    };

    HttpClient();
    explicit HttpClient(const Config& config);

    /**
     * @brief Download url into output_path (overwrites)
     * @return true on HTTP 2xx with a non-empty body
     */
    bool download_file(const std::string& url, const std::filesystem::path& output_path) const;

    /**
     * @brief Download unless output_path already holds a non-empty file
     */
    bool fetch_to(const std::string& url, const std::filesystem::path& output_path) const;

    const Config& config() const { return config_; }

private:
    Config config_;
    Logger logger_{"HttpClient"};
};

} // namespace poprelief
