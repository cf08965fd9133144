/**
 * @file HttpClient.cpp
 * @brief libcurl file downloads
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "HttpClient.hpp"
#include <cstdio>
#include <curl/curl.h>
#include <mutex>
#include <system_error>

namespace poprelief {

namespace {

size_t write_file_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    return std::fwrite(contents, size, nmemb, static_cast<FILE*>(userp));
}

void ensure_curl_initialized() {
    static std::once_flag curl_once;
    std::call_once(curl_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Partial downloads only; device paths are left alone
void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
        std::filesystem::remove(path, ec);
    }
}

} // namespace

HttpClient::HttpClient() : config_() {
    ensure_curl_initialized();
}

HttpClient::HttpClient(const Config& config) : config_(config) {
    ensure_curl_initialized();
}

bool HttpClient::download_file(const std::string& url, const std::filesystem::path& output_path) const {
    logger_.detailed("GET " + url);

    if (output_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(output_path.parent_path(), ec);
        if (ec) {
            logger_.error("Cannot create directory " + output_path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        logger_.error("Failed to initialize curl");
        return false;
    }

    FILE* fp = std::fopen(output_path.string().c_str(), "wb");
    if (!fp) {
        logger_.error("Failed to open output file: " + output_path.string());
        curl_easy_cleanup(curl);
        return false;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_file_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, fp);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

    CURLcode res = curl_easy_perform(curl);

    long response_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

    bool flushed = std::fclose(fp) == 0;
    curl_easy_cleanup(curl);

    if (!flushed) {
        logger_.error("Failed to write " + output_path.string() + " for URL: " + url);
        remove_quietly(output_path);
        return false;
    }

    if (res != CURLE_OK) {
        logger_.error("Download failed for " + url + ": " + std::string(curl_easy_strerror(res)));
        remove_quietly(output_path);
        return false;
    }

    if (response_code < 200 || response_code >= 300) {
        logger_.error("HTTP error " + std::to_string(response_code) + " for URL: " + url);
        remove_quietly(output_path);
        return false;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(output_path, ec);
    if (ec || size == 0) {
        logger_.error("Empty response body for URL: " + url);
        remove_quietly(output_path);
        return false;
    }

    logger_.debug("Downloaded " + std::to_string(size) + " bytes to " + output_path.string());
    return true;
}

bool HttpClient::fetch_to(const std::string& url, const std::filesystem::path& output_path) const {
    std::error_code ec;
    if (std::filesystem::is_regular_file(output_path, ec) &&
        std::filesystem::file_size(output_path, ec) > 0 && !ec) {
        logger_.debug("Reusing " + output_path.string());
        return true;
    }
    return download_file(url, output_path);
}

} // namespace poprelief
