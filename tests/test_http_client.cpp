/**
 * @file test_http_client.cpp
 * @brief Download failure handling and scratch reuse
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <doctest/doctest.h>

#include "core/HttpClient.hpp"
#include "core/Logger.hpp"
#include "core/ScratchDirectory.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace poprelief;

namespace {

const char* MISSING_URL = "file:///nonexistent/poprelief/input.tif";

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("download_file overwrites an existing file") {
    ScratchDirectory scratch;
    auto target = scratch.file("input.tif");
    write_text(target, "stale");

    HttpClient http;
    CHECK_FALSE(http.download_file(MISSING_URL, target));
    CHECK_FALSE(std::filesystem::exists(target));
}

TEST_CASE("fetch_to reuses a non-empty file") {
    ScratchDirectory scratch;
    auto target = scratch.file("gadm41_CHE_0.json");
    write_text(target, "{}");

    HttpClient http;
    CHECK(http.fetch_to(MISSING_URL, target));
    CHECK(read_text(target) == "{}");

    // An empty leftover is fetched again
    auto empty = scratch.file("empty.json");
    write_text(empty, "");
    CHECK_FALSE(http.fetch_to(MISSING_URL, empty));
    CHECK_FALSE(std::filesystem::exists(empty));
}

TEST_CASE("A failed close fails the download") {
    const std::filesystem::path full_device("/dev/full");
    if (!std::filesystem::exists(full_device)) {
        return;
    }

    ScratchDirectory scratch;
    auto source = scratch.file("source.txt");
    write_text(source, "elevation tile bytes");
    auto log_path = scratch.file("http.log");

    Logger::setDefaultLogFile(log_path.string());
    {
        HttpClient http;
        // Buffered writes succeed; the flush on close reports ENOSPC
        CHECK_FALSE(http.download_file("file://" + source.string(), full_device));
    }
    Logger::setDefaultLogFile(std::nullopt);

    CHECK(std::filesystem::exists(full_device));
    CHECK(read_text(log_path).find("Failed to write /dev/full") != std::string::npos);
}
