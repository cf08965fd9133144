/**
 * @file ScratchDirectory.cpp
 * @brief Per-run directory for downloaded inputs
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ScratchDirectory.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace poprelief {

namespace {

std::filesystem::path unique_temp_path() {
    std::random_device rd;
    std::mt19937_64 rng(rd() ^ static_cast<uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count()));

    auto tmp = std::filesystem::temp_directory_path();
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::ostringstream name;
        name << "poprelief-" << ::getpid() << "-" << std::hex << (rng() & 0xffffffULL);
        auto candidate = tmp / name.str();
        if (!std::filesystem::exists(candidate)) {
            return candidate;
        }
    }
    throw std::filesystem::filesystem_error("no free scratch directory name", tmp,
                                            std::make_error_code(std::errc::file_exists));
}

} // namespace

ScratchDirectory::ScratchDirectory(const std::string& base, bool keep) : keep_(keep) {
    if (base.empty()) {
        path_ = unique_temp_path();
        owned_ = true;
    } else {
        path_ = std::filesystem::path(base);
    }
    std::filesystem::create_directories(path_);
    logger_.detailed("Scratch directory: " + path_.string());
}

ScratchDirectory::~ScratchDirectory() {
    if (!owned_ || keep_) {
        if (keep_) {
            logger_.info("Keeping downloads in " + path_.string());
        }
        return;
    }

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        logger_.warning("Failed to remove scratch directory " + path_.string() + ": " + ec.message());
    }
}

} // namespace poprelief
