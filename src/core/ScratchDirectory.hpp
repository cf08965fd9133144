/**
 * @file ScratchDirectory.hpp
 * @brief Per-run directory for downloaded inputs
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
 * @brief Owns a working directory for the lifetime of one run
 *
 * With an empty base, a uniquely named directory is created under the
 * system temp directory and removed on destruction unless kept. A caller
 * supplied base is created if needed and never removed.
 */
class ScratchDirectory {
public:
    /**
     * @param base Directory to use, or empty for a fresh temp directory
     * @param keep Leave the directory in place on destruction
     * @throws std::filesystem::filesystem_error if it cannot be created
     */
    explicit ScratchDirectory(const std::string& base = "", bool keep = false);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path file(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
    bool owned_ = false;
    bool keep_ = false;
    Logger logger_{"ScratchDirectory"};
};

} // namespace poprelief
