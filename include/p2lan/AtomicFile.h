/**
 * @file AtomicFile.h
 * @brief Helpers for atomic file writes (write temp, then rename).
 */

#pragma once

#include <filesystem>
#include <string>

namespace P2Lan {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;
};

/**
 * @brief Compute the ".part" path next to finalPath.
 *
 * The temp path is derived deterministically from finalPath so an
 * interrupted transfer can be located again and resumed.
 */
AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath);

/**
 * @brief Atomically replace finalPath with tempPath using rename semantics.
 *
 * Requirements:
 * - tempPath must exist as a file.
 * - finalPath must not already exist (callers should choose a unique final name).
 */
bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         std::string& errorMsg);

/**
 * @brief Pick a final path that collides with neither an existing file
 *        nor an existing ".part" file.
 *
 * "report.pdf" becomes "report (1).pdf", "report (2).pdf", ...
 */
std::filesystem::path uniqueFinalPath(const std::filesystem::path& desired);

/**
 * @brief Write text to path via a sibling temp file and rename.
 *
 * Used for config.json and the peer store so a crash never leaves a
 * half-written document behind.
 */
bool writeFileAtomically(const std::filesystem::path& path,
                         const std::string& contents,
                         std::string& errorMsg);

}  // namespace P2Lan
