/**
 * @file AtomicFile.cpp
 * @brief Atomic file helpers implementation.
 */

#include "p2lan/AtomicFile.h"

#include <fstream>
#include <functional>

namespace P2Lan {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath)
{
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += ".part";
    return out;
}

bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         std::string& errorMsg)
{
    errorMsg.clear();

    std::error_code ec;
    if (!std::filesystem::exists(tempPath, ec) || ec) {
        errorMsg = "Temp file does not exist";
        return false;
    }

    if (std::filesystem::exists(finalPath, ec)) {
        errorMsg = "Final file already exists";
        return false;
    }

    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        return false;
    }

    return true;
}

std::filesystem::path uniqueFinalPath(const std::filesystem::path& desired)
{
    auto isTaken = [](const std::filesystem::path& p) {
        std::error_code ec;
        return std::filesystem::exists(p, ec) ||
               std::filesystem::exists(computeAtomicFilePaths(p).tempPath, ec);
    };

    if (!isTaken(desired)) {
        return desired;
    }

    const auto parent = desired.parent_path();
    const std::string stem = desired.stem().string();
    const std::string ext = desired.extension().string();

    for (int i = 1; i < 10000; ++i) {
        auto candidate = parent / (stem + " (" + std::to_string(i) + ")" + ext);
        if (!isTaken(candidate)) {
            return candidate;
        }
    }

    // Fall back to a name that is practically never taken
    return parent / (stem + " (" + std::to_string(std::hash<std::string>{}(desired.string())) + ")" + ext);
}

bool writeFileAtomically(const std::filesystem::path& path,
                         const std::string& contents,
                         std::string& errorMsg)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            errorMsg = "Cannot create directory " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::filesystem::path tempPath = path;
    tempPath += ".tmp";

    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            errorMsg = "Cannot open " + tempPath.string() + " for writing";
            return false;
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            errorMsg = "Write failed for " + tempPath.string();
            out.close();
            std::filesystem::remove(tempPath, ec);
            return false;
        }
    }

    // rename() replaces the destination atomically on POSIX
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        errorMsg = "rename failed: " + ec.message();
        std::error_code rmEc;
        std::filesystem::remove(tempPath, rmEc);
        return false;
    }

    return true;
}

}  // namespace P2Lan
