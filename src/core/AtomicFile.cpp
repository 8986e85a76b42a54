/**
 * @file AtomicFile.cpp
 * @brief Atomic file helpers implementation.
 */

#include "peerdrop/AtomicFile.h"

#include <fstream>

namespace PeerDrop {

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
                         bool overwrite,
                         std::string& errorMsg)
{
    errorMsg.clear();

    std::error_code ec;
    if (!std::filesystem::exists(tempPath, ec) || ec) {
        errorMsg = "Temp file does not exist";
        return false;
    }

    if (!overwrite && std::filesystem::exists(finalPath, ec)) {
        errorMsg = "Final file already exists";
        return false;
    }

    // rename() replaces an existing target atomically on POSIX
    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        return false;
    }

    return true;
}

bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const uint8_t* data,
                         size_t size,
                         bool overwrite,
                         std::string& errorMsg)
{
    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath);
    std::error_code ec;

    {
        std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            errorMsg = "Failed to create temp file: " + paths.tempPath.string();
            return false;
        }
        if (size > 0) {
            out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        }
        out.flush();
        if (!out) {
            errorMsg = "Failed to write temp file: " + paths.tempPath.string();
            out.close();
            std::filesystem::remove(paths.tempPath, ec);
            return false;
        }
    }

    if (!atomicRenameToFinal(paths.tempPath, paths.finalPath, overwrite, errorMsg)) {
        std::filesystem::remove(paths.tempPath, ec);
        return false;
    }
    return true;
}

bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& text,
                         bool overwrite,
                         std::string& errorMsg)
{
    return writeFileAtomically(finalPath,
                               reinterpret_cast<const uint8_t*>(text.data()),
                               text.size(),
                               overwrite,
                               errorMsg);
}

std::filesystem::path uniqueFilePath(const std::filesystem::path& directory,
                                     const std::string& filename)
{
    std::filesystem::path fullPath = directory / filename;

    std::string name = filename;
    std::string ext;
    size_t dotPos = filename.find_last_of('.');
    if (dotPos != std::string::npos && dotPos > 0) {
        name = filename.substr(0, dotPos);
        ext = filename.substr(dotPos);
    }

    std::error_code ec;
    int counter = 1;
    while (std::filesystem::exists(fullPath, ec)) {
        fullPath = directory / (name + " (" + std::to_string(counter) + ")" + ext);
        counter++;
    }

    return fullPath;
}

}  // namespace PeerDrop
