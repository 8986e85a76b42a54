/**
 * @file AtomicFile.h
 * @brief Small helpers for atomic file writes (write temp, then rename).
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace PeerDrop {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;
};

/**
 * @brief Compute a temp path next to finalPath for atomic writes.
 *
 * The temp path is derived deterministically from finalPath so callers can
 * clean up partial files on error.
 */
AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath);

/**
 * @brief Atomically move tempPath to finalPath using rename semantics.
 *
 * Requirements:
 * - tempPath must exist as a file.
 * - Unless overwrite is set, finalPath must not already exist (callers
 *   should choose a unique final name).
 */
bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         bool overwrite,
                         std::string& errorMsg);

/**
 * @brief Write bytes to finalPath through a temp file
 *
 * On failure the temp file is removed and finalPath is left untouched.
 */
bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const uint8_t* data,
                         size_t size,
                         bool overwrite,
                         std::string& errorMsg);

/**
 * @brief Convenience overload for text content (JSON index files, settings)
 */
bool writeFileAtomically(const std::filesystem::path& finalPath,
                         const std::string& text,
                         bool overwrite,
                         std::string& errorMsg);

/**
 * @brief Pick a name in directory that does not exist yet
 *
 * "photo.jpg" becomes "photo (1).jpg", "photo (2).jpg", ... on collision.
 */
std::filesystem::path uniqueFilePath(const std::filesystem::path& directory,
                                     const std::string& filename);

}  // namespace PeerDrop
