/**
 * @file EngineSettings.h
 * @brief Runtime settings persisted as JSON
 */

#pragma once

#include "config.h"
#include "FileTransfer.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace PeerDrop {

/**
 * @brief Runtime-tunable engine settings
 *
 * Defaults come from config.h. Keys missing from a settings file keep their
 * defaults; keys present with the wrong type or an invalid value fail the
 * load with ConfigError.
 *
 * JSON keys: displayName, frameSize, highWaterMark, backpressurePollMs,
 * negotiationTimeoutMs, logPath, downloadDir, offlineStoreDir.
 */
struct EngineSettings {
    std::string displayName = DEFAULT_DISPLAY_NAME;
    size_t frameSize = FRAME_SIZE;
    size_t highWaterMark = HIGH_WATER_MARK;
    uint32_t backpressurePollMs = BACKPRESSURE_POLL_INTERVAL_MS;
    uint32_t negotiationTimeoutMs = NEGOTIATION_TIMEOUT_MS;
    std::string logPath;
    std::string downloadDir;
    std::string offlineStoreDir;

    /**
     * @brief Check value ranges
     * @return false with a "[PD-CFG-4001] ..." message on the first violation
     */
    bool validate(std::string& errorMsg) const;

    SendOptions sendOptions() const;

    std::chrono::milliseconds negotiationTimeout() const {
        return std::chrono::milliseconds(negotiationTimeoutMs);
    }

    nlohmann::json toJson() const;

    /**
     * @brief Overlay keys present in j onto out, then validate
     */
    static bool fromJson(const nlohmann::json& j, EngineSettings& out, std::string& errorMsg);

    /**
     * @brief Load from a JSON file
     *
     * A missing file is not an error: out keeps its defaults.
     */
    static bool load(const std::filesystem::path& path, EngineSettings& out, std::string& errorMsg);

    /**
     * @brief Save to a JSON file (temp file then rename)
     */
    bool save(const std::filesystem::path& path, std::string& errorMsg) const;
};

}  // namespace PeerDrop
