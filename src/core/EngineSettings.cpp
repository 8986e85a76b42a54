/**
 * @file EngineSettings.cpp
 * @brief Runtime settings persisted as JSON
 */

#include "peerdrop/EngineSettings.h"
#include "peerdrop/AtomicFile.h"
#include "peerdrop/ErrorCodes.h"

#include <fstream>

namespace PeerDrop {

namespace {

bool readString(const nlohmann::json& j, const char* key, std::string& out, std::string& errorMsg)
{
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_string()) {
        errorMsg = formatError(ErrorCodes::CONFIG_ERROR, std::string("'") + key + "' must be a string");
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

template <typename T>
bool readUnsigned(const nlohmann::json& j, const char* key, T& out, std::string& errorMsg)
{
    if (!j.contains(key)) {
        return true;
    }
    const nlohmann::json& value = j[key];
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
        errorMsg = formatError(ErrorCodes::CONFIG_ERROR,
                               std::string("'") + key + "' must be a non-negative integer");
        return false;
    }
    out = value.get<T>();
    return true;
}

}  // namespace

bool EngineSettings::validate(std::string& errorMsg) const
{
    if (frameSize == 0 || frameSize > MAX_FRAME_SIZE) {
        errorMsg = formatError(ErrorCodes::CONFIG_ERROR,
                               "frameSize must be between 1 and " + std::to_string(MAX_FRAME_SIZE));
        return false;
    }
    if (highWaterMark < frameSize) {
        errorMsg = formatError(ErrorCodes::CONFIG_ERROR,
                               "highWaterMark must not be smaller than frameSize");
        return false;
    }
    if (backpressurePollMs == 0) {
        errorMsg = formatError(ErrorCodes::CONFIG_ERROR, "backpressurePollMs must be positive");
        return false;
    }
    if (negotiationTimeoutMs == 0) {
        errorMsg = formatError(ErrorCodes::CONFIG_ERROR, "negotiationTimeoutMs must be positive");
        return false;
    }
    return true;
}

SendOptions EngineSettings::sendOptions() const
{
    SendOptions options;
    options.frameSize = frameSize;
    options.highWaterMark = highWaterMark;
    options.pollInterval = std::chrono::milliseconds(backpressurePollMs);
    return options;
}

nlohmann::json EngineSettings::toJson() const
{
    nlohmann::json out = nlohmann::json::object();
    out["displayName"] = displayName;
    out["frameSize"] = frameSize;
    out["highWaterMark"] = highWaterMark;
    out["backpressurePollMs"] = backpressurePollMs;
    out["negotiationTimeoutMs"] = negotiationTimeoutMs;
    out["logPath"] = logPath;
    out["downloadDir"] = downloadDir;
    out["offlineStoreDir"] = offlineStoreDir;
    return out;
}

bool EngineSettings::fromJson(const nlohmann::json& j, EngineSettings& out, std::string& errorMsg)
{
    if (!j.is_object()) {
        errorMsg = formatError(ErrorCodes::CONFIG_ERROR, "Settings must be a JSON object");
        return false;
    }

    EngineSettings s = out;
    if (!readString(j, "displayName", s.displayName, errorMsg) ||
        !readUnsigned(j, "frameSize", s.frameSize, errorMsg) ||
        !readUnsigned(j, "highWaterMark", s.highWaterMark, errorMsg) ||
        !readUnsigned(j, "backpressurePollMs", s.backpressurePollMs, errorMsg) ||
        !readUnsigned(j, "negotiationTimeoutMs", s.negotiationTimeoutMs, errorMsg) ||
        !readString(j, "logPath", s.logPath, errorMsg) ||
        !readString(j, "downloadDir", s.downloadDir, errorMsg) ||
        !readString(j, "offlineStoreDir", s.offlineStoreDir, errorMsg)) {
        return false;
    }

    if (s.displayName.empty()) {
        s.displayName = DEFAULT_DISPLAY_NAME;
    }

    if (!s.validate(errorMsg)) {
        return false;
    }

    out = std::move(s);
    return true;
}

bool EngineSettings::load(const std::filesystem::path& path, EngineSettings& out, std::string& errorMsg)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return true;
    }

    std::ifstream in(path);
    if (!in) {
        errorMsg = formatError(ErrorCodes::CONFIG_ERROR, "Failed to open settings file: " + path.string());
        return false;
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        errorMsg = formatError(ErrorCodes::CONFIG_ERROR, "Settings file is not valid JSON: " + path.string());
        return false;
    }

    return fromJson(j, out, errorMsg);
}

bool EngineSettings::save(const std::filesystem::path& path, std::string& errorMsg) const
{
    if (!validate(errorMsg)) {
        return false;
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::string writeError;
    if (!writeFileAtomically(path, toJson().dump(4), true, writeError)) {
        errorMsg = formatError(ErrorCodes::CONFIG_ERROR, "Failed to save settings: " + writeError);
        return false;
    }
    return true;
}

}  // namespace PeerDrop
