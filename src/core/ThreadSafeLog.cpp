/**
 * @file ThreadSafeLog.cpp
 * @brief Diagnostics file shared by negotiation, transfer and storage code
 *
 * (c) 2026 PeerDrop Project
 * Licensed under MIT License
 */

#include "peerdrop/ThreadSafeLog.h"
#include "peerdrop/ErrorCodes.h"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>

namespace PeerDrop {

// Static member definitions
std::mutex ThreadSafeLog::s_mutex;
std::filesystem::path ThreadSafeLog::s_logPath;

bool ThreadSafeLog::initialize(const std::filesystem::path& logPath,
                               const std::string& sessionLabel,
                               std::string& errorMsg) {
    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    {
        std::ofstream writable(logPath, std::ios::app);
        if (!writable.is_open()) {
            errorMsg = formatError(ErrorCodes::CONFIG_ERROR,
                                   "Cannot open diagnostics log: " + logPath.string());
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_logPath.empty() && s_logPath != logPath) {
        appendLine("==== session moved to " + logPath.string() + " ====");
    }
    s_logPath = logPath;
    appendLine("==== " + sessionLabel + " session started ====");
    return true;
}

void ThreadSafeLog::shutdown() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_logPath.empty()) {
        return;
    }
    appendLine("==== session ended ====");
    s_logPath.clear();
}

std::filesystem::path ThreadSafeLog::logPath() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_logPath;
}

void ThreadSafeLog::log(const std::string& message) {
    std::lock_guard<std::mutex> lock(s_mutex);
    appendLine(message);
}

void ThreadSafeLog::log(const char* message) {
    log(std::string(message ? message : ""));
}

void ThreadSafeLog::appendLine(const std::string& message) {
    if (s_logPath.empty()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto now_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << " [" << std::this_thread::get_id() << "] " << message << "\n";

    std::ofstream file(s_logPath, std::ios::app);
    if (file.is_open()) {
        file << oss.str();
        file.flush();
    }
}

} // namespace PeerDrop
