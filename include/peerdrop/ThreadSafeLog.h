/**
 * @file ThreadSafeLog.h
 * @brief Diagnostics file shared by negotiation, transfer and storage code
 *
 * (c) 2026 PeerDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace PeerDrop {

/**
 * @brief Append-only diagnostics log, one session per initialize()/shutdown()
 *
 * Transport callbacks, the caller's thread and the CLI save worker all write
 * here, so every line is appended under one global mutex. Lines carry a
 * millisecond timestamp and the writing thread's id:
 *
 *   2026-10-18 09:14:03.512 [139872] Peer connected: Bob (peer_...)
 *
 * initialize() opens a session with a header line naming the device;
 * shutdown() closes it with a footer line. Outside a session log() does
 * nothing, so library code can log unconditionally.
 *
 * Note: initialize() should be called before any transport is created.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Start a session in the given file
     * @param logPath File to append to; parent directories are created
     * @param sessionLabel Written in the session header (usually the device name)
     * @param errorMsg Output: error description if the file cannot be opened
     * @return false if the file is not writable; no session is started then
     */
    static bool initialize(const std::filesystem::path& logPath,
                           const std::string& sessionLabel,
                           std::string& errorMsg);

    /**
     * @brief Write the session footer and stop logging
     */
    static void shutdown();

    /**
     * @brief File of the current session (empty outside a session)
     */
    static std::filesystem::path logPath();

    /**
     * @brief Append one line
     *
     * Thread-safe: locks the global mutex before writing.
     */
    static void log(const std::string& message);

    /**
     * @brief Log a const char* message
     *
     * This overload prevents ambiguity when passing string literals.
     */
    static void log(const char* message);

private:
    static void appendLine(const std::string& message);  // s_mutex held

    /// Global mutex for synchronizing file access across all threads
    static std::mutex s_mutex;

    /// Log file path (set by initialize(), cleared by shutdown())
    static std::filesystem::path s_logPath;
};

} // namespace PeerDrop
