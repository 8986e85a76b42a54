/**
 * @file peerdrop.cpp
 * @brief Interactive CLI for direct LAN file transfers
 *
 * Usage:
 *   peerdrop [settings.json]
 *
 * Commands:
 *   offer                     print an offer code for the other device
 *   accept <code>             answer a code from the other device
 *   complete <code>           apply the answer to our offer
 *   peers                     list peers
 *   send <peerId> <path>...   send files in order
 *   disconnect                close every connection
 *   quit
 */

#include "peerdrop/EngineSettings.h"
#include "peerdrop/OfflineStore.h"
#include "peerdrop/ReceivedFileSaver.h"
#include "peerdrop/RtcTransport.h"
#include "peerdrop/ThreadSafeLog.h"
#include "peerdrop/TransferEngine.h"
#include "peerdrop/config.h"

#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

using namespace PeerDrop;

// Global flag for graceful shutdown
static volatile std::sig_atomic_t g_running = 1;

// Keeps event output from different threads on separate lines
static std::mutex g_consoleMutex;

/**
 * @brief Signal handler for Ctrl+C
 */
void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

/**
 * @brief Print usage information
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [settings.json]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  offer                    Create an offer code\n";
    std::cout << "  accept <code>            Answer an offer code\n";
    std::cout << "  complete <code>          Apply an answer code\n";
    std::cout << "  peers                    List peers\n";
    std::cout << "  send <peerId> <path>...  Send files\n";
    std::cout << "  disconnect               Close every connection\n";
    std::cout << "  quit\n";
}

/**
 * @brief Format bytes to human-readable string
 */
std::string formatBytes(uint64_t bytes) {
    const double KB = 1024.0;
    const double MB = 1024.0 * 1024.0;
    const double GB = 1024.0 * 1024.0 * 1024.0;

    std::ostringstream oss;
    if (bytes >= GB) {
        oss << std::fixed << std::setprecision(2) << (bytes / GB) << " GB";
    } else if (bytes >= MB) {
        oss << std::fixed << std::setprecision(2) << (bytes / MB) << " MB";
    } else if (bytes >= KB) {
        oss << std::fixed << std::setprecision(2) << (bytes / KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

void connectEvents(TransferEngine& engine, ReceivedFileSaver& saver)
{
    engine.events().peerConnected().connect([](const PeerConnectedEvent& e) {
        std::lock_guard<std::mutex> lock(g_consoleMutex);
        std::cout << "\n[+] Connected: " << e.peer.displayName << " (" << e.peer.id << ")\n> " << std::flush;
    });

    engine.events().peerDisconnected().connect([](const PeerDisconnectedEvent& e) {
        std::lock_guard<std::mutex> lock(g_consoleMutex);
        std::cout << "\n[-] Disconnected: " << e.displayName << " (" << e.peerId << ")\n> " << std::flush;
    });

    engine.events().transferProgress().connect([](const TransferProgressEvent& e) {
        std::lock_guard<std::mutex> lock(g_consoleMutex);
        std::cout << "\r" << (e.direction == TransferDirection::Outgoing ? "Sending " : "Receiving ")
                  << e.filename << ": " << formatBytes(e.bytesTransferred) << " / "
                  << formatBytes(e.totalBytes) << " (" << std::fixed << std::setprecision(1)
                  << e.percentage() << "%)   " << std::flush;
    });

    // Runs on the transport thread: hand the file to the saver and return
    engine.events().fileReceived().connect([&saver](const FileReceivedEvent& e) {
        if (!saver.enqueue(e)) {
            std::lock_guard<std::mutex> lock(g_consoleMutex);
            std::cerr << "\nError: dropped " << e.file.name << ", saver is stopped\n> " << std::flush;
        }
    });

    saver.setCompletionCallback([](const SaveResult& r) {
        std::lock_guard<std::mutex> lock(g_consoleMutex);
        if (!r.success) {
            std::cerr << "\nError: failed to save " << r.filename << ": " << r.errorMsg << "\n> " << std::flush;
            return;
        }
        if (!r.cacheError.empty()) {
            std::cerr << "\nWarning: offline cache: " << r.cacheError << "\n";
        }
        std::cout << "\n[v] Received " << r.filename << " (" << formatBytes(r.size)
                  << ") from " << r.fromPeerDisplayName << " -> " << r.savedPath.string()
                  << "\n    SHA-256: " << r.sha256Hex << "\n> " << std::flush;
    });
}

void printPeers(const TransferEngine& engine)
{
    std::vector<PeerInfo> peers = engine.getPeers();
    std::lock_guard<std::mutex> lock(g_consoleMutex);
    if (peers.empty()) {
        std::cout << "No peers\n";
        return;
    }
    std::cout << std::left << std::setw(28) << "ID" << std::setw(24) << "NAME"
              << std::setw(12) << "STATE" << "RECEIVING\n";
    for (const auto& peer : peers) {
        const uint64_t incoming = engine.incomingBytes(peer.id);
        std::cout << std::left << std::setw(28) << peer.id << std::setw(24) << peer.displayName
                  << std::setw(12) << peerStateToString(peer.state)
                  << (incoming > 0 ? formatBytes(incoming) : "-") << "\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))) {
        printUsage(argv[0]);
        return argc > 2 ? 1 : 0;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    EngineSettings settings;
    std::string error;
    if (argc == 2 && !EngineSettings::load(argv[1], settings, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    if (!settings.logPath.empty() &&
        !ThreadSafeLog::initialize(settings.logPath, settings.displayName, error)) {
        std::cerr << "Warning: " << error << " (diagnostics log disabled)\n";
    }

    const std::filesystem::path downloadDir =
        settings.downloadDir.empty() ? std::filesystem::current_path() : std::filesystem::path(settings.downloadDir);

    std::unique_ptr<OfflineStore> store;
    if (!settings.offlineStoreDir.empty()) {
        store = std::make_unique<OfflineStore>(settings.offlineStoreDir);
        if (!store->initialize(error)) {
            std::cerr << "Warning: " << error << " (offline cache disabled)\n";
            store.reset();
        }
    }

    ReceivedFileSaver saver(downloadDir, store.get());
    TransferEngine engine(std::make_shared<RtcTransportFactory>(), settings);
    connectEvents(engine, saver);
    saver.start();

    std::cout << "PeerDrop " << engine.localDisplayName() << " (" << engine.localPeerId() << ")\n";
    std::cout << "Saving received files to " << downloadDir.string() << "\n";
    const std::filesystem::path logPath = ThreadSafeLog::logPath();
    if (!logPath.empty()) {
        std::cout << "Diagnostics log: " << logPath.string() << "\n";
    }
    std::cout << "Type 'help' for commands.\n";

    std::string line;
    while (g_running) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        if (command.empty()) {
            continue;
        } else if (command == "help") {
            printUsage(argv[0]);
        } else if (command == "offer") {
            std::string code;
            if (engine.createOffer(code, error)) {
                std::cout << "Give this code to the other device:\n\n" << code << "\n\n";
            } else {
                std::cerr << "Error: " << error << "\n";
            }
        } else if (command == "accept" || command == "complete") {
            std::string code;
            iss >> code;
            if (code.empty()) {
                std::cerr << "Usage: " << command << " <code>\n";
                continue;
            }
            if (command == "accept") {
                std::string answer;
                if (engine.acceptOffer(code, answer, error)) {
                    std::cout << "Give this answer to the other device:\n\n" << answer << "\n\n";
                } else {
                    std::cerr << "Error: " << error << "\n";
                }
            } else if (engine.completeConnection(code, error)) {
                std::cout << "Answer applied, waiting for the channel to open\n";
            } else {
                std::cerr << "Error: " << error << "\n";
            }
        } else if (command == "peers") {
            printPeers(engine);
        } else if (command == "send") {
            std::string peerId;
            iss >> peerId;
            std::vector<std::string> paths;
            std::string path;
            while (iss >> path) {
                paths.push_back(path);
            }
            if (peerId.empty() || paths.empty()) {
                std::cerr << "Usage: send <peerId> <path>...\n";
                continue;
            }
            size_t sent = 0;
            bool ok = engine.sendFiles(peerId, paths, sent, error);
            std::cout << "\nSent " << sent << " of " << paths.size() << " file(s)\n";
            if (!ok) {
                std::cerr << "Error: " << error << "\n";
            }
        } else if (command == "disconnect") {
            engine.disconnect();
        } else if (command == "quit" || command == "exit") {
            break;
        } else {
            std::cerr << "Unknown command: " << command << "\n";
        }
    }

    engine.disconnect();
    saver.stop();
    ThreadSafeLog::shutdown();
    return 0;
}
