/**
 * @file p2lan_node.cpp
 * @brief Interactive command-line front end for P2LanService
 *
 * Prints service events as they arrive and maps typed lines onto
 * Command values.
 */

#include "p2lan/P2LanService.h"
#include "p2lan/config.h"

#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::atomic<bool> g_running(true);
std::mutex g_outputMutex;

/**
 * @brief Signal handler for Ctrl+C
 */
void signalHandler(int signal) {
    if (signal == SIGINT) {
        g_running = false;
    }
}

std::vector<std::string> splitWords(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

bool hasFlag(const std::vector<std::string>& words, size_t from, const char* flag) {
    for (size_t i = from; i < words.size(); ++i) {
        if (words[i] == flag) {
            return true;
        }
    }
    return false;
}

/**
 * @brief One-line rendering of a service event
 */
std::string describeEvent(const P2Lan::ServiceEvent& event) {
    using namespace P2Lan;
    std::ostringstream oss;
    oss << eventName(event);

    if (const auto* e = std::get_if<PeerUpdated>(&event)) {
        oss << " " << e->peer.displayName << " (" << e->peer.id << ") "
            << connectionStatusToString(e->peer.connectionStatus);
    } else if (const auto* e = std::get_if<PeerDisconnected>(&event)) {
        oss << " " << e->peerId << ": " << e->reason;
    } else if (const auto* e = std::get_if<PairingRequestReceived>(&event)) {
        oss << " " << e->requestId << " from " << e->displayName << " (" << e->peerId << ")";
    } else if (const auto* e = std::get_if<PairingCompleted>(&event)) {
        oss << " " << e->peerId << (e->trusted ? " trusted" : "") << (e->saved ? " saved" : "");
    } else if (const auto* e = std::get_if<PairingRejected>(&event)) {
        oss << " " << e->requestId << ": " << e->reason;
    } else if (const auto* e = std::get_if<FileTransferRequestReceived>(&event)) {
        oss << " " << e->requestId << " from " << e->senderName << ": " << e->fileCount
            << " file(s), " << e->totalSize << " bytes";
    } else if (const auto* e = std::get_if<TransferStatusChanged>(&event)) {
        oss << " " << e->taskId << " -> " << transferStatusToString(e->status);
        if (!e->errorMessage.empty()) {
            oss << " (" << e->errorMessage << ")";
        }
    } else if (const auto* e = std::get_if<RemoteControlRequestReceived>(&event)) {
        oss << " " << e->requestId << " from " << e->peerName;
    } else if (const auto* e = std::get_if<ScreenSharingRequestReceived>(&event)) {
        oss << " " << e->requestId << " from " << e->peerName << " quality " << e->quality;
    } else if (const auto* e = std::get_if<NetworkStateChanged>(&event)) {
        oss << " " << networkStateToString(e->state);
        if (!e->detail.empty()) {
            oss << " (" << e->detail << ")";
        }
    } else if (const auto* e = std::get_if<ServiceError>(&event)) {
        oss << " [" << e->component << "] " << e->errorCode << " " << e->message;
    }
    return oss.str();
}

void printPeers(const P2Lan::P2LanService& service) {
    const auto peers = service.peers();
    const int idWidth = 38;
    const int nameWidth = 20;
    const int ipWidth = 16;

    std::cout << "\n  " << std::left
              << std::setw(idWidth) << "Id"
              << std::setw(nameWidth) << "Display Name"
              << std::setw(ipWidth) << "IP Address"
              << "Flags\n";
    std::cout << "  " << std::string(idWidth + nameWidth + ipWidth + 24, '-') << "\n";

    for (const auto& peer : peers) {
        std::string flags;
        if (peer.isOnline) flags += "online ";
        if (peer.isPaired) flags += "paired ";
        if (peer.isTrusted) flags += "trusted ";
        if (peer.isStored) flags += "saved ";
        if (peer.isBlocked) flags += "blocked ";
        std::cout << "  " << std::left
                  << std::setw(idWidth) << peer.id
                  << std::setw(nameWidth) << peer.displayName.substr(0, nameWidth - 1)
                  << std::setw(ipWidth) << peer.ipAddress
                  << flags << "\n";
    }
    if (peers.empty()) {
        std::cout << "  No peers known yet.\n";
    }
}

void printTransfers(const P2Lan::P2LanService& service) {
    for (const auto& task : service.transfers()) {
        std::cout << "  " << task.id << "  " << task.fileName << "  "
                  << P2Lan::transferStatusToString(task.status) << "  "
                  << task.transferredBytes << "/" << task.fileSize << "\n";
    }
}

void printHelp() {
    std::cout <<
        "Commands:\n"
        "  start | stop | scan | connect <ip> | peers | transfers\n"
        "  pair <id> [trust] [save]\n"
        "  accept-pair <reqId> [trust] [save] | reject-pair <reqId>\n"
        "  send <id> <path...>\n"
        "  accept-files <reqId> | reject-files <reqId>\n"
        "  cancel <taskId> | pause <taskId> | resume <taskId>\n"
        "  control <id> | accept-control <reqId> | reject-control <reqId> | end-control\n"
        "  share <id> [low|medium|high|auto] | accept-share <reqId> | reject-share <reqId> | end-share\n"
        "  block <id> | unblock <id> | trust <id> | untrust <id> | unpair <id>\n"
        "  quit\n";
}

/**
 * @brief Map one input line onto a Command
 * @return false if the line is not a command
 */
bool parseCommand(const std::vector<std::string>& w, P2Lan::Command& out, std::string& errorMsg) {
    using namespace P2Lan;
    const std::string& verb = w[0];
    auto need = [&](size_t count) {
        if (w.size() < count) {
            errorMsg = "Missing argument for '" + verb + "'";
            return false;
        }
        return true;
    };

    if (verb == "start") { out = StartNetworking{}; return true; }
    if (verb == "stop") { out = StopNetworking{}; return true; }
    if (verb == "scan") { out = ManualDiscovery{}; return true; }
    if (verb == "connect") {
        if (!need(2)) return false;
        out = ConnectToAddress{w[1]};
        return true;
    }
    if (verb == "pair") {
        if (!need(2)) return false;
        out = SendPairingRequest{w[1], hasFlag(w, 2, "trust"), hasFlag(w, 2, "save")};
        return true;
    }
    if (verb == "accept-pair" || verb == "reject-pair") {
        if (!need(2)) return false;
        out = RespondToPairingRequest{w[1], verb == "accept-pair", hasFlag(w, 2, "trust"), hasFlag(w, 2, "save")};
        return true;
    }
    if (verb == "send") {
        if (!need(3)) return false;
        out = SendFilesToUser{w[1], std::vector<std::string>(w.begin() + 2, w.end())};
        return true;
    }
    if (verb == "accept-files" || verb == "reject-files") {
        if (!need(2)) return false;
        out = RespondToFileTransferRequest{w[1], verb == "accept-files", {}};
        return true;
    }
    if (verb == "cancel") {
        if (!need(2)) return false;
        out = CancelTransfer{w[1]};
        return true;
    }
    if (verb == "pause") {
        if (!need(2)) return false;
        out = PauseTransfer{w[1]};
        return true;
    }
    if (verb == "resume") {
        if (!need(2)) return false;
        out = ResumeTransfer{w[1]};
        return true;
    }
    if (verb == "control") {
        if (!need(2)) return false;
        out = SendRemoteControlRequest{w[1]};
        return true;
    }
    if (verb == "accept-control" || verb == "reject-control") {
        if (!need(2)) return false;
        out = RespondToRemoteControlRequest{w[1], verb == "accept-control"};
        return true;
    }
    if (verb == "end-control") { out = DisconnectRemoteControl{}; return true; }
    if (verb == "share") {
        if (!need(2)) return false;
        out = SendScreenSharingRequest{w[1], w.size() > 2 ? w[2] : "auto"};
        return true;
    }
    if (verb == "accept-share" || verb == "reject-share") {
        if (!need(2)) return false;
        out = RespondToScreenSharingRequest{w[1], verb == "accept-share"};
        return true;
    }
    if (verb == "end-share") { out = DisconnectScreenSharing{}; return true; }
    if (verb == "block" || verb == "unblock") {
        if (!need(2)) return false;
        out = BlockUser{w[1], verb == "block"};
        return true;
    }
    if (verb == "trust") {
        if (!need(2)) return false;
        out = AddTrust{w[1]};
        return true;
    }
    if (verb == "untrust") {
        if (!need(2)) return false;
        out = RemoveTrust{w[1]};
        return true;
    }
    if (verb == "unpair") {
        if (!need(2)) return false;
        out = UnpairUser{w[1]};
        return true;
    }

    errorMsg = "Unknown command '" + verb + "' (type 'help')";
    return false;
}

}  // namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    P2Lan::ServiceOptions options;
    bool autoStart = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        } else if (arg == "--data" && i + 1 < argc) {
            options.dataDir = argv[++i];
        } else if (arg == "--no-start") {
            autoStart = false;
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n";
            std::cout << "Options:\n";
            std::cout << "  --config <path>  Settings file (default: ~/.config/p2lan/config.json)\n";
            std::cout << "  --data <dir>     Peer store and log directory (default: ~/.local/share/p2lan)\n";
            std::cout << "  --no-start       Do not enable networking at startup\n";
            std::cout << "  --help           Show this help message\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        }
    }

    std::signal(SIGINT, signalHandler);

    P2Lan::P2LanService service(options);
    std::string errorMsg;
    if (!service.initialize(errorMsg)) {
        std::cerr << "Failed to initialize: " << errorMsg << "\n";
        return 1;
    }

    service.events().subscribe([](const P2Lan::ServiceEvent& event) {
        // Progress is too chatty for a console
        if (std::holds_alternative<P2Lan::TransferProgress>(event)) {
            return;
        }
        std::lock_guard<std::mutex> lock(g_outputMutex);
        std::cout << "* " << describeEvent(event) << std::endl;
    });

    const auto identity = service.localIdentity();
    std::cout << "==============================================\n";
    std::cout << "Local UUID: " << identity.id << "\n";
    std::cout << "Local Name: " << identity.displayName << "\n";
    std::cout << "Port range: " << P2Lan::P2P_BASE_PORT << "-" << P2Lan::P2P_MAX_PORT << "\n";
    std::cout << "==============================================\n";
    printHelp();

    if (autoStart) {
        auto result = service.execute(P2Lan::StartNetworking{});
        if (!result) {
            std::cerr << "Networking not started: " << result.message << "\n";
        }
    }

    std::string line;
    while (g_running && std::getline(std::cin, line)) {
        const auto words = splitWords(line);
        if (words.empty()) {
            continue;
        }
        if (words[0] == "quit" || words[0] == "exit") {
            break;
        }
        if (words[0] == "help") {
            printHelp();
            continue;
        }

        if (words[0] == "peers" || words[0] == "transfers") {
            std::lock_guard<std::mutex> lock(g_outputMutex);
            if (words[0] == "peers") {
                printPeers(service);
            } else {
                printTransfers(service);
            }
            continue;
        }

        P2Lan::Command command;
        if (!parseCommand(words, command, errorMsg)) {
            std::cout << errorMsg << "\n";
            continue;
        }
        // Events are published on this thread while the command runs
        auto result = service.execute(command);
        std::lock_guard<std::mutex> lock(g_outputMutex);
        if (result) {
            std::cout << "OK" << (result.message.empty() ? "" : ": " + result.message) << "\n";
        } else {
            std::cout << "FAILED " << result.errorCode << ": " << result.message << "\n";
        }
    }

    std::cout << "\nShutting down...\n";
    service.shutdown();
    return 0;
}
