/**
 * @file mesh_node_example.cpp
 * @brief Example node application using MeshNode
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates basic MeshNode usage:
 * - Configure from MESHPULSE_* environment variables
 * - Print peer and transfer events
 * - Optionally send a file to a peer once it is discovered
 */

#include "meshpulse/mesh_node.hpp"
#include "meshpulse/utilities.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace meshpulse;
using namespace meshpulse::utilities;

static std::atomic<bool> g_shutdown(false);

void signal_handler(int) {
    g_shutdown = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [<peer> <file> [note]]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  peer    Display name or peer ID to send to (\"*\" for the first peer seen)\n";
    std::cout << "  file    File to send once the peer appears\n";
    std::cout << "  note    Optional note shown to the receiver\n\n";
    std::cout << "Environment:\n";
    std::cout << "  MESHPULSE_BCAST_PORT, MESHPULSE_XFER_PORT, MESHPULSE_KEY,\n";
    std::cout << "  MESHPULSE_RECEIVE_DIR, MESHPULSE_NAME, MESHPULSE_LOG_FILE,\n";
    std::cout << "  MESHPULSE_LOG_LEVEL, MESHPULSE_ANNOUNCE_ADDR\n\n";
}

void print_peer_event(const PeerEvent& event) {
    std::cout << peer_event_type_to_string(event.type) << " "
              << event.peer.display_name << " (" << event.peer.peer_id << ") "
              << event.peer.address << ":" << event.peer.transfer_port << " "
              << peer_status_to_string(event.peer.status) << "\n";
}

void print_transfer_event(const TransferEvent& event) {
    const auto& session = event.session;

    std::cout << transfer_event_type_to_string(event.type) << " "
              << session.session_id.substr(0, 8) << " "
              << (session.direction == TransferDirection::SEND ? "-> " : "<- ")
              << session.peer_name << " " << session.file_name;

    switch (event.type) {
        case TransferEventType::PROGRESS:
            std::cout << " " << static_cast<int>(session.get_progress() * 100.0) << "% "
                      << format_rate(session.transfer_rate_bps);
            break;
        case TransferEventType::COMPLETED:
            std::cout << " " << format_file_size(session.total_bytes) << " avg "
                      << format_rate(session.average_rate_bps);
            if (session.direction == TransferDirection::RECEIVE) {
                std::cout << " saved to " << session.local_path;
            }
            if (!session.note.empty()) {
                std::cout << " note: " << session.note;
            }
            break;
        case TransferEventType::FAILED:
            std::cout << " " << transfer_error_to_string(session.error);
            if (!session.error_detail.empty()) {
                std::cout << " (" << session.error_detail << ")";
            }
            break;
        default:
            break;
    }
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    if (argc == 2 || argc > 4) {
        print_usage(argv[0]);
        return 1;
    }

    std::string target = (argc >= 3) ? argv[1] : "";
    std::string file_path = (argc >= 3) ? argv[2] : "";
    std::string note = (argc == 4) ? argv[3] : "";

    NodeConfig config = NodeConfig::from_environment();
    initialize_logging(config.log_file, config.log_level);

    try {
        MeshNode node(config);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::atomic<bool> sent(false);

        node.subscribe_peer_events([&node, &sent, &target, &file_path, &note](const PeerEvent& event) {
            print_peer_event(event);

            if (target.empty() || event.type == PeerEventType::REMOVED) {
                return;
            }
            bool match = target == "*" ||
                         target == event.peer.peer_id ||
                         target == event.peer.display_name;
            if (match && !sent.exchange(true)) {
                auto session_id = node.send_file(event.peer.peer_id, file_path, note);
                if (!session_id) {
                    std::cerr << "Could not send " << file_path << " to " << event.peer.display_name << "\n";
                }
            }
        });

        node.subscribe_transfer_events([](const TransferEvent& event) {
            print_transfer_event(event);
        });

        if (!node.start()) {
            std::cerr << "Failed to start node\n";
            return 1;
        }

        std::cout << "MeshPulse node '" << node.get_display_name() << "' (" << node.get_peer_id()
                  << ") discovery UDP " << node.get_discovery_port()
                  << ", transfer TCP " << node.get_transfer_port() << "\n";

        while (!g_shutdown) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        auto stats = node.get_stats();
        std::cout << "\nShutting down after " << format_duration(stats.uptime_seconds)
                  << " (" << stats.known_peers << " peers, "
                  << stats.announcements_sent << " announcements sent)\n";
        node.stop();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
