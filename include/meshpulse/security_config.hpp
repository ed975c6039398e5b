/**
 * @file security_config.hpp
 * @brief Protocol constants, limits and input validation for MeshPulse
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <filesystem>

namespace meshpulse {
namespace security {

// ============================================================================
// Network Configuration
// ============================================================================

/// UDP discovery port
constexpr uint16_t DISCOVERY_PORT = 37020;

/// TCP transfer port
constexpr uint16_t TRANSFER_PORT = 5000;

/// Default announcement destination
constexpr const char* BROADCAST_ADDRESS = "255.255.255.255";

/// Maximum UDP datagram accepted by the discovery listener
constexpr size_t MAX_UDP_PACKET_SIZE = 8192;

/// Listen backlog for the transfer acceptor
constexpr int TRANSFER_BACKLOG = 5;

// ============================================================================
// Discovery Timing
// ============================================================================

/// Interval between presence announcements
constexpr auto ANNOUNCE_INTERVAL = std::chrono::seconds(2);

/// Interval between registry eviction sweeps
constexpr auto SWEEP_INTERVAL = std::chrono::seconds(1);

/// Silence after which a peer is reported STALE
constexpr auto PEER_STALE_AFTER = std::chrono::seconds(6);

/// Silence after which a peer is EXPIRED and removed
constexpr auto PEER_EXPIRE_AFTER = std::chrono::seconds(10);

/// Discovery datagrams per second per source address
constexpr double DISCOVERY_RATE_PER_SECOND = 20.0;

/// Discovery burst capacity per source address
constexpr double DISCOVERY_RATE_BURST = 40.0;

// ============================================================================
// Transfer Limits
// ============================================================================

/// Transfer protocol version
constexpr uint32_t PROTOCOL_VERSION = 1;

/// Default plaintext chunk size (64KB)
constexpr size_t CHUNK_SIZE = 64 * 1024;

/// Smallest chunk size a receiver accepts
constexpr size_t MIN_CHUNK_SIZE = 1024;

/// Largest chunk size a receiver accepts (1MB)
constexpr size_t MAX_CHUNK_SIZE = 1024 * 1024;

/// Maximum size of a control frame payload
constexpr size_t MAX_HEADER_SIZE = 4096;

/// Maximum file size accepted by default (16GB)
constexpr uint64_t MAX_FILE_SIZE = 16ULL * 1024 * 1024 * 1024;

/// Maximum chunks per session (the chunk index is 32 bits)
constexpr uint64_t MAX_CHUNKS = 0xFFFFFFFFULL;

/// Maximum concurrent inbound sessions
constexpr size_t MAX_INBOUND_SESSIONS = 16;

/// Maximum identifier length (peer ID, session ID)
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

/// Maximum display name length
constexpr size_t MAX_DISPLAY_NAME_LENGTH = 64;

/// Maximum note length carried in a transfer header
constexpr size_t MAX_NOTE_LENGTH = 1024;

/// Maximum filename length
constexpr size_t MAX_FILENAME_LENGTH = 255;

// ============================================================================
// Transfer Timing
// ============================================================================

/// Deadline covering connect, header and handshake reply
constexpr auto HANDSHAKE_TIMEOUT = std::chrono::seconds(5);

/// Deadline for any single read or write after the handshake
constexpr auto STALL_TIMEOUT = std::chrono::seconds(15);

/// Minimum interval between progress events of one session
constexpr auto PROGRESS_INTERVAL = std::chrono::milliseconds(100);

/// Time a terminal session stays queryable
constexpr auto SESSION_RETENTION = std::chrono::seconds(5);

// ============================================================================
// Cryptographic Configuration
// ============================================================================

/// Shared secret used when none is configured
constexpr const char* DEFAULT_SHARED_SECRET = "mesh-pulse-default-key";

/// Per-session seed size
constexpr size_t SESSION_SEED_SIZE = 32;

// ============================================================================
// Directories
// ============================================================================

/// Receive directory used when none is configured
constexpr const char* DEFAULT_RECEIVE_DIR = "received_files";

/// Suffix of in-progress output files
constexpr const char* PARTIAL_SUFFIX = ".part";

/**
 * @brief Resolve the receive directory and create it if missing
 * @param configured Configured directory (empty for MESHPULSE_RECEIVE_DIR or default)
 * @return Filesystem path to the receive directory
 */
std::filesystem::path get_receive_directory(const std::string& configured = "");

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Validate identifier (alphanumeric, underscore, hyphen, dot)
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier,
                         size_t max_length = MAX_IDENTIFIER_LENGTH);

/**
 * @brief Validate a display name (printable, non-empty, bounded)
 */
bool validate_display_name(const std::string& name,
                           size_t max_length = MAX_DISPLAY_NAME_LENGTH);

/**
 * @brief Reduce an untrusted filename to a safe base name
 *
 * Strips any directory components, control characters and characters
 * that are reserved on common filesystems. Names that reduce to nothing,
 * "." or ".." become "untitled".
 *
 * @param filename Filename as received from a peer
 * @return Safe base name of at most MAX_FILENAME_LENGTH characters
 */
std::string sanitize_filename(const std::string& filename);

/**
 * @brief Convert a host name into a peer identifier fragment
 * @param hostname Raw host name
 * @return Lowercase identifier-safe string (never empty)
 */
std::string sanitize_identifier(const std::string& hostname);

/**
 * @brief Pick a destination inside a directory that does not exist yet
 *
 * Returns dir/name, or dir/"stem (n).ext" for the first free n.
 *
 * @param directory Target directory
 * @param filename Sanitized base name
 * @return Unused path inside directory
 */
std::filesystem::path unique_destination(const std::filesystem::path& directory,
                                         const std::string& filename);

/**
 * @brief Check whether a path resolves inside a base directory
 * @param path Path to check
 * @param base_dir Directory that must contain path
 * @return true if path is inside base_dir, false otherwise
 */
bool is_safe_path(const std::filesystem::path& path,
                  const std::filesystem::path& base_dir);

} // namespace security
} // namespace meshpulse
