/**
 * @file utilities.hpp
 * @brief Common utility functions for MeshPulse
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout MeshPulse:
 * - Logging and error reporting
 * - Size, duration and rate formatting
 * - Environment and host helpers
 * - Random identifiers
 * - Incremental SHA-256
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>
#include <memory>

namespace meshpulse {
namespace utilities {

/**
 * @brief Log levels for MeshPulse logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 *
 * Console output goes to stderr so stdout stays free for a front end.
 *
 * @param log_file Path to log file (empty for console only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return LogLevel if recognised, std::nullopt otherwise
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

/**
 * @brief Log debug message
 * @param message Message to log
 */
void log_debug(const std::string& message);

/**
 * @brief Log info message
 * @param message Message to log
 */
void log_info(const std::string& message);

/**
 * @brief Log warning message
 * @param message Message to log
 */
void log_warn(const std::string& message);

/**
 * @brief Log error message
 * @param message Message to log
 */
void log_error(const std::string& message);

/**
 * @brief Log critical message
 * @param message Message to log
 */
void log_critical(const std::string& message);

// ============================================================================
// Formatting
// ============================================================================

/**
 * @brief Format byte count as human-readable size (e.g. "1.5 MB")
 */
std::string format_file_size(uint64_t size);

/**
 * @brief Format seconds as human-readable duration (e.g. "1h 5m 3s")
 */
std::string format_duration(uint64_t seconds);

/**
 * @brief Format a throughput in bytes per second (e.g. "12.3 MB/s")
 */
std::string format_rate(double bytes_per_second);

/**
 * @brief Convert bytes to lowercase hex
 */
std::string bytes_to_hex(const uint8_t* data, size_t size);

/**
 * @brief Convert lowercase or uppercase hex to bytes
 * @return Bytes, or std::nullopt on odd length or invalid digits
 */
std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

// ============================================================================
// Environment / Host
// ============================================================================

/**
 * @brief Get environment variable value
 * @param name Variable name
 * @param default_value Value returned when unset
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Read a port number from the environment
 *
 * Unset variables yield default_value. Values that are not a port number
 * in 0..65535 are logged and also yield default_value.
 */
uint16_t get_env_port(const std::string& name, uint16_t default_value);

/**
 * @brief Get local host name ("unknown" on failure)
 */
std::string get_hostname();

// ============================================================================
// Identifiers
// ============================================================================

/**
 * @brief Generate random alphanumeric string
 * @param length Number of characters
 */
std::string generate_random_string(size_t length);

/**
 * @brief Generate RFC 4122 version 4 UUID string
 */
std::string generate_uuid();

// ============================================================================
// Hashing
// ============================================================================

/**
 * @brief Incremental SHA-256 over OpenSSL EVP
 *
 * Feed data with update() and read the lowercase hex digest with
 * finish(). A hasher is single-use; finish() may be called once.
 */
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    /**
     * @brief Add data to the digest
     */
    void update(const uint8_t* data, size_t size);

    /**
     * @brief Finalize and return the hex digest
     */
    std::string finish();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace utilities
} // namespace meshpulse
