/**
 * @file security_config.cpp
 * @brief Implementation of MeshPulse validation and path helpers
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshpulse/security_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace meshpulse {
namespace security {

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_receive_directory(const std::string& configured) {
    std::filesystem::path receive_dir;

    if (!configured.empty()) {
        receive_dir = configured;
    } else {
        const char* env_dir = std::getenv("MESHPULSE_RECEIVE_DIR");
        if (env_dir != nullptr && std::strlen(env_dir) > 0) {
            receive_dir = env_dir;
        } else {
            receive_dir = DEFAULT_RECEIVE_DIR;
        }
    }

    // Create directory if it doesn't exist
    if (!std::filesystem::exists(receive_dir)) {
        std::filesystem::create_directories(receive_dir);
    }

    return receive_dir;
}

// ============================================================================
// Validation
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }

    return true;
}

bool validate_display_name(const std::string& name, size_t max_length) {
    if (name.empty() || name.length() > max_length) {
        return false;
    }

    return std::none_of(name.begin(), name.end(),
        [](char c) { return std::iscntrl(static_cast<unsigned char>(c)) != 0; });
}

std::string sanitize_filename(const std::string& filename) {
    // Keep only the last path component, whichever separator the sender used
    std::string sanitized = filename;
    auto separator = sanitized.find_last_of("/\\");
    if (separator != std::string::npos) {
        sanitized = sanitized.substr(separator + 1);
    }

    // Drop null bytes and control characters
    sanitized.erase(
        std::remove_if(sanitized.begin(), sanitized.end(),
            [](char c) { return std::iscntrl(static_cast<unsigned char>(c)) != 0; }),
        sanitized.end()
    );

    // Remove leading/trailing whitespace
    auto start = sanitized.find_first_not_of(" \t");
    auto end = sanitized.find_last_not_of(" \t");
    if (start == std::string::npos) {
        sanitized.clear();
    } else {
        sanitized = sanitized.substr(start, end - start + 1);
    }

    // Replace characters reserved on common filesystems
    const std::string reserved_chars = "<>:\"|?*";
    for (char& c : sanitized) {
        if (reserved_chars.find(c) != std::string::npos) {
            c = '_';
        }
    }

    // Hidden names would collide with partial output files
    while (!sanitized.empty() && sanitized.front() == '.') {
        sanitized.erase(sanitized.begin());
    }

    if (sanitized.empty()) {
        sanitized = "untitled";
    }

    if (sanitized.length() > MAX_FILENAME_LENGTH) {
        // Preserve the extension when truncating
        std::filesystem::path as_path(sanitized);
        std::string extension = as_path.extension().string();
        if (extension.length() >= MAX_FILENAME_LENGTH / 2) {
            extension.clear();
        }
        sanitized = sanitized.substr(0, MAX_FILENAME_LENGTH - extension.length()) + extension;
        if (sanitized.length() > MAX_FILENAME_LENGTH) {
            sanitized.resize(MAX_FILENAME_LENGTH);
        }
    }

    return sanitized;
}

std::string sanitize_identifier(const std::string& hostname) {
    std::string result;
    result.reserve(hostname.size());

    for (char c : hostname) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            result += static_cast<char>(std::tolower(uc));
        } else if (c == '-' || c == '_' || c == '.') {
            result += c;
        } else {
            result += '-';
        }
    }

    // Leave room for the instance suffix
    if (result.length() > MAX_IDENTIFIER_LENGTH - 10) {
        result.resize(MAX_IDENTIFIER_LENGTH - 10);
    }

    if (result.empty()) {
        result = "peer";
    }

    return result;
}

std::filesystem::path unique_destination(const std::filesystem::path& directory,
                                         const std::string& filename) {
    std::filesystem::path candidate = directory / filename;
    if (!std::filesystem::exists(candidate)) {
        return candidate;
    }

    std::filesystem::path as_path(filename);
    std::string stem = as_path.stem().string();
    std::string extension = as_path.extension().string();

    for (size_t n = 1; ; ++n) {
        candidate = directory / (stem + " (" + std::to_string(n) + ")" + extension);
        if (!std::filesystem::exists(candidate)) {
            return candidate;
        }
    }
}

bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir) {
    try {
        // Resolve to canonical paths (resolves .., symlinks, etc.)
        auto canonical_path = std::filesystem::weakly_canonical(path);
        auto canonical_base = std::filesystem::weakly_canonical(base_dir);

        auto relative = canonical_path.lexically_relative(canonical_base);
        if (relative.empty() || relative == ".") {
            return false;
        }

        // Traversal detected
        return *relative.begin() != "..";

    } catch (const std::filesystem::filesystem_error&) {
        // If path resolution fails, consider it unsafe
        return false;
    }
}

} // namespace security
} // namespace meshpulse
