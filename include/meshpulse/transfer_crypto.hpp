/**
 * @file transfer_crypto.hpp
 * @brief Key derivation and per-chunk authenticated encryption
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every node derives the same master key from the shared secret with
 * Argon2id. Each transfer session derives its own key from the master key
 * and a random seed, and seals chunks with ChaCha20-Poly1305 (IETF).
 */

#pragma once

#include "meshpulse/security_config.hpp"

#include <array>
#include <vector>
#include <string>
#include <optional>
#include <cstdint>
#include <sodium.h>

namespace meshpulse {

/// 256-bit key derived from the shared secret
using MasterKey = std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_KEYBYTES>;

/// Random per-session seed chosen by the sender
using SessionSeed = std::array<uint8_t, security::SESSION_SEED_SIZE>;

/// Detached authentication tag
using ChunkTag = std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_ABYTES>;

/**
 * @brief Argon2id strength parameters
 *
 * Every node on a network must use the same values or their keys differ.
 */
struct KeyDerivationParams {
    unsigned long long ops_limit;
    size_t mem_limit;

    /// libsodium "interactive" preset (default for nodes)
    static KeyDerivationParams interactive();

    /// Cheapest parameters libsodium allows (tests)
    static KeyDerivationParams minimal();
};

/**
 * @brief Ciphertext plus detached tag for one chunk
 */
struct SealedChunk {
    std::vector<uint8_t> ciphertext;
    ChunkTag tag;
};

/**
 * @brief TransferCrypto - stateless libsodium helpers
 */
class TransferCrypto {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    /**
     * @brief Derive the master key from the shared secret
     *
     * Uses a fixed application salt so all nodes agree on the key.
     *
     * @param secret Shared secret (must not be empty)
     * @param params Argon2id parameters
     * @return MasterKey, or std::nullopt if the secret is empty or hashing fails
     */
    static std::optional<MasterKey> derive_master_key(
        const std::string& secret,
        const KeyDerivationParams& params = KeyDerivationParams::interactive()
    );

    /**
     * @brief Generate a random session seed
     */
    static SessionSeed generate_session_seed();

    /**
     * @brief Constant-time comparison (prevents timing attacks)
     */
    static bool constant_time_compare(const uint8_t* a, const uint8_t* b, size_t size);

    /**
     * @brief Securely zero memory (prevents compiler optimization)
     */
    static void secure_zero(void* data, size_t size);
};

/**
 * @brief CryptoContext - per-session AEAD state
 *
 * nonce = seed[0..8) || be32(chunk index), associated data = be32(chunk index).
 * Sealing refuses to reuse or go back to an earlier index, so a nonce is
 * never used twice under one session key. Key material is wiped on
 * destruction.
 */
class CryptoContext {
public:
    /**
     * @brief Derive the session key from master key and seed
     * @param master_key Key derived from the shared secret
     * @param seed Session seed carried in the transfer header
     */
    CryptoContext(const MasterKey& master_key, const SessionSeed& seed);

    ~CryptoContext();

    CryptoContext(const CryptoContext&) = delete;
    CryptoContext& operator=(const CryptoContext&) = delete;
    CryptoContext(CryptoContext&&) = delete;
    CryptoContext& operator=(CryptoContext&&) = delete;

    /**
     * @brief Encrypt and authenticate one chunk
     * @param index Chunk index (must be greater than any index sealed before)
     * @param data Plaintext
     * @param size Plaintext length
     * @return SealedChunk, or std::nullopt if the index was already used
     */
    std::optional<SealedChunk> seal(uint32_t index, const uint8_t* data, size_t size);

    /**
     * @brief Verify and decrypt one chunk
     * @return Plaintext, or std::nullopt on any authentication failure
     */
    std::optional<std::vector<uint8_t>> open(
        uint32_t index,
        const uint8_t* ciphertext,
        size_t size,
        const ChunkTag& tag
    ) const;

    /**
     * @brief Number of chunks sealed so far
     */
    uint64_t get_sealed_count() const { return sealed_count_; }

private:
    std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_NPUBBYTES> make_nonce(uint32_t index) const;

    std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_KEYBYTES> session_key_;
    std::array<uint8_t, 8> nonce_prefix_;
    uint64_t next_index_;
    uint64_t sealed_count_;
};

} // namespace meshpulse
