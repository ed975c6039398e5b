/**
 * @file transfer_crypto.cpp
 * @brief Implementation of key derivation and chunk sealing
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Argon2id: master key from the shared secret
 * - BLAKE2b (keyed): session key from master key and seed
 * - ChaCha20-Poly1305 (IETF): per-chunk AEAD with detached tag
 */

#include "meshpulse/transfer_crypto.hpp"
#include <cstring>
#include <stdexcept>

namespace meshpulse {

namespace {
    // Fixed application salt; must stay identical across nodes
    constexpr char KDF_SALT[crypto_pwhash_SALTBYTES + 1] = "meshpulse.v1.kdf";

    // Domain separation label for session keys
    constexpr char SESSION_LABEL[] = "meshpulse-session";

    void store_be32(uint8_t* out, uint32_t value) {
        out[0] = static_cast<uint8_t>(value >> 24);
        out[1] = static_cast<uint8_t>(value >> 16);
        out[2] = static_cast<uint8_t>(value >> 8);
        out[3] = static_cast<uint8_t>(value);
    }
}

// ============================================================================
// Key Derivation Parameters
// ============================================================================

KeyDerivationParams KeyDerivationParams::interactive() {
    return {crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
}

KeyDerivationParams KeyDerivationParams::minimal() {
    return {crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
}

// ============================================================================
// TransferCrypto
// ============================================================================

bool TransferCrypto::initialize() {
    // Initialize libsodium (safe to call multiple times)
    return sodium_init() >= 0;
}

std::optional<MasterKey> TransferCrypto::derive_master_key(
    const std::string& secret,
    const KeyDerivationParams& params
) {
    if (secret.empty()) {
        return std::nullopt;
    }

    MasterKey key;
    int result = crypto_pwhash(
        key.data(),
        key.size(),
        secret.data(),
        secret.size(),
        reinterpret_cast<const unsigned char*>(KDF_SALT),
        params.ops_limit,
        params.mem_limit,
        crypto_pwhash_ALG_ARGON2ID13
    );

    if (result != 0) {
        // Out of memory or parameters outside libsodium's bounds
        sodium_memzero(key.data(), key.size());
        return std::nullopt;
    }

    return key;
}

SessionSeed TransferCrypto::generate_session_seed() {
    SessionSeed seed;
    randombytes_buf(seed.data(), seed.size());
    return seed;
}

bool TransferCrypto::constant_time_compare(const uint8_t* a, const uint8_t* b, size_t size) {
    return sodium_memcmp(a, b, size) == 0;
}

void TransferCrypto::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

// ============================================================================
// CryptoContext
// ============================================================================

CryptoContext::CryptoContext(const MasterKey& master_key, const SessionSeed& seed)
    : next_index_(0)
    , sealed_count_(0)
{
    crypto_generichash_state state;
    if (crypto_generichash_init(&state, master_key.data(), master_key.size(),
                                session_key_.size()) != 0) {
        throw std::runtime_error("Failed to initialize session key derivation");
    }
    crypto_generichash_update(&state,
        reinterpret_cast<const unsigned char*>(SESSION_LABEL), sizeof(SESSION_LABEL) - 1);
    crypto_generichash_update(&state, seed.data(), seed.size());
    crypto_generichash_final(&state, session_key_.data(), session_key_.size());
    sodium_memzero(&state, sizeof(state));

    std::memcpy(nonce_prefix_.data(), seed.data(), nonce_prefix_.size());
}

CryptoContext::~CryptoContext() {
    sodium_memzero(session_key_.data(), session_key_.size());
    sodium_memzero(nonce_prefix_.data(), nonce_prefix_.size());
}

std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_NPUBBYTES>
CryptoContext::make_nonce(uint32_t index) const {
    std::array<uint8_t, crypto_aead_chacha20poly1305_ietf_NPUBBYTES> nonce;
    std::memcpy(nonce.data(), nonce_prefix_.data(), nonce_prefix_.size());
    store_be32(nonce.data() + nonce_prefix_.size(), index);
    return nonce;
}

std::optional<SealedChunk> CryptoContext::seal(uint32_t index, const uint8_t* data, size_t size) {
    if (index < next_index_) {
        return std::nullopt;
    }

    auto nonce = make_nonce(index);
    uint8_t associated[4];
    store_be32(associated, index);

    SealedChunk sealed;
    sealed.ciphertext.resize(size);
    unsigned long long tag_len = 0;

    int result = crypto_aead_chacha20poly1305_ietf_encrypt_detached(
        sealed.ciphertext.data(),
        sealed.tag.data(),
        &tag_len,
        data,
        size,
        associated,
        sizeof(associated),
        nullptr,  // No secret nonce
        nonce.data(),
        session_key_.data()
    );

    if (result != 0) {
        return std::nullopt;
    }

    next_index_ = static_cast<uint64_t>(index) + 1;
    ++sealed_count_;
    return sealed;
}

std::optional<std::vector<uint8_t>> CryptoContext::open(
    uint32_t index,
    const uint8_t* ciphertext,
    size_t size,
    const ChunkTag& tag
) const {
    auto nonce = make_nonce(index);
    uint8_t associated[4];
    store_be32(associated, index);

    std::vector<uint8_t> plaintext(size);

    // Fails if the tag doesn't match (wrong key, wrong index or tampering)
    int result = crypto_aead_chacha20poly1305_ietf_decrypt_detached(
        plaintext.data(),
        nullptr,  // No secret nonce
        ciphertext,
        size,
        tag.data(),
        associated,
        sizeof(associated),
        nonce.data(),
        session_key_.data()
    );

    if (result != 0) {
        sodium_memzero(plaintext.data(), plaintext.size());
        return std::nullopt;
    }

    return plaintext;
}

} // namespace meshpulse
