/**
 * @file message_types.hpp
 * @brief Wire formats for MeshPulse discovery and transfer
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Discovery announcements (UDP, JSON)
 * - Transfer frames (TCP): u8 type | u32 big-endian length | payload
 * - Control payloads (JSON) and chunk payloads (binary)
 */

#pragma once

#include "meshpulse/security_config.hpp"
#include "meshpulse/transfer_crypto.hpp"

#include <array>
#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <optional>

namespace meshpulse {

// ============================================================================
// Discovery
// ============================================================================

/**
 * @brief Presence announcement broadcast by every node
 */
struct PeerAnnouncement {
    uint32_t version = security::PROTOCOL_VERSION;  ///< Protocol version of the sender
    std::string peer_id;                            ///< Sender peer ID
    std::string display_name;                       ///< Human readable name
    uint16_t transfer_port = 0;                     ///< TCP port for transfers
    uint64_t sequence = 0;                          ///< Monotonic per-sender counter
    uint64_t timestamp = 0;                         ///< Sender wall clock (Unix seconds)
    std::map<std::string, double> metrics;          ///< Optional resource metrics

    /**
     * @brief Serialize to JSON
     */
    std::string to_json() const;

    /**
     * @brief Parse and validate an announcement
     *
     * Unknown fields are ignored. Missing or mistyped required fields,
     * invalid identifiers and port 0 are rejected.
     *
     * @param json_str Datagram contents
     * @return PeerAnnouncement if valid, std::nullopt otherwise
     */
    static std::optional<PeerAnnouncement> from_json(const std::string& json_str);
};

// ============================================================================
// Transfer Frames
// ============================================================================

/**
 * @brief Frame types on a transfer connection
 */
enum class FrameType : uint8_t {
    HEADER = 1,           ///< Sender -> receiver: file metadata and seed
    HANDSHAKE_REPLY = 2,  ///< Receiver -> sender: accept or reject
    CHUNK = 3,            ///< Sender -> receiver: sealed chunk
    END_OF_STREAM = 4,    ///< Sender -> receiver: totals and digest
    RESULT = 5            ///< Receiver -> sender: final verdict
};

/// Size of the type + length prefix
constexpr size_t FRAME_PREFIX_SIZE = 5;

/// Chunk payload overhead: index, ciphertext length and tag
constexpr size_t CHUNK_PAYLOAD_OVERHEAD = 8 + std::tuple_size<ChunkTag>::value;

/**
 * @brief Decoded frame prefix
 */
struct FramePrefix {
    FrameType type;
    uint32_t length;
};

/**
 * @brief File metadata sent by the initiator
 */
struct TransferHeader {
    uint32_t version = security::PROTOCOL_VERSION;
    std::string file_name;
    uint64_t file_size = 0;
    uint32_t chunk_size = static_cast<uint32_t>(security::CHUNK_SIZE);
    SessionSeed seed{};
    std::string sender_id;
    std::string sender_name;
    std::string note;

    std::string to_json() const;
    static std::optional<TransferHeader> from_json(const std::string& json_str);
};

/**
 * @brief Receiver's answer to a TransferHeader
 */
struct HandshakeReply {
    bool accepted = false;
    std::string reason;

    std::string to_json() const;
    static std::optional<HandshakeReply> from_json(const std::string& json_str);
};

/**
 * @brief Sender's end-of-stream totals
 */
struct EndOfStream {
    uint64_t chunk_count = 0;
    uint64_t total_bytes = 0;
    std::string sha256;  ///< Hex digest of the plaintext

    std::string to_json() const;
    static std::optional<EndOfStream> from_json(const std::string& json_str);
};

/**
 * @brief Receiver's final verdict
 */
struct TransferResult {
    bool ok = false;
    std::string error;   ///< Error kind name when !ok
    std::string detail;

    std::string to_json() const;
    static std::optional<TransferResult> from_json(const std::string& json_str);
};

/**
 * @brief Decoded chunk payload
 */
struct ChunkPayload {
    uint32_t index = 0;
    std::vector<uint8_t> ciphertext;
    ChunkTag tag{};
};

/**
 * @brief FrameCodec - framing helpers for the transfer protocol
 */
class FrameCodec {
public:
    /**
     * @brief Build a complete frame (prefix + payload)
     */
    static std::vector<uint8_t> encode(FrameType type, const std::string& payload);

    /**
     * @brief Build a complete frame (prefix + payload)
     */
    static std::vector<uint8_t> encode(FrameType type, const std::vector<uint8_t>& payload);

    /**
     * @brief Build a CHUNK frame from a sealed chunk
     */
    static std::vector<uint8_t> encode_chunk(uint32_t index, const SealedChunk& sealed);

    /**
     * @brief Decode and bound-check a frame prefix
     *
     * Rejects unknown types and lengths above the limit for the type, so a
     * hostile length is refused before anything is allocated.
     *
     * @param prefix FRAME_PREFIX_SIZE bytes
     * @param chunk_size Negotiated chunk size (bounds CHUNK frames)
     * @return FramePrefix if acceptable, std::nullopt otherwise
     */
    static std::optional<FramePrefix> decode_prefix(const uint8_t* prefix, uint32_t chunk_size);

    /**
     * @brief Parse a CHUNK payload
     * @return ChunkPayload, or std::nullopt if lengths are inconsistent
     */
    static std::optional<ChunkPayload> decode_chunk(const std::vector<uint8_t>& payload);

    /**
     * @brief Largest payload accepted for a frame type
     */
    static size_t max_payload_size(FrameType type, uint32_t chunk_size);

    /**
     * @brief Human readable frame type name
     */
    static std::string frame_type_to_string(FrameType type);
};

} // namespace meshpulse
