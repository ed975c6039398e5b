/**
 * @file message_types.cpp
 * @brief Implementation of MeshPulse wire formats
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshpulse/message_types.hpp"
#include "meshpulse/utilities.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstring>

using json = nlohmann::json;

namespace meshpulse {

namespace {
    void store_be32(uint8_t* out, uint32_t value) {
        out[0] = static_cast<uint8_t>(value >> 24);
        out[1] = static_cast<uint8_t>(value >> 16);
        out[2] = static_cast<uint8_t>(value >> 8);
        out[3] = static_cast<uint8_t>(value);
    }

    uint32_t load_be32(const uint8_t* in) {
        return (static_cast<uint32_t>(in[0]) << 24) |
               (static_cast<uint32_t>(in[1]) << 16) |
               (static_cast<uint32_t>(in[2]) << 8) |
               static_cast<uint32_t>(in[3]);
    }

    // Control payloads must be a JSON object within the control frame limit
    std::optional<json> parse_object(const std::string& json_str) {
        if (json_str.empty() || json_str.size() > security::MAX_HEADER_SIZE) {
            return std::nullopt;
        }
        json j = json::parse(json_str, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return std::nullopt;
        }
        return j;
    }

    bool has_string(const json& j, const char* key) {
        auto it = j.find(key);
        return it != j.end() && it->is_string();
    }

    bool has_unsigned(const json& j, const char* key) {
        auto it = j.find(key);
        return it != j.end() && it->is_number_unsigned();
    }

    bool has_bool(const json& j, const char* key) {
        auto it = j.find(key);
        return it != j.end() && it->is_boolean();
    }
}

// ============================================================================
// PeerAnnouncement
// ============================================================================

std::string PeerAnnouncement::to_json() const {
    json j;
    j["type"] = "announce";
    j["version"] = version;
    j["peer_id"] = peer_id;
    j["name"] = display_name;
    j["transfer_port"] = transfer_port;
    j["seq"] = sequence;
    j["timestamp"] = timestamp;
    if (!metrics.empty()) {
        j["metrics"] = metrics;
    }
    return j.dump();
}

std::optional<PeerAnnouncement> PeerAnnouncement::from_json(const std::string& json_str) {
    if (json_str.empty() || json_str.size() > security::MAX_UDP_PACKET_SIZE) {
        return std::nullopt;
    }

    try {
        json j = json::parse(json_str, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return std::nullopt;
        }

        if (!has_string(j, "type") || j["type"].get<std::string>() != "announce") {
            return std::nullopt;
        }
        if (!has_unsigned(j, "version") || !has_string(j, "peer_id") ||
            !has_string(j, "name") || !has_unsigned(j, "transfer_port") ||
            !has_unsigned(j, "seq")) {
            return std::nullopt;
        }

        PeerAnnouncement announce;
        uint64_t version = j["version"].get<uint64_t>();
        uint64_t port = j["transfer_port"].get<uint64_t>();
        if (version == 0 || version > 0xFFFFFFFFULL || port == 0 || port > 65535) {
            return std::nullopt;
        }

        announce.version = static_cast<uint32_t>(version);
        announce.peer_id = j["peer_id"].get<std::string>();
        announce.display_name = j["name"].get<std::string>();
        announce.transfer_port = static_cast<uint16_t>(port);
        announce.sequence = j["seq"].get<uint64_t>();

        if (!security::validate_identifier(announce.peer_id) ||
            !security::validate_display_name(announce.display_name)) {
            return std::nullopt;
        }

        if (has_unsigned(j, "timestamp")) {
            announce.timestamp = j["timestamp"].get<uint64_t>();
        }

        // Metrics are advisory; non-numeric entries are skipped
        auto metrics_it = j.find("metrics");
        if (metrics_it != j.end() && metrics_it->is_object()) {
            for (auto& [key, value] : metrics_it->items()) {
                if (value.is_number()) {
                    announce.metrics[key] = value.get<double>();
                }
            }
        }

        return announce;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// TransferHeader
// ============================================================================

std::string TransferHeader::to_json() const {
    json j;
    j["version"] = version;
    j["file_name"] = file_name;
    j["file_size"] = file_size;
    j["chunk_size"] = chunk_size;
    j["seed"] = utilities::bytes_to_hex(seed.data(), seed.size());
    j["sender_id"] = sender_id;
    j["sender_name"] = sender_name;
    if (!note.empty()) {
        j["note"] = note;
    }
    return j.dump();
}

std::optional<TransferHeader> TransferHeader::from_json(const std::string& json_str) {
    try {
        auto parsed = parse_object(json_str);
        if (!parsed) {
            return std::nullopt;
        }
        const json& j = *parsed;

        if (!has_unsigned(j, "version") || !has_string(j, "file_name") ||
            !has_unsigned(j, "file_size") || !has_unsigned(j, "chunk_size") ||
            !has_string(j, "seed") || !has_string(j, "sender_id") ||
            !has_string(j, "sender_name")) {
            return std::nullopt;
        }

        uint64_t version = j["version"].get<uint64_t>();
        uint64_t chunk_size = j["chunk_size"].get<uint64_t>();
        if (version > 0xFFFFFFFFULL || chunk_size > 0xFFFFFFFFULL) {
            return std::nullopt;
        }

        auto seed = utilities::hex_to_bytes(j["seed"].get<std::string>());
        if (!seed || seed->size() != security::SESSION_SEED_SIZE) {
            return std::nullopt;
        }

        TransferHeader header;
        header.version = static_cast<uint32_t>(version);
        header.file_name = j["file_name"].get<std::string>();
        header.file_size = j["file_size"].get<uint64_t>();
        header.chunk_size = static_cast<uint32_t>(chunk_size);
        std::memcpy(header.seed.data(), seed->data(), header.seed.size());
        header.sender_id = j["sender_id"].get<std::string>();
        header.sender_name = j["sender_name"].get<std::string>();
        if (has_string(j, "note")) {
            header.note = j["note"].get<std::string>();
        }

        return header;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// HandshakeReply / EndOfStream / TransferResult
// ============================================================================

std::string HandshakeReply::to_json() const {
    json j;
    j["accepted"] = accepted;
    j["reason"] = reason;
    return j.dump();
}

std::optional<HandshakeReply> HandshakeReply::from_json(const std::string& json_str) {
    try {
        auto parsed = parse_object(json_str);
        if (!parsed || !has_bool(*parsed, "accepted")) {
            return std::nullopt;
        }

        HandshakeReply reply;
        reply.accepted = (*parsed)["accepted"].get<bool>();
        if (has_string(*parsed, "reason")) {
            reply.reason = (*parsed)["reason"].get<std::string>();
        }
        return reply;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string EndOfStream::to_json() const {
    json j;
    j["chunk_count"] = chunk_count;
    j["total_bytes"] = total_bytes;
    j["sha256"] = sha256;
    return j.dump();
}

std::optional<EndOfStream> EndOfStream::from_json(const std::string& json_str) {
    try {
        auto parsed = parse_object(json_str);
        if (!parsed) {
            return std::nullopt;
        }
        const json& j = *parsed;

        if (!has_unsigned(j, "chunk_count") || !has_unsigned(j, "total_bytes") ||
            !has_string(j, "sha256")) {
            return std::nullopt;
        }

        EndOfStream end;
        end.chunk_count = j["chunk_count"].get<uint64_t>();
        end.total_bytes = j["total_bytes"].get<uint64_t>();
        end.sha256 = j["sha256"].get<std::string>();
        return end;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string TransferResult::to_json() const {
    json j;
    j["ok"] = ok;
    j["error"] = error;
    j["detail"] = detail;
    return j.dump();
}

std::optional<TransferResult> TransferResult::from_json(const std::string& json_str) {
    try {
        auto parsed = parse_object(json_str);
        if (!parsed || !has_bool(*parsed, "ok")) {
            return std::nullopt;
        }

        TransferResult result;
        result.ok = (*parsed)["ok"].get<bool>();
        if (has_string(*parsed, "error")) {
            result.error = (*parsed)["error"].get<std::string>();
        }
        if (has_string(*parsed, "detail")) {
            result.detail = (*parsed)["detail"].get<std::string>();
        }
        return result;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// FrameCodec
// ============================================================================

std::vector<uint8_t> FrameCodec::encode(FrameType type, const std::string& payload) {
    std::vector<uint8_t> frame(FRAME_PREFIX_SIZE + payload.size());
    frame[0] = static_cast<uint8_t>(type);
    store_be32(frame.data() + 1, static_cast<uint32_t>(payload.size()));
    std::memcpy(frame.data() + FRAME_PREFIX_SIZE, payload.data(), payload.size());
    return frame;
}

std::vector<uint8_t> FrameCodec::encode(FrameType type, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> frame(FRAME_PREFIX_SIZE + payload.size());
    frame[0] = static_cast<uint8_t>(type);
    store_be32(frame.data() + 1, static_cast<uint32_t>(payload.size()));
    if (!payload.empty()) {
        std::memcpy(frame.data() + FRAME_PREFIX_SIZE, payload.data(), payload.size());
    }
    return frame;
}

std::vector<uint8_t> FrameCodec::encode_chunk(uint32_t index, const SealedChunk& sealed) {
    const size_t payload_size = CHUNK_PAYLOAD_OVERHEAD + sealed.ciphertext.size();

    std::vector<uint8_t> frame(FRAME_PREFIX_SIZE + payload_size);
    uint8_t* out = frame.data();
    out[0] = static_cast<uint8_t>(FrameType::CHUNK);
    store_be32(out + 1, static_cast<uint32_t>(payload_size));
    out += FRAME_PREFIX_SIZE;

    store_be32(out, index);
    store_be32(out + 4, static_cast<uint32_t>(sealed.ciphertext.size()));
    out += 8;
    if (!sealed.ciphertext.empty()) {
        std::memcpy(out, sealed.ciphertext.data(), sealed.ciphertext.size());
    }
    out += sealed.ciphertext.size();
    std::memcpy(out, sealed.tag.data(), sealed.tag.size());

    return frame;
}

std::optional<FramePrefix> FrameCodec::decode_prefix(const uint8_t* prefix, uint32_t chunk_size) {
    uint8_t raw_type = prefix[0];
    if (raw_type < static_cast<uint8_t>(FrameType::HEADER) ||
        raw_type > static_cast<uint8_t>(FrameType::RESULT)) {
        return std::nullopt;
    }

    FramePrefix decoded;
    decoded.type = static_cast<FrameType>(raw_type);
    decoded.length = load_be32(prefix + 1);

    if (decoded.length > max_payload_size(decoded.type, chunk_size)) {
        return std::nullopt;
    }

    return decoded;
}

std::optional<ChunkPayload> FrameCodec::decode_chunk(const std::vector<uint8_t>& payload) {
    if (payload.size() < CHUNK_PAYLOAD_OVERHEAD) {
        return std::nullopt;
    }

    ChunkPayload chunk;
    chunk.index = load_be32(payload.data());
    uint32_t ciphertext_length = load_be32(payload.data() + 4);

    if (static_cast<size_t>(ciphertext_length) + CHUNK_PAYLOAD_OVERHEAD != payload.size()) {
        return std::nullopt;
    }

    const uint8_t* ciphertext = payload.data() + 8;
    chunk.ciphertext.assign(ciphertext, ciphertext + ciphertext_length);
    std::memcpy(chunk.tag.data(), ciphertext + ciphertext_length, chunk.tag.size());

    return chunk;
}

size_t FrameCodec::max_payload_size(FrameType type, uint32_t chunk_size) {
    if (type == FrameType::CHUNK) {
        size_t bounded = std::min<size_t>(chunk_size, security::MAX_CHUNK_SIZE);
        return bounded + CHUNK_PAYLOAD_OVERHEAD;
    }
    return security::MAX_HEADER_SIZE;
}

std::string FrameCodec::frame_type_to_string(FrameType type) {
    switch (type) {
        case FrameType::HEADER:          return "HEADER";
        case FrameType::HANDSHAKE_REPLY: return "HANDSHAKE_REPLY";
        case FrameType::CHUNK:           return "CHUNK";
        case FrameType::END_OF_STREAM:   return "END_OF_STREAM";
        case FrameType::RESULT:          return "RESULT";
    }
    return "UNKNOWN";
}

} // namespace meshpulse
