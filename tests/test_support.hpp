/**
 * @file test_support.hpp
 * @brief Shared fixtures for MeshPulse tests
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "meshpulse/event_surface.hpp"
#include "meshpulse/message_types.hpp"
#include "meshpulse/utilities.hpp"

#include <asio.hpp>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace meshpulse {
namespace testing_support {

/**
 * @brief Temporary directory removed on destruction
 */
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("meshpulse-test-" + utilities::generate_random_string(12));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline std::vector<uint8_t> random_bytes(size_t size, uint32_t seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<uint8_t> data(size);
    for (auto& b : data) {
        b = static_cast<uint8_t>(dist(rng));
    }
    return data;
}

inline void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * @brief Count regular files in a directory (hidden part files included)
 */
inline size_t count_files(const std::filesystem::path& dir) {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            count++;
        }
    }
    return count;
}

// ============================================================================
// Raw protocol peers
// ============================================================================

/**
 * @brief Frame read by a hand-driven protocol peer
 */
struct RawFrame {
    uint8_t type = 0;
    std::vector<uint8_t> payload;

    std::string text() const { return std::string(payload.begin(), payload.end()); }
};

inline std::optional<RawFrame> read_raw_frame(asio::ip::tcp::socket& socket) {
    uint8_t prefix[FRAME_PREFIX_SIZE];
    asio::error_code ec;
    asio::read(socket, asio::buffer(prefix), ec);
    if (ec) {
        return std::nullopt;
    }

    uint32_t length = (static_cast<uint32_t>(prefix[1]) << 24) |
                      (static_cast<uint32_t>(prefix[2]) << 16) |
                      (static_cast<uint32_t>(prefix[3]) << 8) |
                      static_cast<uint32_t>(prefix[4]);
    if (length > 4 * 1024 * 1024) {
        return std::nullopt;
    }

    RawFrame frame;
    frame.type = prefix[0];
    frame.payload.resize(length);
    asio::read(socket, asio::buffer(frame.payload), ec);
    if (ec) {
        return std::nullopt;
    }
    return frame;
}

inline bool write_raw(asio::ip::tcp::socket& socket, const std::vector<uint8_t>& bytes) {
    asio::error_code ec;
    asio::write(socket, asio::buffer(bytes), ec);
    return !ec;
}

inline bool send_reply(asio::ip::tcp::socket& socket, bool accepted, const std::string& reason = "") {
    HandshakeReply reply;
    reply.accepted = accepted;
    reply.reason = reason;
    return write_raw(socket, FrameCodec::encode(FrameType::HANDSHAKE_REPLY, reply.to_json()));
}

/**
 * @brief io_context driven by background threads for the lifetime of the object
 */
class IoRunner {
public:
    explicit IoRunner(size_t threads = 2)
        : work_guard_(asio::make_work_guard(io_context_))
    {
        for (size_t i = 0; i < threads; ++i) {
            threads_.emplace_back([this]() { io_context_.run(); });
        }
    }

    ~IoRunner() { stop(); }

    IoRunner(const IoRunner&) = delete;
    IoRunner& operator=(const IoRunner&) = delete;

    asio::io_context& context() { return io_context_; }

    void stop() {
        work_guard_.reset();
        io_context_.stop();
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }

private:
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::vector<std::thread> threads_;
};

/**
 * @brief Records every event published on a surface
 */
class EventRecorder {
public:
    explicit EventRecorder(std::shared_ptr<EventSurface> events)
        : EventRecorder(*events)
    {
        keep_alive_ = std::move(events);
    }

    /**
     * @brief Record from any source with the subscribe/unsubscribe surface
     *        (EventSurface, MeshNode); the source must outlive the recorder
     */
    template <typename Source>
    explicit EventRecorder(Source& source) {
        auto peer_subscription = source.subscribe_peer_events([this](const PeerEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            peer_events_.push_back(event);
            cv_.notify_all();
        });
        auto transfer_subscription = source.subscribe_transfer_events([this](const TransferEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            transfer_events_.push_back(event);
            cv_.notify_all();
        });
        unsubscribe_ = [&source, peer_subscription, transfer_subscription]() {
            source.unsubscribe(peer_subscription);
            source.unsubscribe(transfer_subscription);
        };
    }

    ~EventRecorder() {
        unsubscribe_();
    }

    EventRecorder(const EventRecorder&) = delete;
    EventRecorder& operator=(const EventRecorder&) = delete;

    std::vector<PeerEvent> peer_events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peer_events_;
    }

    std::vector<TransferEvent> transfer_events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return transfer_events_;
    }

    /**
     * @brief Wait until a terminal event for the session arrives
     * @return The terminal event, or an event with an empty session ID on timeout
     */
    TransferEvent wait_for_terminal(const std::string& session_id,
                                    std::chrono::milliseconds timeout = std::chrono::seconds(20)) {
        TransferEvent found{TransferEventType::FAILED, {}};
        wait_until([&]() {
            for (const auto& event : transfer_events_) {
                if (event.session.session_id == session_id && is_terminal_event(event.type)) {
                    found = event;
                    return true;
                }
            }
            return false;
        }, timeout);
        return found;
    }

    /**
     * @brief Wait for a terminal event of the given direction (any session)
     */
    TransferEvent wait_for_terminal(TransferDirection direction,
                                    std::chrono::milliseconds timeout = std::chrono::seconds(20)) {
        TransferEvent found{TransferEventType::FAILED, {}};
        wait_until([&]() {
            for (const auto& event : transfer_events_) {
                if (event.session.direction == direction && is_terminal_event(event.type)) {
                    found = event;
                    return true;
                }
            }
            return false;
        }, timeout);
        return found;
    }

    /**
     * @brief Wait for the first event of a type in the given direction (any session)
     * @return The event, or an event with an empty session ID on timeout
     */
    TransferEvent wait_for_event(TransferDirection direction, TransferEventType type,
                                 std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        TransferEvent found{type, {}};
        wait_until([&]() {
            for (const auto& event : transfer_events_) {
                if (event.session.direction == direction && event.type == type) {
                    found = event;
                    return true;
                }
            }
            return false;
        }, timeout);
        return found;
    }

    /**
     * @brief Wait for a peer event of the given type
     */
    bool wait_for_peer_event(PeerEventType type, const std::string& peer_id,
                             std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        return wait_until([&]() {
            for (const auto& event : peer_events_) {
                if (event.type == type && event.peer.peer_id == peer_id) {
                    return true;
                }
            }
            return false;
        }, timeout);
    }

    /**
     * @brief Wait for any progress event at or beyond a byte count
     */
    bool wait_for_progress(const std::string& session_id, uint64_t bytes,
                           std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        return wait_until([&]() {
            for (const auto& event : transfer_events_) {
                if (event.session.session_id == session_id &&
                    event.type == TransferEventType::PROGRESS &&
                    event.session.bytes_transferred >= bytes) {
                    return true;
                }
            }
            return false;
        }, timeout);
    }

    static bool is_terminal_event(TransferEventType type) {
        return type == TransferEventType::COMPLETED ||
               type == TransferEventType::FAILED ||
               type == TransferEventType::CANCELLED;
    }

private:
    bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, predicate);
    }

    std::shared_ptr<EventSurface> keep_alive_;
    std::function<void()> unsubscribe_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<PeerEvent> peer_events_;
    std::vector<TransferEvent> transfer_events_;
};

} // namespace testing_support
} // namespace meshpulse
