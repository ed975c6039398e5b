/**
 * @file rate_limiter.hpp
 * @brief Token bucket rate limiting per remote address
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Guards the discovery listener against datagram floods and the transfer
 * acceptor against connection storms from a single host.
 */

#pragma once

#include <string>
#include <chrono>
#include <mutex>
#include <map>

namespace meshpulse {

/**
 * @brief Token bucket for a single source
 */
struct TokenBucket {
    /// Number of tokens currently available
    double tokens;

    /// Last refill timestamp
    std::chrono::steady_clock::time_point last_refill;
};

/**
 * @brief RateLimiter - token bucket per source key
 *
 * Each key starts with a full bucket of burst_capacity tokens that
 * refills at rate_per_second. Time is passed in explicitly so callers
 * (and tests) control the clock.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Construct rate limiter
     * @param rate_per_second Sustained rate per key
     * @param burst_capacity Burst capacity per key
     */
    explicit RateLimiter(double rate_per_second, double burst_capacity);

    ~RateLimiter() = default;

    // Disable copy and move
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;
    RateLimiter(RateLimiter&&) = delete;
    RateLimiter& operator=(RateLimiter&&) = delete;

    /**
     * @brief Consume one token for key if available
     * @param key Source key (remote address)
     * @param now Current time
     * @return true if allowed, false if the budget is exhausted
     */
    bool allow(const std::string& key, Clock::time_point now = Clock::now());

    /**
     * @brief Get current token count for key (burst capacity if unknown)
     */
    double get_tokens(const std::string& key, Clock::time_point now = Clock::now());

    /**
     * @brief Get number of tracked keys
     */
    size_t get_tracked_count() const;

    /**
     * @brief Forget keys idle longer than a threshold
     * @return Number of keys removed
     */
    size_t cleanup_inactive(std::chrono::seconds inactive_threshold,
                            Clock::time_point now = Clock::now());

private:
    void refill_tokens(TokenBucket& bucket, Clock::time_point now) const;

    double rate_per_second_;
    double burst_capacity_;
    std::map<std::string, TokenBucket> buckets_;
    mutable std::mutex mutex_;
};

} // namespace meshpulse
