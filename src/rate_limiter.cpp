/**
 * @file rate_limiter.cpp
 * @brief Implementation of token bucket rate limiting
 *
 * MeshPulse - LAN peer discovery and secure file transfer
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshpulse/rate_limiter.hpp"
#include <algorithm>
#include <stdexcept>

namespace meshpulse {

RateLimiter::RateLimiter(double rate_per_second, double burst_capacity)
    : rate_per_second_(rate_per_second)
    , burst_capacity_(burst_capacity)
{
    if (rate_per_second_ <= 0.0 || burst_capacity_ < 1.0) {
        throw std::invalid_argument("RateLimiter requires a positive rate and burst >= 1");
    }
}

bool RateLimiter::allow(const std::string& key, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        it = buckets_.emplace(key, TokenBucket{burst_capacity_, now}).first;
    }

    TokenBucket& bucket = it->second;
    refill_tokens(bucket, now);

    if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        return true;
    }

    return false;
}

double RateLimiter::get_tokens(const std::string& key, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        return burst_capacity_;
    }

    refill_tokens(it->second, now);
    return it->second.tokens;
}

void RateLimiter::refill_tokens(TokenBucket& bucket, Clock::time_point now) const {
    if (now <= bucket.last_refill) {
        return;
    }

    double seconds_elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();
    bucket.tokens = std::min(bucket.tokens + seconds_elapsed * rate_per_second_, burst_capacity_);
    bucket.last_refill = now;
}

size_t RateLimiter::get_tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

size_t RateLimiter::cleanup_inactive(std::chrono::seconds inactive_threshold, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = buckets_.begin(); it != buckets_.end(); ) {
        if (now - it->second.last_refill > inactive_threshold) {
            it = buckets_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    return removed;
}

} // namespace meshpulse
