#pragma once

#include "config.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace guardrail {

// Token bucket per identity. Capacity is burst_size and tokens accrue
// continuously at requests_per_minute / 60 per second; fractional tokens
// carry over between calls.
class RateLimiter {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    // Throws ConfigError for a non-positive rate or a burst below one.
    explicit RateLimiter(const RateLimitConfig& config, Clock clock = Clock());

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Refills, then takes one token if available. Rejections cost nothing.
    bool admit(const std::string& identity);

    // Returns one token, capped at capacity. No-op for unknown identities.
    void refund(const std::string& identity);

    // Drops buckets idle for longer than the eviction window; returns how many.
    std::size_t evict_idle();

    std::size_t tracked_identities() const;

    // Current balance after refill, without consuming. Unknown identities
    // report a full bucket.
    double available(const std::string& identity) const;

    double capacity() const noexcept { return m_capacity; }
    double refill_per_second() const noexcept { return m_refill_per_second; }

private:
    struct Bucket {
        std::mutex mutex;
        double tokens = 0.0;
        TimePoint last_refill;
        bool evicted = false; // no longer in the table; callers must look up again
    };

    double m_capacity;
    double m_refill_per_second;
    std::chrono::steady_clock::duration m_idle_window;
    Clock m_clock;

    mutable std::mutex m_table_mutex;
    std::unordered_map<std::string, std::shared_ptr<Bucket>> m_table;
    std::atomic<std::size_t> m_admits_since_sweep{0};

    std::shared_ptr<Bucket> bucket_for(const std::string& identity, TimePoint now);
    std::shared_ptr<Bucket> existing_bucket(const std::string& identity) const;
    void refill(Bucket& bucket, TimePoint now) const;
};

} // namespace guardrail
