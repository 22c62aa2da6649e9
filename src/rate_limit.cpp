#include "../include/guardrail/rate_limit.hpp"
#include "../include/guardrail/errors.hpp"

#include <algorithm>
#include <cmath>

namespace guardrail {

namespace {

constexpr std::size_t kSweepInterval = 1024;

} // namespace

RateLimiter::RateLimiter(const RateLimitConfig& config, Clock clock)
    : m_capacity(config.burst_size)
    , m_refill_per_second(config.requests_per_minute / 60.0)
    , m_clock(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {
    if (!(config.requests_per_minute > 0.0) || !std::isfinite(config.requests_per_minute)) {
        throw ConfigError("requests_per_minute must be positive");
    }
    if (!(config.burst_size >= 1.0) || !std::isfinite(config.burst_size)) {
        throw ConfigError("burst_size must be at least 1");
    }

    // An evicted identity comes back with a full bucket, so only evict once
    // a full refill would have happened anyway.
    const auto full_refill = std::chrono::duration<double>(m_capacity / m_refill_per_second);
    const auto configured = std::chrono::duration<double>(config.idle_eviction);
    m_idle_window = std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::max(full_refill, configured));
}

bool RateLimiter::admit(const std::string& identity) {
    const TimePoint now = m_clock();

    bool allowed = false;
    for (;;) {
        std::shared_ptr<Bucket> bucket = bucket_for(identity, now);
        std::scoped_lock lock(bucket->mutex);
        if (bucket->evicted) {
            // Swept between lookup and lock; the replacement decides.
            continue;
        }
        refill(*bucket, now);
        if (bucket->tokens >= 1.0) {
            bucket->tokens -= 1.0;
            allowed = true;
        }
        break;
    }

    if (m_admits_since_sweep.fetch_add(1, std::memory_order_relaxed) + 1 >= kSweepInterval) {
        m_admits_since_sweep.store(0, std::memory_order_relaxed);
        evict_idle();
    }
    return allowed;
}

void RateLimiter::refund(const std::string& identity) {
    std::shared_ptr<Bucket> bucket = existing_bucket(identity);
    if (!bucket) {
        return;
    }
    const TimePoint now = m_clock();
    std::scoped_lock lock(bucket->mutex);
    refill(*bucket, now);
    bucket->tokens = std::min(m_capacity, bucket->tokens + 1.0);
}

std::size_t RateLimiter::evict_idle() {
    const TimePoint now = m_clock();
    std::scoped_lock lock(m_table_mutex);
    std::size_t evicted = 0;
    for (auto it = m_table.begin(); it != m_table.end();) {
        bool idle = false;
        {
            std::scoped_lock bucket_lock(it->second->mutex);
            idle = now - it->second->last_refill > m_idle_window;
            it->second->evicted = idle;
        }
        if (idle) {
            it = m_table.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

std::size_t RateLimiter::tracked_identities() const {
    std::scoped_lock lock(m_table_mutex);
    return m_table.size();
}

double RateLimiter::available(const std::string& identity) const {
    std::shared_ptr<Bucket> bucket = existing_bucket(identity);
    if (!bucket) {
        return m_capacity;
    }
    const TimePoint now = m_clock();
    std::scoped_lock lock(bucket->mutex);
    const double elapsed = std::max(0.0, std::chrono::duration<double>(now - bucket->last_refill).count());
    return std::min(m_capacity, bucket->tokens + elapsed * m_refill_per_second);
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::bucket_for(const std::string& identity, TimePoint now) {
    std::scoped_lock lock(m_table_mutex);
    auto& slot = m_table[identity];
    if (!slot) {
        // First sighting: treat as freshly refilled.
        slot = std::make_shared<Bucket>();
        slot->tokens = m_capacity;
        slot->last_refill = now;
    }
    return slot;
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::existing_bucket(const std::string& identity) const {
    std::scoped_lock lock(m_table_mutex);
    auto it = m_table.find(identity);
    return it == m_table.end() ? nullptr : it->second;
}

void RateLimiter::refill(Bucket& bucket, TimePoint now) const {
    if (now <= bucket.last_refill) {
        return;
    }
    const double elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();
    bucket.tokens = std::min(m_capacity, bucket.tokens + elapsed * m_refill_per_second);
    bucket.last_refill = now;
}

} // namespace guardrail
