#include "ward/rate_limiter.hpp"
#include <algorithm>

namespace ward
{
    RateLimiter::RateLimiter() : RateLimiter(Config{}) {}

    RateLimiter::RateLimiter(const Config &cfg, Clock clock)
        : cfg_(cfg), clock_(clock ? std::move(clock) : Clock(&std::chrono::steady_clock::now))
    {
    }

    void RateLimiter::refill(Bucket &bucket, std::chrono::steady_clock::time_point now)
    {
        if (!bucket.initialized)
        {
            bucket.initialized = true;
            bucket.last_refill = now;
            bucket.tokens = cfg_.burst_capacity;
            return;
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - bucket.last_refill).count();
        if (elapsed <= 0)
            return;
        bucket.tokens = std::min(cfg_.burst_capacity, bucket.tokens + elapsed * cfg_.tokens_per_second);
        bucket.last_refill = now;
    }

    void RateLimiter::evict_idle(std::chrono::steady_clock::time_point now)
    {
        // A bucket that would have refilled completely is indistinguishable from a new one.
        std::erase_if(buckets_, [&](const auto &entry) {
            const Bucket &b = entry.second;
            auto idle = std::chrono::duration_cast<std::chrono::duration<double>>(now - b.last_refill).count();
            return b.tokens + idle * cfg_.tokens_per_second >= cfg_.burst_capacity;
        });
    }

    bool RateLimiter::allow(const std::string &key)
    {
        auto now = clock_();
        std::lock_guard lock(mutex_);
        if (buckets_.size() >= cfg_.max_clients && !buckets_.contains(key))
        {
            evict_idle(now);
        }
        auto &bucket = buckets_[key];
        refill(bucket, now);
        if (bucket.tokens < 1.0)
        {
            return false;
        }
        bucket.tokens -= 1.0;
        return true;
    }

    std::size_t RateLimiter::tracked_clients() const
    {
        std::lock_guard lock(mutex_);
        return buckets_.size();
    }

} // namespace ward
