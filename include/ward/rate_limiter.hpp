#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ward
{
    /**
     * Thread-safe token-bucket rate limiter keyed by client identifier.
     * Defaults: 60 requests per minute per key.
     */
    class RateLimiter
    {
    public:
        using Clock = std::function<std::chrono::steady_clock::time_point()>;

        struct Config
        {
            double tokens_per_second{1.0}; // 60 per minute
            double burst_capacity{60.0};   // allow short bursts
            std::size_t max_clients{10000}; // idle full buckets are evicted past this
        };

        RateLimiter();
        explicit RateLimiter(const Config &cfg, Clock clock = {});

        /** Returns true if a token is available for the given key. */
        bool allow(const std::string &key);

        std::size_t tracked_clients() const;

    private:
        struct Bucket
        {
            double tokens{0.0};
            std::chrono::steady_clock::time_point last_refill{};
            bool initialized{false};
        };

        void refill(Bucket &bucket, std::chrono::steady_clock::time_point now);
        void evict_idle(std::chrono::steady_clock::time_point now);

        Config cfg_;
        Clock clock_;
        std::unordered_map<std::string, Bucket> buckets_;
        mutable std::mutex mutex_;
    };
}
