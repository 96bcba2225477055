#pragma once

#include "rate_limiter.hpp"
#include "revocation_list.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace ward
{
    struct RevocationServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8080};
        std::size_t threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
        RateLimiter::Config rate_limit{};
        std::shared_ptr<RevocationList> revocations; // required
    };

    /**
     * Boost.Beast HTTP server answering revocation queries:
     *   GET  /health
     *   POST /v1/revocation  {"serial"} -> {"serial", "revoked", "server_time"}
     * with per-client rate limiting.
     */
    class RevocationServer
    {
    public:
        explicit RevocationServer(const RevocationServerConfig &cfg);
        ~RevocationServer();

        /** Bind and listen; returns the bound port (useful with port 0). */
        std::uint16_t listen();

        /** Start the server (listening first if needed) and block until stopped. */
        void run();

        /** Request a stop; active connections complete gracefully. */
        void stop();

        /** Build the response body for a request body; exposed for tests. */
        static std::pair<unsigned, std::string> handle_revocation(const std::string &body,
                                                                  const RevocationList &revocations);

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
