#pragma once

#include "license_record.hpp"
#include "types.hpp"
#include "validation_cache.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ward
{

    /**
     * Answer from the revocation endpoint.
     */
    struct RevocationStatus
    {
        bool revoked{false};
        UnixSeconds server_time{0};
    };

    /**
     * How the reconciler reaches the revocation endpoint. Any error means
     * "unreachable".
     */
    class RevocationTransport
    {
    public:
        virtual ~RevocationTransport() = default;
        virtual Result<RevocationStatus> check(const std::string &serial) = 0;
    };

    struct Endpoint
    {
        std::string host;
        std::string port{"80"};
        std::string target{"/v1/revocation"};

        /** Parse "http://host[:port][/path]"; https is not supported */
        static Result<Endpoint> parse(const std::string &url);
    };

    /**
     * HTTP/1.1 POST {"serial": "..."} using Boost.Beast. The timeout covers
     * resolve, connect, write and read together.
     */
    class HttpRevocationTransport : public RevocationTransport
    {
    public:
        HttpRevocationTransport(Endpoint endpoint, std::chrono::milliseconds timeout);

        Result<RevocationStatus> check(const std::string &serial) override;

        /** Parse a response body: {"serial", "revoked", "server_time"} */
        static Result<RevocationStatus> parse_response(const std::string &body, const std::string &serial);

    private:
        Endpoint endpoint_;
        std::chrono::milliseconds timeout_;
    };

    struct ReconcileResult
    {
        bool reachable{false};
        bool revoked{false};
        std::optional<UnixSeconds> server_time;
        std::string error; // transport failure, when unreachable
    };

    /**
     * Asks the revocation endpoint about one serial and refreshes the local
     * validation cache on success. Never looks at signatures.
     */
    class OnlineReconciler
    {
    public:
        OnlineReconciler(std::shared_ptr<RevocationTransport> transport,
                         std::shared_ptr<ValidationCache> cache,
                         int64_t clock_skew_seconds = 300);

        /**
         * On success the cache gets the record, last_online = server time and
         * the revoked flag. On failure, or when the server time is more than
         * the skew tolerance away from local_clock, the cache is left as it is.
         */
        ReconcileResult reconcile(const LicenseRecord &record, UnixSeconds local_clock);

    private:
        std::shared_ptr<RevocationTransport> transport_;
        std::shared_ptr<ValidationCache> cache_;
        int64_t clock_skew_seconds_;
    };

} // namespace ward
