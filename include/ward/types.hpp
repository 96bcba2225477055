#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ward
{

    /** Unix time in whole seconds (UTC). */
    using UnixSeconds = std::int64_t;

    /**
     * Product tiers a license can grant. The set is closed: a key string whose
     * prefix is not in this table is rejected before any cryptographic work.
     */
    enum class Tier
    {
        Basic,
        Workplace,
        Gamer,
        AiDev,
        GamerAi,
        Server
    };

    /**
     * Canonical lowercase name used in signed payloads ("basic", "ai_dev", ...)
     */
    std::string tier_to_string(Tier tier);

    /**
     * Parse a tier name. Accepts the canonical names plus the hyphenated
     * spellings used by the storefront ("ai-dev", "gamer-ai").
     */
    std::expected<Tier, std::string> tier_from_string(const std::string &s);

    /**
     * Four-letter key string prefix for a tier (BSIC, WORK, GAME, AIDV, GMAI, SERV)
     */
    std::string_view tier_prefix(Tier tier);

    /**
     * Reverse prefix lookup; expects an uppercase prefix.
     */
    std::optional<Tier> tier_from_prefix(std::string_view prefix);

    /**
     * All tiers in declaration order
     */
    const std::vector<Tier> &all_tiers();

    /**
     * Outcome taxonomy of an offline verification. Everything except Valid is a
     * denial; NetworkRequired is the only soft one.
     */
    enum class VerificationStatus
    {
        Valid,
        MalformedKey,
        ChecksumMismatch,
        SignatureInvalid,
        Expired,
        Revoked,
        HardwareMismatch,
        ClockTamperSuspected,
        NetworkRequired
    };

    /** Snake-case identifier recorded in audit entries ("signature_invalid") */
    std::string status_to_string(VerificationStatus status);

    /**
     * Reason shown to end users. Deliberately free of cryptographic terms:
     * "invalid key", "expired", "wrong machine", "offline too long", ...
     */
    std::string user_message(VerificationStatus status);

    /**
     * Error categories for ward operations
     */
    enum class ErrorCode
    {
        ConfigError,
        CryptoError,
        KeyGenerationFailed,
        ValidationError,
        StorageError,
        LicenseError,
        NotFound,
        AlreadyExists,
        InvalidInput,
        NetworkError,
        InternalError,
        IOError,
        ParsingError
    };

    /**
     * Ward error with code and message
     */
    class WardError : public std::runtime_error
    {
    public:
        ErrorCode code;

        WardError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static WardError config(const std::string &msg)
        {
            return WardError(ErrorCode::ConfigError, msg);
        }

        static WardError crypto(const std::string &msg)
        {
            return WardError(ErrorCode::CryptoError, msg);
        }

        /** Fatal: entropy source unavailable or key generation failed. */
        static WardError key_generation(const std::string &msg)
        {
            return WardError(ErrorCode::KeyGenerationFailed, msg);
        }

        static WardError validation(const std::string &msg)
        {
            return WardError(ErrorCode::ValidationError, msg);
        }

        static WardError storage(const std::string &msg)
        {
            return WardError(ErrorCode::StorageError, msg);
        }

        static WardError license(const std::string &msg)
        {
            return WardError(ErrorCode::LicenseError, msg);
        }

        static WardError not_found(const std::string &msg)
        {
            return WardError(ErrorCode::NotFound, msg);
        }

        static WardError invalid_input(const std::string &msg)
        {
            return WardError(ErrorCode::InvalidInput, msg);
        }

        static WardError network(const std::string &msg)
        {
            return WardError(ErrorCode::NetworkError, msg);
        }

        static WardError io(const std::string &msg)
        {
            return WardError(ErrorCode::IOError, msg);
        }

        static WardError parsing(const std::string &msg)
        {
            return WardError(ErrorCode::ParsingError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, WardError>;

    /**
     * Current wall clock as Unix seconds
     */
    UnixSeconds unix_now();

    /**
     * Format Unix seconds as ISO 8601 UTC ("2025-01-31T12:00:00Z")
     */
    std::string to_iso8601(UnixSeconds t);

} // namespace ward
