#pragma once

#include "license_key.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace ward
{

    /**
     * The signed license payload.
     */
    struct LicenseRecord
    {
        /** Version of the canonical field set; part of the signed bytes */
        static constexpr int kFormatVersion = 1;

        Tier tier{Tier::Basic};
        std::string serial;
        UnixSeconds issued_at{0};
        std::optional<UnixSeconds> expires_at;       // nullopt = perpetual
        std::optional<std::string> hardware_binding; // lowercase SHA-256 hex
        uint32_t key_version{0};

        /**
         * {"format", "tier", "serial", "issued_at", "expires_at",
         *  "hardware_binding", "key_version"} with explicit nulls
         */
        nlohmann::json to_json() const;

        static Result<LicenseRecord> from_json(const nlohmann::json &j);

        /**
         * RFC 8785 serialization of to_json(). These are the bytes the issuer
         * signs and the verifier checks.
         */
        Result<std::string> canonical_payload() const;

        /** Key string carrying this record's tier and serial */
        std::string key_string() const;

        bool operator==(const LicenseRecord &) const = default;
    };

    /**
     * Everything distributed alongside the key string: the record fields the
     * key does not carry, plus the base64 signature.
     */
    struct SignatureBlock
    {
        UnixSeconds issued_at{0};
        std::optional<UnixSeconds> expires_at;
        std::optional<std::string> hardware_binding;
        uint32_t key_version{0};
        std::string signature_b64;

        /**
         * Rebuild the record the signature should cover. Tier and serial
         * always come from the decoded key string.
         */
        LicenseRecord record_for(const LicenseKey &key) const;

        static SignatureBlock from_record(const LicenseRecord &record, std::string signature_b64);
    };

    /**
     * Distributed license document:
     * {"key", "tier", "issued_at", "expires_at", "hardware_binding",
     *  "key_version", "signature"}. "tier" is informational only.
     */
    struct LicenseFile
    {
        std::string key;
        SignatureBlock block;

        nlohmann::json to_json() const;
        static Result<LicenseFile> from_json(const nlohmann::json &j);

        static Result<LicenseFile> load(const std::filesystem::path &path);
        Result<void> save(const std::filesystem::path &path) const;
    };

} // namespace ward
