#pragma once

#include "crypto.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ward
{
    enum class AuditEventType
    {
        Issued,
        Verified,
        Rejected,
        Revoked
    };

    std::string event_type_to_string(AuditEventType type);
    std::optional<AuditEventType> event_type_from_string(const std::string &s);

    /**
     * What a caller records. The log assigns sequence, time (unless given)
     * and chain fields.
     */
    struct AuditEvent
    {
        AuditEventType type{AuditEventType::Verified};
        std::string subject{"unknown"}; // license serial
        std::string result;             // taxonomy value, e.g. "signature_invalid"
        nlohmann::json details = nlohmann::json::object();
        std::optional<UnixSeconds> timestamp;
    };

    /**
     * One stored line of the audit log.
     */
    struct AuditEntry
    {
        uint64_t seq{0};
        UnixSeconds timestamp{0};
        AuditEventType event_type{AuditEventType::Verified};
        std::string subject;
        std::string result;
        nlohmann::json details = nlohmann::json::object();
        std::string prev_hash;
        std::string entry_hmac;

        /** All fields except entry_hmac; canonicalized for the HMAC */
        nlohmann::json body_json() const;
        nlohmann::json to_json() const;
        static Result<AuditEntry> from_json(const nlohmann::json &j);
    };

    struct ChainReport
    {
        bool valid{true};
        size_t entries{0};
        std::optional<size_t> first_invalid; // index of the first bad entry
        std::string reason;
    };

    /**
     * Append-only, HMAC-chained audit log stored as JSON lines.
     *
     * entry_hmac = HMAC-SHA256(audit_key, prev_hash || canonical(body)),
     * with prev_hash of entry 0 fixed at kGenesisHash. Appends are serialized
     * in-process by a mutex and across processes by a file lock, so the chain
     * never forks.
     */
    class AuditLog
    {
    public:
        static constexpr std::string_view kGenesisHash =
            "0000000000000000000000000000000000000000000000000000000000000000";

        AuditLog(std::filesystem::path path, const crypto::HmacKey &key);

        /**
         * Durably append an event and return its entry hash. Also mirrors the
         * entry to the operational log.
         */
        Result<std::string> append(const AuditEvent &event);

        /**
         * Recompute the chain from entry 0. Reports the first entry whose
         * sequence, link or HMAC does not check out.
         */
        Result<ChainReport> verify_chain() const;

        /** Parsed entries, in order. Fails on an unparseable line. */
        Result<std::vector<AuditEntry>> entries() const;

        const std::filesystem::path &path() const { return path_; }

        static std::string compute_hmac(const crypto::HmacKey &key,
                                        const std::string &prev_hash,
                                        const std::string &canonical_body);

        /** 32-byte key from base64 (config value or WARD_AUDIT_KEY) */
        static Result<crypto::HmacKey> key_from_base64(const std::string &b64);

    private:
        Result<std::vector<std::string>> read_lines() const;

        std::filesystem::path path_;
        crypto::HmacKey key_;
        mutable std::mutex mutex_;
    };

} // namespace ward
