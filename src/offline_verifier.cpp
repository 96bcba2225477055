#include "ward/offline_verifier.hpp"
#include "ward/entitlements.hpp"
#include "ward/license_key.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace ward
{

    OfflineVerifier::OfflineVerifier(VerifierConfig config) : config_(std::move(config)) {}

    Result<VerificationResult> OfflineVerifier::verify(const std::string &key_string,
                                                       const SignatureBlock &signature,
                                                       const crypto::PublicKeyRing &keys,
                                                       UnixSeconds local_clock,
                                                       const std::string &local_fingerprint)
    {
        if (!config_.audit)
        {
            return std::unexpected(WardError::config("Verifier has no audit log"));
        }

        const UnixSeconds now = local_clock;
        VerificationResult result;

        // 1. Format: no cryptographic work for noise.
        auto key = LicenseKeyCodec::decode(key_string);
        if (!key)
        {
            result.status = key.error() == KeyDecodeError::ChecksumMismatch
                                ? VerificationStatus::ChecksumMismatch
                                : VerificationStatus::MalformedKey;
            return finish(std::move(result), std::nullopt, now);
        }

        LicenseRecord record = signature.record_for(*key);
        result.serial = record.serial;
        result.expires_at = record.expires_at;

        // 2. Signature against the key version the record names.
        result.status = VerificationStatus::SignatureInvalid;
        const crypto::RsaPublicKey *public_key = keys.find(record.key_version);
        if (!public_key)
        {
            spdlog::debug("Key version {} is not in the trusted ring", record.key_version);
            return finish(std::move(result), record, now);
        }

        auto payload = record.canonical_payload();
        if (!payload)
            return std::unexpected(payload.error());

        auto sig = crypto::Base64::decode(signature.signature_b64);
        if (!sig || !public_key->verify(crypto::Bytes(payload->begin(), payload->end()), *sig))
        {
            return finish(std::move(result), record, now);
        }

        std::optional<CacheState> cached;
        if (config_.cache)
        {
            auto loaded = config_.cache->load();
            if (!loaded)
                return std::unexpected(loaded.error());
            cached = std::move(*loaded);
        }

        // 3. Clock rollback, then expiry.
        const int64_t skew = config_.clock_skew_seconds;
        if ((cached && now + skew < cached->last_seen) || record.issued_at > now + skew)
        {
            result.status = VerificationStatus::ClockTamperSuspected;
            return finish(std::move(result), record, now);
        }

        if (record.expires_at && *record.expires_at <= now)
        {
            result.status = VerificationStatus::Expired;
        }
        // 4. Hardware: exact match only.
        else if (record.hardware_binding)
        {
            std::string local = local_fingerprint;
            std::transform(local.begin(), local.end(), local.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            result.status = crypto::constant_time_equals(*record.hardware_binding, local)
                                ? VerificationStatus::Valid
                                : VerificationStatus::HardwareMismatch;
        }
        else
        {
            result.status = VerificationStatus::Valid;
        }

        // 5. Revocation only ever turns a grant into a denial.
        if (result.status == VerificationStatus::Valid)
        {
            result.status = check_revocation(record, cached, now);
        }

        if (result.status != VerificationStatus::ClockTamperSuspected)
        {
            if (auto remembered = remember(record, result.status, now); !remembered)
                return std::unexpected(remembered.error());
        }

        return finish(std::move(result), record, now);
    }

    VerificationStatus OfflineVerifier::check_revocation(const LicenseRecord &record,
                                                         const std::optional<CacheState> &cached,
                                                         UnixSeconds now)
    {
        if (!config_.reconciler)
            return VerificationStatus::Valid;

        auto online = config_.reconciler->reconcile(record, now);
        if (online.reachable)
        {
            if (online.revoked)
                return VerificationStatus::Revoked;
            if (online.server_time && std::llabs(*online.server_time - now) > config_.clock_skew_seconds)
            {
                spdlog::warn("Local clock differs from server by {} seconds", *online.server_time - now);
                return VerificationStatus::ClockTamperSuspected;
            }
            return VerificationStatus::Valid;
        }

        const bool same_license = cached && cached->record && cached->record->serial == record.serial;
        UnixSeconds anchor = record.issued_at;
        if (same_license && cached->last_online)
            anchor = *cached->last_online;

        if (anchor > now + config_.clock_skew_seconds)
        {
            spdlog::warn("License {} was last confirmed at {}, ahead of the local clock", record.serial,
                         to_iso8601(anchor));
            return VerificationStatus::ClockTamperSuspected;
        }
        if (now - anchor > config_.grace_period_seconds)
        {
            spdlog::warn("License {} not confirmed online since {}", record.serial, to_iso8601(anchor));
            return VerificationStatus::NetworkRequired;
        }
        if (same_license && cached->revoked)
            return VerificationStatus::Revoked;
        return VerificationStatus::Valid;
    }

    Result<void> OfflineVerifier::remember(const LicenseRecord &record, VerificationStatus status, UnixSeconds now)
    {
        if (!config_.cache)
            return {};

        auto updated = config_.cache->update([&](CacheState &state) {
            state.last_seen = std::max(state.last_seen, now);
            if (status == VerificationStatus::Valid && (!state.record || state.record->serial != record.serial))
            {
                // New license: its revocation history starts empty.
                state.record = record;
                state.last_online.reset();
                state.revoked = false;
            }
        });
        if (!updated)
            return std::unexpected(updated.error());
        return {};
    }

    Result<VerificationResult> OfflineVerifier::finish(VerificationResult result,
                                                       const std::optional<LicenseRecord> &record,
                                                       UnixSeconds now)
    {
        result.message = user_message(result.status);
        if (result.valid() && record)
        {
            result.tier = record->tier;
            result.entitlements = tier_entitlements(record->tier);
        }

        AuditEvent event;
        event.type = result.valid() ? AuditEventType::Verified : AuditEventType::Rejected;
        event.subject = result.serial.empty() ? std::string("unknown") : result.serial;
        event.result = status_to_string(result.status);
        event.details = {{"message", result.message}};
        if (record)
        {
            event.details["key_version"] = record->key_version;
            event.details["tier"] = tier_to_string(record->tier);
        }
        event.timestamp = now;

        if (auto appended = config_.audit->append(event); !appended)
        {
            spdlog::error("Audit append failed, withholding verification result: {}", appended.error().what());
            return std::unexpected(appended.error());
        }

        if (!result.valid())
            spdlog::info("License {} rejected: {}", event.subject, event.result);
        return result;
    }

} // namespace ward
