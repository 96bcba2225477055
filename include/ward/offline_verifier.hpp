#pragma once

#include "audit.hpp"
#include "key_manager.hpp"
#include "license_record.hpp"
#include "online_reconciler.hpp"
#include "validation_cache.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ward
{

    struct VerificationResult
    {
        VerificationStatus status{VerificationStatus::MalformedKey};
        std::optional<Tier> tier; // set only when valid
        std::string serial;       // empty when the key did not decode
        std::optional<UnixSeconds> expires_at;
        std::vector<std::string> entitlements;
        std::string message; // user-facing reason

        bool valid() const { return status == VerificationStatus::Valid; }
    };

    struct VerifierConfig
    {
        std::shared_ptr<AuditLog> audit;                // required
        std::shared_ptr<ValidationCache> cache;         // optional
        std::shared_ptr<OnlineReconciler> reconciler;   // optional; none = pure offline
        int64_t clock_skew_seconds{300};
        int64_t grace_period_seconds{30 * 86400};
    };

    /**
     * Client-side license check. Runs format, signature, clock/expiry,
     * hardware and revocation checks in that order, stopping at the first
     * failure. Every outcome is written to the audit log before returning; a
     * failed audit write is returned as an error, never as a grant.
     */
    class OfflineVerifier
    {
    public:
        explicit OfflineVerifier(VerifierConfig config);

        Result<VerificationResult> verify(const std::string &key_string,
                                          const SignatureBlock &signature,
                                          const crypto::PublicKeyRing &keys,
                                          UnixSeconds local_clock,
                                          const std::string &local_fingerprint);

        Result<VerificationResult> verify(const LicenseFile &license,
                                          const crypto::PublicKeyRing &keys,
                                          UnixSeconds local_clock,
                                          const std::string &local_fingerprint)
        {
            return verify(license.key, license.block, keys, local_clock, local_fingerprint);
        }

    private:
        VerificationStatus check_revocation(const LicenseRecord &record,
                                            const std::optional<CacheState> &cached,
                                            UnixSeconds now);

        Result<void> remember(const LicenseRecord &record, VerificationStatus status, UnixSeconds now);

        Result<VerificationResult> finish(VerificationResult result,
                                          const std::optional<LicenseRecord> &record,
                                          UnixSeconds now);

        VerifierConfig config_;
    };

} // namespace ward
