#pragma once

#include "audit.hpp"
#include "issuance_ledger.hpp"
#include "key_manager.hpp"
#include "license_record.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ward
{

    /**
     * How long a license stays valid after issuance. Either a positive number
     * of seconds or explicitly perpetual.
     */
    struct ValidityWindow
    {
        std::optional<int64_t> seconds; // nullopt = perpetual

        /** Out-of-range day counts saturate so issue() rejects them */
        static ValidityWindow days(int64_t d);
        static ValidityWindow perpetual() { return ValidityWindow{std::nullopt}; }
    };

    /** Result of a successful issuance */
    struct IssuedLicense
    {
        std::string key_string;
        LicenseRecord record;
        SignatureBlock signature;

        /** Distributable document (key + signature block) */
        LicenseFile file() const { return LicenseFile{key_string, signature}; }
    };

    /**
     * Signs license records with the current issuing key.
     */
    class LicenseIssuer
    {
    public:
        using SerialSource = std::function<std::string()>;

        static constexpr int kMaxSerialAttempts = 16;

        /**
         * @param serial_source Serial generator; defaults to
         *        LicenseKeyCodec::generate_serial
         */
        LicenseIssuer(std::shared_ptr<crypto::KeyStore> keys,
                      std::shared_ptr<IssuanceLedger> ledger,
                      std::shared_ptr<AuditLog> audit,
                      SerialSource serial_source = {});

        /**
         * Issue a license. Unknown tiers, non-positive windows and malformed
         * fingerprints are rejected with InvalidInput; nothing is clamped.
         * The issued event is in the audit log before this returns.
         */
        Result<IssuedLicense> issue(const std::string &tier,
                                    const ValidityWindow &window,
                                    const std::optional<std::string> &hardware_fingerprint,
                                    UnixSeconds now = unix_now());

        Result<IssuedLicense> issue(Tier tier,
                                    const ValidityWindow &window,
                                    const std::optional<std::string> &hardware_fingerprint,
                                    UnixSeconds now = unix_now());

    private:
        Result<std::string> reserve_serial();

        std::shared_ptr<crypto::KeyStore> keys_;
        std::shared_ptr<IssuanceLedger> ledger_;
        std::shared_ptr<AuditLog> audit_;
        SerialSource serial_source_;
    };

} // namespace ward
