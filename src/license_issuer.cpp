#include "ward/license_issuer.hpp"
#include "ward/license_key.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <limits>

namespace ward
{

    ValidityWindow ValidityWindow::days(int64_t d)
    {
        constexpr int64_t kDay = 86400;
        if (d > std::numeric_limits<int64_t>::max() / kDay)
            return ValidityWindow{std::numeric_limits<int64_t>::max()};
        if (d < std::numeric_limits<int64_t>::min() / kDay)
            return ValidityWindow{std::numeric_limits<int64_t>::min()};
        return ValidityWindow{d * kDay};
    }

    LicenseIssuer::LicenseIssuer(std::shared_ptr<crypto::KeyStore> keys,
                                 std::shared_ptr<IssuanceLedger> ledger,
                                 std::shared_ptr<AuditLog> audit,
                                 SerialSource serial_source)
        : keys_(std::move(keys)),
          ledger_(std::move(ledger)),
          audit_(std::move(audit)),
          serial_source_(serial_source ? std::move(serial_source) : SerialSource(&LicenseKeyCodec::generate_serial))
    {
    }

    Result<IssuedLicense> LicenseIssuer::issue(const std::string &tier,
                                               const ValidityWindow &window,
                                               const std::optional<std::string> &hardware_fingerprint,
                                               UnixSeconds now)
    {
        auto parsed = tier_from_string(tier);
        if (!parsed)
        {
            return std::unexpected(WardError::invalid_input(parsed.error()));
        }
        return issue(*parsed, window, hardware_fingerprint, now);
    }

    Result<IssuedLicense> LicenseIssuer::issue(Tier tier,
                                               const ValidityWindow &window,
                                               const std::optional<std::string> &hardware_fingerprint,
                                               UnixSeconds now)
    {
        if (window.seconds && *window.seconds <= 0)
        {
            return std::unexpected(WardError::invalid_input(std::format(
                "Validity window must be positive, got {} seconds", *window.seconds)));
        }
        if (window.seconds && *window.seconds > std::numeric_limits<UnixSeconds>::max() - now)
        {
            return std::unexpected(WardError::invalid_input("Validity window overflows the expiry timestamp"));
        }

        std::optional<std::string> binding;
        if (hardware_fingerprint)
        {
            if (!crypto::is_sha256_hex(*hardware_fingerprint))
            {
                return std::unexpected(WardError::invalid_input("Hardware fingerprint must be 64 hex characters"));
            }
            std::string lowered = *hardware_fingerprint;
            std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            binding = lowered;
        }

        // Snapshot; a concurrent rotation does not affect this issuance.
        auto key = keys_->current_key();
        if (!key)
            return std::unexpected(key.error());

        auto serial = reserve_serial();
        if (!serial)
            return std::unexpected(serial.error());

        LicenseRecord record;
        record.tier = tier;
        record.serial = *serial;
        record.issued_at = now;
        if (window.seconds)
            record.expires_at = now + *window.seconds;
        record.hardware_binding = binding;
        record.key_version = (*key)->version;

        auto payload = record.canonical_payload();
        if (!payload)
        {
            ledger_->release(*serial);
            return std::unexpected(payload.error());
        }

        auto signature = (*key)->sign(crypto::Bytes(payload->begin(), payload->end()));
        if (!signature)
        {
            ledger_->release(*serial);
            return std::unexpected(signature.error());
        }

        if (auto committed = ledger_->commit(record); !committed)
        {
            ledger_->release(*serial);
            return std::unexpected(committed.error());
        }

        AuditEvent event;
        event.type = AuditEventType::Issued;
        event.subject = record.serial;
        event.result = "ok";
        event.details = {{"tier", tier_to_string(tier)},
                         {"key_version", record.key_version},
                         {"expires_at", record.expires_at ? nlohmann::json(*record.expires_at) : nlohmann::json(nullptr)},
                         {"hardware_bound", record.hardware_binding.has_value()}};
        event.timestamp = now;
        if (auto appended = audit_->append(event); !appended)
        {
            return std::unexpected(appended.error());
        }

        IssuedLicense issued{record.key_string(),
                             record,
                             SignatureBlock::from_record(record, crypto::Base64::encode(*signature))};
        spdlog::info("Issued {} license {} with key version {}",
                     tier_to_string(tier), issued.key_string, record.key_version);
        return issued;
    }

    Result<std::string> LicenseIssuer::reserve_serial()
    {
        for (int attempt = 0; attempt < kMaxSerialAttempts; ++attempt)
        {
            std::string candidate = serial_source_();
            if (!LicenseKeyCodec::is_valid_serial(candidate))
            {
                return std::unexpected(WardError(ErrorCode::InternalError,
                                                 std::format("Serial source produced invalid serial '{}'", candidate)));
            }
            if (ledger_->try_reserve(candidate))
                return candidate;
            spdlog::warn("Serial collision on {}, regenerating", candidate);
        }
        return std::unexpected(WardError(ErrorCode::InternalError,
                                         std::format("No unique serial after {} attempts", kMaxSerialAttempts)));
    }

} // namespace ward
