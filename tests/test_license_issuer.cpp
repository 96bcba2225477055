#include <catch2/catch_test_macros.hpp>
#include "ward/license_issuer.hpp"
#include "test_support.hpp"
#include <vector>

using namespace ward;

namespace
{
    constexpr UnixSeconds kNow = 1'750'000'000;

    struct IssuerFixture
    {
        testing::TempDir dir;
        std::shared_ptr<crypto::KeyStore> keys = std::make_shared<crypto::KeyStore>();
        std::shared_ptr<IssuanceLedger> ledger = std::make_shared<IssuanceLedger>(dir / "issued.jsonl");
        std::shared_ptr<AuditLog> audit = std::make_shared<AuditLog>(dir / "audit.jsonl", testing::random_hmac_key());

        IssuerFixture()
        {
            keys->rotate().value();
        }
    };
}

TEST_CASE("Issued records are signed over the canonical payload", "[issuer]")
{
    IssuerFixture fx;
    LicenseIssuer issuer(fx.keys, fx.ledger, fx.audit);

    auto issued = issuer.issue("basic", ValidityWindow::days(365), std::nullopt, kNow);
    REQUIRE(issued.has_value());

    const auto &record = issued->record;
    REQUIRE(record.tier == Tier::Basic);
    REQUIRE(record.issued_at == kNow);
    REQUIRE(record.expires_at == kNow + 365 * 86400);
    REQUIRE_FALSE(record.hardware_binding.has_value());
    REQUIRE(record.key_version == 1);
    REQUIRE(issued->key_string == record.key_string());

    auto payload = record.canonical_payload().value();
    auto signature = crypto::Base64::decode(issued->signature.signature_b64).value();
    auto pub = fx.keys->current_key().value()->public_key;
    REQUIRE(pub.verify(crypto::Bytes(payload.begin(), payload.end()), signature));

    auto key = LicenseKeyCodec::decode(issued->key_string).value();
    REQUIRE(issued->signature.record_for(key) == record);
}

TEST_CASE("Canonical payload has a fixed field order", "[issuer]")
{
    LicenseRecord record;
    record.tier = Tier::GamerAi;
    record.serial = "0123456789";
    record.issued_at = 100;
    record.expires_at = 200;
    record.key_version = 3;

    REQUIRE(record.canonical_payload().value() ==
            R"({"expires_at":200,"format":1,"hardware_binding":null,"issued_at":100,)"
            R"("key_version":3,"serial":"0123456789","tier":"gamer_ai"})");
}

TEST_CASE("Invalid issuance requests are rejected, not clamped", "[issuer]")
{
    IssuerFixture fx;
    LicenseIssuer issuer(fx.keys, fx.ledger, fx.audit);

    auto unknown = issuer.issue("platinum", ValidityWindow::days(30), std::nullopt, kNow);
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().code == ErrorCode::InvalidInput);

    auto zero = issuer.issue("basic", ValidityWindow::days(0), std::nullopt, kNow);
    REQUIRE_FALSE(zero.has_value());
    REQUIRE(zero.error().code == ErrorCode::InvalidInput);

    auto negative = issuer.issue("basic", ValidityWindow{-5}, std::nullopt, kNow);
    REQUIRE_FALSE(negative.has_value());

    // Day counts whose seconds do not fit in 64 bits.
    auto huge = issuer.issue("basic", ValidityWindow::days(213503982334602), std::nullopt, kNow);
    REQUIRE_FALSE(huge.has_value());
    REQUIRE(huge.error().code == ErrorCode::InvalidInput);

    auto huge_negative = issuer.issue("basic", ValidityWindow::days(-213503982334602), std::nullopt, kNow);
    REQUIRE_FALSE(huge_negative.has_value());
    REQUIRE(huge_negative.error().code == ErrorCode::InvalidInput);

    auto bad_fp = issuer.issue("basic", ValidityWindow::days(30), std::string("abc"), kNow);
    REQUIRE_FALSE(bad_fp.has_value());
    REQUIRE(bad_fp.error().code == ErrorCode::InvalidInput);

    REQUIRE(fx.ledger->size() == 0);
}

TEST_CASE("Perpetual and hardware-bound licenses", "[issuer]")
{
    IssuerFixture fx;
    LicenseIssuer issuer(fx.keys, fx.ledger, fx.audit);

    std::string upper(64, 'A');
    auto issued = issuer.issue(Tier::Server, ValidityWindow::perpetual(), upper, kNow);
    REQUIRE(issued.has_value());
    REQUIRE_FALSE(issued->record.expires_at.has_value());
    REQUIRE(issued->record.hardware_binding == std::string(64, 'a'));
}

TEST_CASE("Serial collisions are regenerated", "[issuer]")
{
    IssuerFixture fx;
    std::vector<std::string> serials = {"AAAAAAAAAA", "AAAAAAAAAA", "AAAAAAAAAA", "BBBBBBBBBB"};
    size_t next = 0;
    LicenseIssuer issuer(fx.keys, fx.ledger, fx.audit, [&] { return serials[next++]; });

    auto first = issuer.issue("gamer", ValidityWindow::days(1), std::nullopt, kNow);
    auto second = issuer.issue("gamer", ValidityWindow::days(1), std::nullopt, kNow);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->record.serial == "AAAAAAAAAA");
    REQUIRE(second->record.serial == "BBBBBBBBBB");
    REQUIRE(next == 4);

    // A fresh ledger instance sees both serials after reload.
    IssuanceLedger reloaded(fx.dir / "issued.jsonl");
    REQUIRE(reloaded.load().has_value());
    REQUIRE(reloaded.contains("AAAAAAAAAA"));
    REQUIRE(reloaded.contains("BBBBBBBBBB"));
}

TEST_CASE("Issuance is audited with the key version", "[issuer][audit]")
{
    IssuerFixture fx;
    LicenseIssuer issuer(fx.keys, fx.ledger, fx.audit);
    auto issued = issuer.issue("workplace", ValidityWindow::days(90), std::nullopt, kNow).value();

    auto entries = fx.audit->entries().value();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].event_type == AuditEventType::Issued);
    REQUIRE(entries[0].subject == issued.record.serial);
    REQUIRE(entries[0].details.at("key_version") == 1);
    REQUIRE(entries[0].details.at("tier") == "workplace");
}

TEST_CASE("Issuance after rotation uses the new key", "[issuer][keys]")
{
    IssuerFixture fx;
    LicenseIssuer issuer(fx.keys, fx.ledger, fx.audit);

    auto before = issuer.issue("basic", ValidityWindow::days(10), std::nullopt, kNow).value();
    REQUIRE(fx.keys->rotate().value() == 2);
    auto after = issuer.issue("basic", ValidityWindow::days(10), std::nullopt, kNow).value();

    REQUIRE(before.record.key_version == 1);
    REQUIRE(after.record.key_version == 2);
}

TEST_CASE("License files survive a save and load", "[issuer][file]")
{
    IssuerFixture fx;
    LicenseIssuer issuer(fx.keys, fx.ledger, fx.audit);
    auto issued = issuer.issue("server", ValidityWindow::perpetual(), std::string(64, 'c'), kNow).value();

    auto path = fx.dir / "license.json";
    REQUIRE(issued.file().save(path).has_value());

    auto loaded = LicenseFile::load(path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->key == issued.key_string);
    REQUIRE(loaded->block.issued_at == kNow);
    REQUIRE_FALSE(loaded->block.expires_at.has_value());
    REQUIRE(loaded->block.hardware_binding == std::string(64, 'c'));
    REQUIRE(loaded->block.signature_b64 == issued.signature.signature_b64);

    REQUIRE_FALSE(LicenseFile::load(fx.dir / "missing.json").has_value());
}
