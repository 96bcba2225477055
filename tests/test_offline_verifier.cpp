#include <catch2/catch_test_macros.hpp>
#include "ward/license_issuer.hpp"
#include "ward/offline_verifier.hpp"
#include "test_support.hpp"
#include <limits>

using namespace ward;

namespace
{
    constexpr UnixSeconds kNow = 1'750'000'000;
    constexpr int64_t kDay = 86400;

    class FakeTransport : public RevocationTransport
    {
    public:
        bool reachable{true};
        bool revoked{false};
        std::optional<UnixSeconds> server_time; // defaults to the verifier's clock
        UnixSeconds clock{kNow};
        int calls{0};

        Result<RevocationStatus> check(const std::string &) override
        {
            ++calls;
            if (!reachable)
                return std::unexpected(WardError::network("connection refused"));
            return RevocationStatus{revoked, server_time.value_or(clock)};
        }
    };

    struct VerifierFixture
    {
        testing::TempDir dir;
        std::shared_ptr<crypto::KeyStore> keys = std::make_shared<crypto::KeyStore>();
        std::shared_ptr<AuditLog> audit = std::make_shared<AuditLog>(dir / "audit.jsonl", testing::random_hmac_key());
        std::shared_ptr<ValidationCache> cache =
            std::make_shared<ValidationCache>(dir / "cache.json", testing::kFingerprintA);
        LicenseIssuer issuer{keys, std::make_shared<IssuanceLedger>(), audit};

        VerifierFixture()
        {
            keys->rotate().value();
        }

        crypto::PublicKeyRing ring(size_t retain = 4) const
        {
            return keys->public_key_ring(retain).value();
        }

        OfflineVerifier offline() const
        {
            VerifierConfig cfg;
            cfg.audit = audit;
            cfg.cache = cache;
            return OfflineVerifier(cfg);
        }

        OfflineVerifier online(std::shared_ptr<FakeTransport> transport) const
        {
            VerifierConfig cfg;
            cfg.audit = audit;
            cfg.cache = cache;
            cfg.reconciler = std::make_shared<OnlineReconciler>(transport, cache);
            return OfflineVerifier(cfg);
        }
    };

    VerificationStatus status_of(const Result<VerificationResult> &r)
    {
        REQUIRE(r.has_value());
        return r->status;
    }
}

TEST_CASE("Basic license is valid now and expired after 366 days", "[verifier]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("basic", ValidityWindow::days(365), std::nullopt, kNow).value();
    auto verifier = fx.offline();

    auto now = verifier.verify(issued.key_string, issued.signature, fx.ring(), kNow, testing::kFingerprintA);
    REQUIRE(now.has_value());
    REQUIRE(now->status == VerificationStatus::Valid);
    REQUIRE(now->tier == Tier::Basic);
    REQUIRE(now->message == "license active");
    REQUIRE(now->entitlements.front() == "encrypted_storage");

    auto later = verifier.verify(issued.key_string, issued.signature, fx.ring(), kNow + 366 * kDay,
                                 testing::kFingerprintA);
    REQUIRE(later.has_value());
    REQUIRE(later->status == VerificationStatus::Expired);
    REQUIRE_FALSE(later->tier.has_value());
    REQUIRE(later->entitlements.empty());
    REQUIRE(later->message == "expired");
}

TEST_CASE("Every tier round-trips through issue and verify", "[verifier]")
{
    VerifierFixture fx;
    auto verifier = fx.offline();
    auto ring = fx.ring();

    for (auto tier : all_tiers())
    {
        auto issued = fx.issuer.issue(tier, ValidityWindow::days(30), std::nullopt, kNow).value();
        auto result = verifier.verify(issued.file(), ring, kNow + 60, testing::kFingerprintA);
        REQUIRE(result.has_value());
        REQUIRE(result->valid());
        REQUIRE(result->tier == tier);
    }
}

TEST_CASE("Key format errors are rejected before signature work", "[verifier]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("gamer", ValidityWindow::days(30), std::nullopt, kNow).value();
    auto verifier = fx.offline();
    crypto::PublicKeyRing empty_ring; // any signature work would fail differently

    REQUIRE(status_of(verifier.verify("not-a-key", issued.signature, empty_ring, kNow, testing::kFingerprintA)) ==
            VerificationStatus::MalformedKey);

    std::string typo = issued.key_string;
    typo[6] = typo[6] == '0' ? '1' : '0';
    auto result = verifier.verify(typo, issued.signature, empty_ring, kNow, testing::kFingerprintA);
    REQUIRE(status_of(result) == VerificationStatus::ChecksumMismatch);
    REQUIRE(result->message == "invalid key");
}

TEST_CASE("Any bit flip in the payload or signature invalidates the license", "[verifier]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("workplace", ValidityWindow::days(30), std::nullopt, kNow).value();
    auto verifier = fx.offline();
    auto ring = fx.ring();

    SECTION("signature bits")
    {
        auto sig = crypto::Base64::decode(issued.signature.signature_b64).value();
        for (size_t byte : {size_t{0}, sig.size() / 2, sig.size() - 1})
        {
            auto tampered = issued.signature;
            auto bytes = sig;
            bytes[byte] ^= 0x01;
            tampered.signature_b64 = crypto::Base64::encode(bytes);
            REQUIRE(status_of(verifier.verify(issued.key_string, tampered, ring, kNow, testing::kFingerprintA)) ==
                    VerificationStatus::SignatureInvalid);
        }
    }

    SECTION("payload fields")
    {
        auto later_issue = issued.signature;
        later_issue.issued_at ^= 1;
        REQUIRE(status_of(verifier.verify(issued.key_string, later_issue, ring, kNow, testing::kFingerprintA)) ==
                VerificationStatus::SignatureInvalid);

        auto longer = issued.signature;
        *longer.expires_at ^= 1 << 20;
        REQUIRE(status_of(verifier.verify(issued.key_string, longer, ring, kNow, testing::kFingerprintA)) ==
                VerificationStatus::SignatureInvalid);

        auto unbound = issued.signature;
        unbound.hardware_binding = testing::kFingerprintA;
        REQUIRE(status_of(verifier.verify(issued.key_string, unbound, ring, kNow, testing::kFingerprintA)) ==
                VerificationStatus::SignatureInvalid);

        auto perpetual = issued.signature;
        perpetual.expires_at.reset();
        REQUIRE(status_of(verifier.verify(issued.key_string, perpetual, ring, kNow, testing::kFingerprintA)) ==
                VerificationStatus::SignatureInvalid);
    }

    SECTION("tier in the key string")
    {
        // Re-encode the same serial under another tier with a valid checksum.
        auto key = LicenseKeyCodec::decode(issued.key_string).value();
        auto upgraded = LicenseKeyCodec::encode(Tier::Server, key.serial);
        REQUIRE(status_of(verifier.verify(upgraded, issued.signature, ring, kNow, testing::kFingerprintA)) ==
                VerificationStatus::SignatureInvalid);
    }
}

TEST_CASE("Hardware-bound licenses only verify on the bound machine", "[verifier]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("ai-dev", ValidityWindow::days(30), testing::kFingerprintA, kNow).value();
    auto verifier = fx.offline();

    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow, testing::kFingerprintA)) ==
            VerificationStatus::Valid);

    auto other = verifier.verify(issued.file(), fx.ring(), kNow, testing::kFingerprintB);
    REQUIRE(status_of(other) == VerificationStatus::HardwareMismatch);
    REQUIRE(other->message == "wrong machine");

    std::string one_off = testing::kFingerprintA;
    one_off.back() = 'b';
    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow, one_off)) ==
            VerificationStatus::HardwareMismatch);
}

TEST_CASE("Licenses survive rotation until their key ages out", "[verifier][keys]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("basic", ValidityWindow::perpetual(), std::nullopt, kNow).value();
    auto verifier = fx.offline();

    for (uint32_t expected = 2; expected <= 5; ++expected)
    {
        REQUIRE(fx.keys->rotate().value() == expected);
        INFO("current version " << expected);
        REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(4), kNow, testing::kFingerprintA)) ==
                VerificationStatus::Valid);
    }

    // Version 6 makes version 1 the fifth previous key: out of a 4-key retention.
    REQUIRE(fx.keys->rotate().value() == 6);
    REQUIRE(fx.ring(4).find(1) == nullptr);
    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(4), kNow, testing::kFingerprintA)) ==
            VerificationStatus::SignatureInvalid);
}

TEST_CASE("Clock rollback is flagged", "[verifier][cache]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("basic", ValidityWindow::days(365), std::nullopt, kNow).value();
    auto verifier = fx.offline();

    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow + 100 * kDay, testing::kFingerprintA)) ==
            VerificationStatus::Valid);

    // Small drift within the skew tolerance is fine.
    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow + 100 * kDay - 60, testing::kFingerprintA)) ==
            VerificationStatus::Valid);

    auto rolled_back = verifier.verify(issued.file(), fx.ring(), kNow + 10 * kDay, testing::kFingerprintA);
    REQUIRE(status_of(rolled_back) == VerificationStatus::ClockTamperSuspected);
    REQUIRE(rolled_back->message == "system clock problem");

    // The highest observed time is not lowered by the rejected attempt.
    REQUIRE(fx.cache->load().value()->last_seen == kNow + 100 * kDay);
}

TEST_CASE("License issued in the future means the clock is behind", "[verifier]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("basic", ValidityWindow::days(365), std::nullopt, kNow).value();
    auto verifier = fx.offline();

    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow - kDay, testing::kFingerprintA)) ==
            VerificationStatus::ClockTamperSuspected);
}

TEST_CASE("Online revocation denies and refreshes the cache", "[verifier][reconciler]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("gamer", ValidityWindow::days(365), std::nullopt, kNow).value();
    auto transport = std::make_shared<FakeTransport>();
    auto verifier = fx.online(transport);

    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow, testing::kFingerprintA)) ==
            VerificationStatus::Valid);
    REQUIRE(transport->calls == 1);
    auto cached = fx.cache->load().value();
    REQUIRE(cached->last_online == kNow);
    REQUIRE_FALSE(cached->revoked);

    transport->revoked = true;
    transport->clock = kNow + kDay;
    auto revoked = verifier.verify(issued.file(), fx.ring(), kNow + kDay, testing::kFingerprintA);
    REQUIRE(status_of(revoked) == VerificationStatus::Revoked);
    REQUIRE(revoked->message == "license revoked");
    REQUIRE(fx.cache->load().value()->revoked);

    // Offline afterwards: the cached revocation still applies within grace.
    transport->reachable = false;
    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow + 2 * kDay, testing::kFingerprintA)) ==
            VerificationStatus::Revoked);
}

TEST_CASE("Revocation is never checked for invalid signatures", "[verifier][reconciler]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("gamer", ValidityWindow::days(365), std::nullopt, kNow).value();
    auto transport = std::make_shared<FakeTransport>();
    auto verifier = fx.online(transport);

    auto tampered = issued.signature;
    tampered.issued_at += 1;
    REQUIRE(status_of(verifier.verify(issued.key_string, tampered, fx.ring(), kNow, testing::kFingerprintA)) ==
            VerificationStatus::SignatureInvalid);
    REQUIRE(transport->calls == 0);
}

TEST_CASE("Server clock disagreement is flagged", "[verifier][reconciler]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("server", ValidityWindow::days(365), std::nullopt, kNow).value();
    auto transport = std::make_shared<FakeTransport>();
    transport->server_time = kNow + 3 * kDay;
    auto verifier = fx.online(transport);

    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow, testing::kFingerprintA)) ==
            VerificationStatus::ClockTamperSuspected);

    // The rejected server time must not extend the offline grace period.
    REQUIRE_FALSE(fx.cache->load().value()->last_online.has_value());
    transport->reachable = false;
    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow + 32 * kDay, testing::kFingerprintA)) ==
            VerificationStatus::NetworkRequired);
}

TEST_CASE("Far-future server time never keeps a license valid offline", "[verifier][reconciler]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("basic", ValidityWindow::days(3650), std::nullopt, kNow).value();
    auto transport = std::make_shared<FakeTransport>();
    transport->server_time = std::numeric_limits<UnixSeconds>::max();
    auto verifier = fx.online(transport);

    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow, testing::kFingerprintA)) ==
            VerificationStatus::ClockTamperSuspected);

    transport->reachable = false;
    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow + 365 * kDay, testing::kFingerprintA)) ==
            VerificationStatus::NetworkRequired);
}

TEST_CASE("Cached confirmation ahead of the local clock is flagged", "[verifier][reconciler]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("basic", ValidityWindow::days(365), std::nullopt, kNow).value();
    fx.cache->update([&](CacheState &state) {
        state.record = issued.record;
        state.last_online = kNow + 10 * kDay;
        state.last_seen = kNow;
    }).value();

    auto transport = std::make_shared<FakeTransport>();
    transport->reachable = false;
    auto verifier = fx.online(transport);

    REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow + kDay, testing::kFingerprintA)) ==
            VerificationStatus::ClockTamperSuspected);
}

TEST_CASE("Unreachable revocation service degrades within the grace period", "[verifier][reconciler]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("basic", ValidityWindow::days(365), std::nullopt, kNow).value();
    auto transport = std::make_shared<FakeTransport>();
    auto verifier = fx.online(transport);

    SECTION("never confirmed online: grace counts from issuance")
    {
        transport->reachable = false;
        REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow + 29 * kDay, testing::kFingerprintA)) ==
                VerificationStatus::Valid);

        auto late = verifier.verify(issued.file(), fx.ring(), kNow + 31 * kDay, testing::kFingerprintA);
        REQUIRE(status_of(late) == VerificationStatus::NetworkRequired);
        REQUIRE(late->message == "offline too long");
    }

    SECTION("grace counts from the last confirmation")
    {
        transport->clock = kNow + 100 * kDay;
        REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow + 100 * kDay, testing::kFingerprintA)) ==
                VerificationStatus::Valid);

        transport->reachable = false;
        REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow + 125 * kDay, testing::kFingerprintA)) ==
                VerificationStatus::Valid);
        REQUIRE(status_of(verifier.verify(issued.file(), fx.ring(), kNow + 131 * kDay, testing::kFingerprintA)) ==
                VerificationStatus::NetworkRequired);

        // Failed calls leave the last confirmation untouched.
        REQUIRE(fx.cache->load().value()->last_online == kNow + 100 * kDay);
    }
}

TEST_CASE("Every outcome is audited", "[verifier][audit]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("basic", ValidityWindow::days(365), std::nullopt, kNow).value();
    auto verifier = fx.offline();
    size_t before = fx.audit->entries().value().size();

    REQUIRE(verifier.verify(issued.file(), fx.ring(), kNow, testing::kFingerprintA).has_value());
    REQUIRE(verifier.verify("garbage", issued.signature, fx.ring(), kNow, testing::kFingerprintA).has_value());
    REQUIRE(verifier.verify(issued.file(), fx.ring(), kNow + 400 * kDay, testing::kFingerprintA).has_value());

    auto entries = fx.audit->entries().value();
    REQUIRE(entries.size() == before + 3);

    REQUIRE(entries[before].event_type == AuditEventType::Verified);
    REQUIRE(entries[before].result == "valid");
    REQUIRE(entries[before].subject == issued.record.serial);

    REQUIRE(entries[before + 1].event_type == AuditEventType::Rejected);
    REQUIRE(entries[before + 1].result == "malformed_key");
    REQUIRE(entries[before + 1].subject == "unknown");

    REQUIRE(entries[before + 2].result == "expired");
    REQUIRE(fx.audit->verify_chain().value().valid);
}

TEST_CASE("Audit failure withholds the result", "[verifier][audit]")
{
    VerifierFixture fx;
    auto issued = fx.issuer.issue("basic", ValidityWindow::days(365), std::nullopt, kNow).value();

    // A directory where the log file should be makes every append fail.
    std::filesystem::create_directories(fx.dir / "blocked.jsonl");
    VerifierConfig cfg;
    cfg.audit = std::make_shared<AuditLog>(fx.dir / "blocked.jsonl", testing::random_hmac_key());
    OfflineVerifier verifier(cfg);

    REQUIRE_FALSE(verifier.verify(issued.file(), fx.ring(), kNow, testing::kFingerprintA).has_value());
}
