#include <catch2/catch_test_macros.hpp>
#include "ward/revocation_list.hpp"
#include "test_support.hpp"

using namespace ward;

TEST_CASE("Revocations persist and are audited", "[revocation]")
{
    testing::TempDir dir;
    auto audit = std::make_shared<AuditLog>(dir / "audit.jsonl", testing::random_hmac_key());

    RevocationList list(dir / "revoked.json", audit);
    REQUIRE(list.load().has_value());
    REQUIRE_FALSE(list.is_revoked("ABCDE12345"));

    REQUIRE(list.revoke("ABCDE12345", "refund", 1000).has_value());
    REQUIRE(list.is_revoked("ABCDE12345"));
    REQUIRE(list.revoked_at("ABCDE12345") == 1000);

    RevocationList reloaded(dir / "revoked.json");
    REQUIRE(reloaded.load().has_value());
    REQUIRE(reloaded.is_revoked("ABCDE12345"));
    REQUIRE(reloaded.size() == 1);

    auto entries = audit->entries().value();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].event_type == AuditEventType::Revoked);
    REQUIRE(entries[0].subject == "ABCDE12345");
    REQUIRE(entries[0].details.at("reason") == "refund");
}

TEST_CASE("Revoking twice keeps the first timestamp", "[revocation]")
{
    testing::TempDir dir;
    auto audit = std::make_shared<AuditLog>(dir / "audit.jsonl", testing::random_hmac_key());
    RevocationList list(dir / "revoked.json", audit);

    REQUIRE(list.revoke("ABCDE12345", {}, 1000).has_value());
    REQUIRE(list.revoke("ABCDE12345", {}, 2000).has_value());
    REQUIRE(list.revoked_at("ABCDE12345") == 1000);
    REQUIRE(audit->entries().value().size() == 1);
}

TEST_CASE("Writers in separate instances do not overwrite each other", "[revocation]")
{
    testing::TempDir dir;
    RevocationList first(dir / "revoked.json");
    RevocationList second(dir / "revoked.json");

    REQUIRE(first.revoke("AAAAA11111").has_value());
    REQUIRE(second.revoke("BBBBB22222").has_value());

    RevocationList reader(dir / "revoked.json");
    REQUIRE(reader.load().has_value());
    REQUIRE(reader.is_revoked("AAAAA11111"));
    REQUIRE(reader.is_revoked("BBBBB22222"));
}

TEST_CASE("Only well-formed serials can be revoked", "[revocation]")
{
    RevocationList list;
    auto bad = list.revoke("not-a-serial");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::InvalidInput);
}

TEST_CASE("A loaded list sees revocations written by another instance", "[revocation]")
{
    testing::TempDir dir;
    RevocationList serving(dir / "revoked.json");
    REQUIRE(serving.load().has_value());
    REQUIRE_FALSE(serving.is_revoked("AAAAA11111"));

    RevocationList operator_cli(dir / "revoked.json");
    REQUIRE(operator_cli.revoke("AAAAA11111", {}, 1000).has_value());
    REQUIRE(serving.is_revoked("AAAAA11111"));
    REQUIRE(serving.revoked_at("AAAAA11111") == 1000);

    REQUIRE(operator_cli.revoke("BBBBB22222", {}, 2000).has_value());
    REQUIRE(serving.is_revoked("BBBBB22222"));
    REQUIRE(serving.size() == 2);
}

TEST_CASE("A reason that is not UTF-8 is rejected before anything is written", "[revocation]")
{
    testing::TempDir dir;
    auto audit = std::make_shared<AuditLog>(dir / "audit.jsonl", testing::random_hmac_key());
    RevocationList list(dir / "revoked.json", audit);

    auto bad = list.revoke("ABCDE12345", std::string("chargeback \xc3\x28"), 1000);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::InvalidInput);
    REQUIRE_FALSE(list.is_revoked("ABCDE12345"));
    REQUIRE_FALSE(std::filesystem::exists(dir / "revoked.json"));
    REQUIRE(audit->entries().value().empty());
}
