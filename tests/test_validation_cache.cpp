#include <catch2/catch_test_macros.hpp>
#include "ward/validation_cache.hpp"
#include "ward/file_io.hpp"
#include "test_support.hpp"
#include <thread>
#include <vector>

using namespace ward;

namespace
{
    LicenseRecord sample_record()
    {
        LicenseRecord record;
        record.tier = Tier::Gamer;
        record.serial = "ABCDEFGH12";
        record.issued_at = 1000;
        record.expires_at = 2000;
        record.key_version = 2;
        return record;
    }
}

TEST_CASE("Missing cache loads as absent", "[cache]")
{
    testing::TempDir dir;
    ValidationCache cache(dir / "cache.json", testing::kFingerprintA);
    auto loaded = cache.load();
    REQUIRE(loaded.has_value());
    REQUIRE_FALSE(loaded->has_value());
}

TEST_CASE("Cache updates persist with an HMAC", "[cache]")
{
    testing::TempDir dir;
    ValidationCache cache(dir / "cache.json", testing::kFingerprintA);

    auto written = cache.update([](CacheState &state) {
        state.record = sample_record();
        state.last_online = 1500;
        state.last_seen = 1600;
    });
    REQUIRE(written.has_value());

    auto loaded = cache.load().value();
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->record == sample_record());
    REQUIRE(loaded->last_online == 1500);
    REQUIRE(loaded->last_seen == 1600);
    REQUIRE_FALSE(loaded->revoked);

    auto raw = nlohmann::json::parse(read_file(dir / "cache.json").value());
    REQUIRE(raw.at("hmac").get<std::string>().size() == 64);
}

TEST_CASE("Edited cache files are discarded", "[cache]")
{
    testing::TempDir dir;
    ValidationCache cache(dir / "cache.json", testing::kFingerprintA);
    cache.update([](CacheState &state) {
        state.record = sample_record();
        state.revoked = true;
        state.last_seen = 5000;
    }).value();

    auto raw = nlohmann::json::parse(read_file(dir / "cache.json").value());
    raw["revoked"] = false;
    REQUIRE(atomic_write_file(dir / "cache.json", raw.dump()).has_value());

    auto loaded = cache.load();
    REQUIRE(loaded.has_value());
    REQUIRE_FALSE(loaded->has_value());

    REQUIRE(atomic_write_file(dir / "cache.json", "{ not json").has_value());
    REQUIRE_FALSE(cache.load().value().has_value());
}

TEST_CASE("Cache copied from another machine is discarded", "[cache]")
{
    testing::TempDir dir;
    ValidationCache here(dir / "cache.json", testing::kFingerprintA);
    here.update([](CacheState &state) { state.last_seen = 42; }).value();

    ValidationCache elsewhere(dir / "cache.json", testing::kFingerprintB);
    REQUIRE_FALSE(elsewhere.load().value().has_value());

    // The next update starts from a clean state.
    auto rewritten = elsewhere.update([](CacheState &state) { state.last_seen = std::max<UnixSeconds>(state.last_seen, 7); });
    REQUIRE(rewritten->last_seen == 7);
}

TEST_CASE("Concurrent updates do not lose writes", "[cache]")
{
    testing::TempDir dir;
    auto path = dir / "cache.json";

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&path] {
            // Separate instances behave like separate processes sharing the file.
            ValidationCache cache(path, testing::kFingerprintA);
            for (int i = 0; i < 25; ++i)
                cache.update([](CacheState &state) { state.last_seen += 1; }).value();
        });
    }
    for (auto &t : threads)
        t.join();

    ValidationCache cache(path, testing::kFingerprintA);
    REQUIRE(cache.load().value()->last_seen == 100);
}
