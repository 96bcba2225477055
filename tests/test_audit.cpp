#include <catch2/catch_test_macros.hpp>
#include "ward/audit.hpp"
#include "ward/file_io.hpp"
#include "test_support.hpp"
#include <functional>
#include <sstream>

using namespace ward;

namespace
{
    AuditEvent event_for(int i)
    {
        AuditEvent event;
        event.type = i % 2 ? AuditEventType::Verified : AuditEventType::Issued;
        event.subject = "SERIAL" + std::to_string(1000 + i);
        event.result = "ok";
        event.details = {{"n", i}};
        event.timestamp = 1'700'000'000 + i;
        return event;
    }

    std::vector<std::string> lines_of(const std::filesystem::path &path)
    {
        std::vector<std::string> lines;
        std::istringstream in(read_file(path).value());
        for (std::string line; std::getline(in, line);)
            lines.push_back(line);
        return lines;
    }

    void write_lines(const std::filesystem::path &path, const std::vector<std::string> &lines)
    {
        std::string content;
        for (const auto &line : lines)
            content += line + "\n";
        REQUIRE(atomic_write_file(path, content).has_value());
    }
}

TEST_CASE("Empty or missing audit log verifies", "[audit]")
{
    testing::TempDir dir;
    AuditLog log(dir / "audit.jsonl", testing::random_hmac_key());
    auto report = log.verify_chain();
    REQUIRE(report.has_value());
    REQUIRE(report->valid);
    REQUIRE(report->entries == 0);
}

TEST_CASE("Entries are chained from the genesis hash", "[audit]")
{
    testing::TempDir dir;
    AuditLog log(dir / "audit.jsonl", testing::random_hmac_key());

    std::vector<std::string> hashes;
    for (int i = 0; i < 5; ++i)
        hashes.push_back(log.append(event_for(i)).value());

    auto entries = log.entries().value();
    REQUIRE(entries.size() == 5);
    REQUIRE(entries[0].prev_hash == AuditLog::kGenesisHash);
    for (size_t i = 0; i < entries.size(); ++i)
    {
        REQUIRE(entries[i].seq == i);
        REQUIRE(entries[i].entry_hmac == hashes[i]);
        if (i > 0)
            REQUIRE(entries[i].prev_hash == hashes[i - 1]);
    }

    auto report = log.verify_chain().value();
    REQUIRE(report.valid);
    REQUIRE(report.entries == 5);
}

TEST_CASE("Mutating an entry is detected at its index", "[audit]")
{
    testing::TempDir dir;
    auto path = dir / "audit.jsonl";
    AuditLog log(path, testing::random_hmac_key());
    for (int i = 0; i < 6; ++i)
        log.append(event_for(i)).value();

    auto original = lines_of(path);

    std::vector<std::function<void(nlohmann::json &)>> mutations = {
        [](nlohmann::json &j) { j["result"] = "tampered"; },
        [](nlohmann::json &j) { j["details"]["n"] = 999; },
        [](nlohmann::json &j) { j["timestamp"] = j["timestamp"].get<int64_t>() + 1; },
        [](nlohmann::json &j) { j["subject"] = "SOMEONE_ELSE"; },
    };

    for (size_t target = 0; target < original.size(); ++target)
    {
        for (size_t m = 0; m < mutations.size(); ++m)
        {
            auto lines = original;
            auto j = nlohmann::json::parse(lines[target]);
            mutations[m](j);
            lines[target] = j.dump();
            write_lines(path, lines);

            INFO("entry " << target << ", mutation " << m);
            auto report = log.verify_chain().value();
            REQUIRE_FALSE(report.valid);
            REQUIRE(report.first_invalid == target);
        }
    }
}

TEST_CASE("Deleting or reordering entries breaks the chain", "[audit]")
{
    testing::TempDir dir;
    auto path = dir / "audit.jsonl";
    AuditLog log(path, testing::random_hmac_key());
    for (int i = 0; i < 4; ++i)
        log.append(event_for(i)).value();
    auto original = lines_of(path);

    auto removed = original;
    removed.erase(removed.begin() + 1);
    write_lines(path, removed);
    REQUIRE(log.verify_chain().value().first_invalid == 1);

    auto swapped = original;
    std::swap(swapped[2], swapped[3]);
    write_lines(path, swapped);
    REQUIRE(log.verify_chain().value().first_invalid == 2);
}

TEST_CASE("Events with invalid UTF-8 are rejected without touching the log", "[audit]")
{
    testing::TempDir dir;
    AuditLog log(dir / "audit.jsonl", testing::random_hmac_key());
    REQUIRE(log.append(event_for(0)).has_value());

    auto bad = event_for(1);
    bad.details = {{"reason", std::string("refund \xff\xfe")}};
    auto appended = log.append(bad);
    REQUIRE_FALSE(appended.has_value());
    REQUIRE(appended.error().code == ErrorCode::InvalidInput);

    REQUIRE(log.entries().value().size() == 1);
    REQUIRE(log.verify_chain().value().valid);
}

TEST_CASE("A different key cannot verify the chain", "[audit]")
{
    testing::TempDir dir;
    auto path = dir / "audit.jsonl";
    AuditLog writer(path, testing::random_hmac_key());
    writer.append(event_for(0)).value();

    AuditLog reader(path, testing::random_hmac_key());
    auto report = reader.verify_chain().value();
    REQUIRE_FALSE(report.valid);
    REQUIRE(report.first_invalid == 0);
}

TEST_CASE("Audit keys are 32 bytes of base64", "[audit]")
{
    auto key = testing::random_hmac_key();
    auto b64 = crypto::Base64::encode(crypto::Bytes(key.begin(), key.end()));
    REQUIRE(AuditLog::key_from_base64(b64).value() == key);
    REQUIRE_FALSE(AuditLog::key_from_base64("c2hvcnQ=").has_value());
    REQUIRE_FALSE(AuditLog::key_from_base64("***").has_value());
}
