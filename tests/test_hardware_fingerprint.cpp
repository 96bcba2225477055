#include <catch2/catch_test_macros.hpp>
#include "ward/crypto.hpp"
#include "ward/hardware_fingerprint.hpp"
#include "test_support.hpp"
#include <fstream>

using namespace ward;

namespace
{
    void write(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    void add_nic(const std::filesystem::path &root, const std::string &name, const std::string &mac, bool physical = true)
    {
        auto dir = root / "sys/class/net" / name;
        write(dir / "address", mac + "\n");
        if (physical)
            std::filesystem::create_directories(dir / "device");
    }

    void populate(const std::filesystem::path &root)
    {
        write(root / "sys/class/dmi/id/product_uuid", "4C4C4544-0042-3510-8052-B2C04F4E4C32\n");
        write(root / "proc/cpuinfo",
              "processor\t: 0\nvendor_id\t: GenuineIntel\nmodel name\t: Intel(R) Xeon(R) CPU E5-2680 v4 @ 2.40GHz\n"
              "processor\t: 1\nmodel name\t: Intel(R) Xeon(R) CPU E5-2680 v4 @ 2.40GHz\n");
        add_nic(root, "lo", "00:00:00:00:00:00", false);
        add_nic(root, "eth0", "52:54:00:AB:CD:EF");
        add_nic(root, "eth1", "52:54:00:12:34:56");
        add_nic(root, "docker0", "02:42:ac:11:00:02", false);
    }
}

TEST_CASE("Facts come from sysfs and procfs", "[fingerprint]")
{
    testing::TempDir root;
    populate(root.path());

    auto facts = HardwareFingerprinter(root.path()).collect();
    REQUIRE(facts.platform_uuid == "4c4c4544-0042-3510-8052-b2c04f4e4c32");
    REQUIRE(facts.macs == std::vector<std::string>{"52:54:00:12:34:56", "52:54:00:ab:cd:ef"});
    REQUIRE(facts.cpu_model == "Intel(R) Xeon(R) CPU E5-2680 v4 @ 2.40GHz");
}

TEST_CASE("Fingerprint is SHA-256 over the fixed-order facts", "[fingerprint]")
{
    testing::TempDir root;
    populate(root.path());

    auto fp = HardwareFingerprinter(root.path()).fingerprint();
    REQUIRE(fp.has_value());
    REQUIRE(crypto::is_sha256_hex(*fp));

    std::string cpu_hash = crypto::SHA256::hex_digest("Intel(R) Xeon(R) CPU E5-2680 v4 @ 2.40GHz");
    std::string material = "uuid=4c4c4544-0042-3510-8052-b2c04f4e4c32;macs=52:54:00:12:34:56,52:54:00:ab:cd:ef;cpu=" + cpu_hash;
    REQUIRE(*fp == crypto::SHA256::hex_digest(material));
}

TEST_CASE("Adapter enumeration order does not change the fingerprint", "[fingerprint]")
{
    HardwareFacts a{"uuid", {"aa:00:00:00:00:01", "aa:00:00:00:00:02"}, "cpu"};
    HardwareFacts b{"UUID", {"aa:00:00:00:00:02", "aa:00:00:00:00:01", "aa:00:00:00:00:02"}, "cpu"};
    REQUIRE(HardwareFingerprinter::fingerprint_of(a) == HardwareFingerprinter::fingerprint_of(b));

    HardwareFacts c{"uuid", {"aa:00:00:00:00:01", "aa:00:00:00:00:03"}, "cpu"};
    REQUIRE(HardwareFingerprinter::fingerprint_of(a) != HardwareFingerprinter::fingerprint_of(c));
}

TEST_CASE("machine-id is used when the product UUID is unreadable", "[fingerprint]")
{
    testing::TempDir root;
    write(root / "etc/machine-id", "0123456789abcdef0123456789abcdef\n");

    auto facts = HardwareFingerprinter(root.path()).collect();
    REQUIRE(facts.platform_uuid == "0123456789abcdef0123456789abcdef");
    REQUIRE(facts.macs.empty());
    REQUIRE(HardwareFingerprinter(root.path()).fingerprint().has_value());
}

TEST_CASE("No identifiers at all is an error", "[fingerprint]")
{
    testing::TempDir root;
    auto fp = HardwareFingerprinter(root.path()).fingerprint();
    REQUIRE_FALSE(fp.has_value());
    REQUIRE(fp.error().code == ErrorCode::NotFound);
}
