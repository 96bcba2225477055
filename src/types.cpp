#include "ward/types.hpp"
#include <cctype>
#include <chrono>
#include <ctime>

namespace ward
{

    std::string tier_to_string(Tier tier)
    {
        switch (tier)
        {
        case Tier::Basic:
            return "basic";
        case Tier::Workplace:
            return "workplace";
        case Tier::Gamer:
            return "gamer";
        case Tier::AiDev:
            return "ai_dev";
        case Tier::GamerAi:
            return "gamer_ai";
        case Tier::Server:
            return "server";
        }
        return "unknown";
    }

    std::expected<Tier, std::string> tier_from_string(const std::string &s)
    {
        std::string name;
        name.reserve(s.size());
        for (unsigned char c : s)
        {
            name += c == '-' ? '_' : static_cast<char>(std::tolower(c));
        }

        if (name == "basic")
            return Tier::Basic;
        if (name == "workplace")
            return Tier::Workplace;
        if (name == "gamer")
            return Tier::Gamer;
        if (name == "ai_dev" || name == "aidev")
            return Tier::AiDev;
        if (name == "gamer_ai")
            return Tier::GamerAi;
        if (name == "server")
            return Tier::Server;
        return std::unexpected(std::format("Unknown tier: {}", s));
    }

    std::string_view tier_prefix(Tier tier)
    {
        switch (tier)
        {
        case Tier::Basic:
            return "BSIC";
        case Tier::Workplace:
            return "WORK";
        case Tier::Gamer:
            return "GAME";
        case Tier::AiDev:
            return "AIDV";
        case Tier::GamerAi:
            return "GMAI";
        case Tier::Server:
            return "SERV";
        }
        return "";
    }

    std::optional<Tier> tier_from_prefix(std::string_view prefix)
    {
        for (Tier t : all_tiers())
        {
            if (tier_prefix(t) == prefix)
                return t;
        }
        return std::nullopt;
    }

    const std::vector<Tier> &all_tiers()
    {
        static const std::vector<Tier> tiers = {
            Tier::Basic, Tier::Workplace, Tier::Gamer, Tier::AiDev, Tier::GamerAi, Tier::Server};
        return tiers;
    }

    std::string status_to_string(VerificationStatus status)
    {
        switch (status)
        {
        case VerificationStatus::Valid:
            return "valid";
        case VerificationStatus::MalformedKey:
            return "malformed_key";
        case VerificationStatus::ChecksumMismatch:
            return "checksum_mismatch";
        case VerificationStatus::SignatureInvalid:
            return "signature_invalid";
        case VerificationStatus::Expired:
            return "expired";
        case VerificationStatus::Revoked:
            return "revoked";
        case VerificationStatus::HardwareMismatch:
            return "hardware_mismatch";
        case VerificationStatus::ClockTamperSuspected:
            return "clock_tamper_suspected";
        case VerificationStatus::NetworkRequired:
            return "network_required";
        }
        return "unknown";
    }

    std::string user_message(VerificationStatus status)
    {
        switch (status)
        {
        case VerificationStatus::Valid:
            return "license active";
        case VerificationStatus::MalformedKey:
        case VerificationStatus::ChecksumMismatch:
        case VerificationStatus::SignatureInvalid:
            return "invalid key";
        case VerificationStatus::Expired:
            return "expired";
        case VerificationStatus::Revoked:
            return "license revoked";
        case VerificationStatus::HardwareMismatch:
            return "wrong machine";
        case VerificationStatus::ClockTamperSuspected:
            return "system clock problem";
        case VerificationStatus::NetworkRequired:
            return "offline too long";
        }
        return "invalid key";
    }

    UnixSeconds unix_now()
    {
        return std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    std::string to_iso8601(UnixSeconds t)
    {
        auto time_t_value = static_cast<std::time_t>(t);
        std::tm tm_utc;
        gmtime_r(&time_t_value, &tm_utc);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                           tm_utc.tm_year + 1900,
                           tm_utc.tm_mon + 1,
                           tm_utc.tm_mday,
                           tm_utc.tm_hour,
                           tm_utc.tm_min,
                           tm_utc.tm_sec);
    }

} // namespace ward
