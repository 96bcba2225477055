#include "ward/license_record.hpp"
#include "ward/crypto.hpp"
#include "ward/file_io.hpp"
#include "ward/json_canonicalization.hpp"
#include <algorithm>
#include <cctype>

namespace ward
{
    namespace
    {
        nlohmann::json optional_int(const std::optional<UnixSeconds> &v)
        {
            return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
        }

        nlohmann::json optional_string(const std::optional<std::string> &v)
        {
            return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
        }

        Result<std::optional<UnixSeconds>> read_optional_int(const nlohmann::json &j, const char *field)
        {
            if (!j.contains(field) || j.at(field).is_null())
                return std::optional<UnixSeconds>{};
            if (!j.at(field).is_number_integer())
            {
                return std::unexpected(WardError::parsing(std::format("Field {} must be an integer or null", field)));
            }
            return std::optional<UnixSeconds>(j.at(field).get<UnixSeconds>());
        }

        Result<std::optional<std::string>> read_fingerprint(const nlohmann::json &j, const char *field)
        {
            if (!j.contains(field) || j.at(field).is_null())
                return std::optional<std::string>{};
            if (!j.at(field).is_string())
            {
                return std::unexpected(WardError::parsing(std::format("Field {} must be a string or null", field)));
            }
            auto value = j.at(field).get<std::string>();
            if (!crypto::is_sha256_hex(value))
            {
                return std::unexpected(WardError::parsing(std::format("Field {} is not a SHA-256 hex digest", field)));
            }
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return std::optional<std::string>(value);
        }
    } // namespace

    // ============================================================================
    // LicenseRecord
    // ============================================================================

    nlohmann::json LicenseRecord::to_json() const
    {
        return nlohmann::json{{"format", kFormatVersion},
                              {"tier", tier_to_string(tier)},
                              {"serial", serial},
                              {"issued_at", issued_at},
                              {"expires_at", optional_int(expires_at)},
                              {"hardware_binding", optional_string(hardware_binding)},
                              {"key_version", key_version}};
    }

    Result<LicenseRecord> LicenseRecord::from_json(const nlohmann::json &j)
    {
        try
        {
            if (j.at("format").get<int>() != kFormatVersion)
            {
                return std::unexpected(WardError::parsing(std::format(
                    "Unsupported license record format {}", j.at("format").dump())));
            }

            LicenseRecord record;
            auto tier = tier_from_string(j.at("tier").get<std::string>());
            if (!tier)
                return std::unexpected(WardError::parsing(tier.error()));
            record.tier = *tier;

            record.serial = j.at("serial").get<std::string>();
            if (!LicenseKeyCodec::is_valid_serial(record.serial))
            {
                return std::unexpected(WardError::parsing(std::format("Invalid serial: {}", record.serial)));
            }

            record.issued_at = j.at("issued_at").get<UnixSeconds>();

            auto expires = read_optional_int(j, "expires_at");
            if (!expires)
                return std::unexpected(expires.error());
            record.expires_at = *expires;

            auto binding = read_fingerprint(j, "hardware_binding");
            if (!binding)
                return std::unexpected(binding.error());
            record.hardware_binding = *binding;

            record.key_version = j.at("key_version").get<uint32_t>();
            return record;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardError::parsing(std::format("Invalid license record: {}", e.what())));
        }
    }

    Result<std::string> LicenseRecord::canonical_payload() const
    {
        return json::RFC8785Canonicalizer::canonicalize(to_json());
    }

    std::string LicenseRecord::key_string() const
    {
        return LicenseKeyCodec::encode(tier, serial);
    }

    // ============================================================================
    // SignatureBlock
    // ============================================================================

    LicenseRecord SignatureBlock::record_for(const LicenseKey &key) const
    {
        LicenseRecord record;
        record.tier = key.tier;
        record.serial = key.serial;
        record.issued_at = issued_at;
        record.expires_at = expires_at;
        record.hardware_binding = hardware_binding;
        record.key_version = key_version;
        return record;
    }

    SignatureBlock SignatureBlock::from_record(const LicenseRecord &record, std::string signature_b64)
    {
        return SignatureBlock{record.issued_at,
                              record.expires_at,
                              record.hardware_binding,
                              record.key_version,
                              std::move(signature_b64)};
    }

    // ============================================================================
    // LicenseFile
    // ============================================================================

    nlohmann::json LicenseFile::to_json() const
    {
        nlohmann::json j{{"key", key},
                         {"issued_at", block.issued_at},
                         {"expires_at", optional_int(block.expires_at)},
                         {"hardware_binding", optional_string(block.hardware_binding)},
                         {"key_version", block.key_version},
                         {"signature", block.signature_b64}};
        if (auto decoded = LicenseKeyCodec::decode(key))
        {
            j["tier"] = tier_to_string(decoded->tier);
        }
        return j;
    }

    Result<LicenseFile> LicenseFile::from_json(const nlohmann::json &j)
    {
        try
        {
            LicenseFile file;
            file.key = j.at("key").get<std::string>();
            file.block.issued_at = j.at("issued_at").get<UnixSeconds>();

            auto expires = read_optional_int(j, "expires_at");
            if (!expires)
                return std::unexpected(expires.error());
            file.block.expires_at = *expires;

            auto binding = read_fingerprint(j, "hardware_binding");
            if (!binding)
                return std::unexpected(binding.error());
            file.block.hardware_binding = *binding;

            file.block.key_version = j.at("key_version").get<uint32_t>();
            file.block.signature_b64 = j.at("signature").get<std::string>();
            return file;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardError::parsing(std::format("Invalid license file: {}", e.what())));
        }
    }

    Result<LicenseFile> LicenseFile::load(const std::filesystem::path &path)
    {
        auto content = read_file(path);
        if (!content)
            return std::unexpected(content.error());
        try
        {
            return from_json(nlohmann::json::parse(*content));
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardError::parsing(std::format("Invalid JSON in {}: {}", path.string(), e.what())));
        }
    }

    Result<void> LicenseFile::save(const std::filesystem::path &path) const
    {
        return atomic_write_file(path, to_json().dump(2), false);
    }

} // namespace ward
