#include "ward/license_key.hpp"
#include "ward/crypto.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace ward
{
    namespace
    {
        bool in_alphabet(char c)
        {
            return LicenseKeyCodec::kAlphabet.find(c) != std::string_view::npos;
        }

        std::string_view trim(std::string_view s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
                return {};
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split(const std::string &s, char sep)
        {
            std::vector<std::string> parts;
            size_t start = 0;
            while (true)
            {
                auto pos = s.find(sep, start);
                if (pos == std::string::npos)
                {
                    parts.push_back(s.substr(start));
                    return parts;
                }
                parts.push_back(s.substr(start, pos - start));
                start = pos + 1;
            }
        }
    } // namespace

    std::string LicenseKey::to_string() const
    {
        return LicenseKeyCodec::encode(tier, serial);
    }

    std::string LicenseKeyCodec::encode(Tier tier, const std::string &serial)
    {
        std::string prefix(tier_prefix(tier));
        return std::format("{}-{}-{}-{}",
                           prefix,
                           serial.substr(0, 5),
                           serial.substr(5, 5),
                           checksum_chars(prefix + serial));
    }

    std::expected<LicenseKey, KeyDecodeError> LicenseKeyCodec::decode(std::string_view text)
    {
        auto trimmed = trim(text);
        std::string upper;
        upper.reserve(trimmed.size());
        for (unsigned char c : trimmed)
        {
            upper += static_cast<char>(std::toupper(c));
        }

        auto parts = split(upper, '-');
        if (parts.size() != 4 || parts[0].size() != 4 || parts[1].size() != 5 ||
            parts[2].size() != 5 || parts[3].size() != kChecksumLength)
        {
            return std::unexpected(KeyDecodeError::Malformed);
        }

        auto tier = tier_from_prefix(parts[0]);
        if (!tier)
        {
            return std::unexpected(KeyDecodeError::Malformed);
        }

        std::string serial = parts[1] + parts[2];
        if (!is_valid_serial(serial) || !std::all_of(parts[3].begin(), parts[3].end(), in_alphabet))
        {
            return std::unexpected(KeyDecodeError::Malformed);
        }

        if (checksum_chars(parts[0] + serial) != parts[3])
        {
            return std::unexpected(KeyDecodeError::ChecksumMismatch);
        }

        return LicenseKey{*tier, serial};
    }

    std::string LicenseKeyCodec::generate_serial()
    {
        // 256 is a multiple of 32, so masking keeps the draw uniform.
        auto random = crypto::SecureRandom::generate_bytes(kSerialLength);
        std::string serial;
        serial.reserve(kSerialLength);
        for (uint8_t b : random)
        {
            serial += kAlphabet[b & 0x1F];
        }
        return serial;
    }

    bool LicenseKeyCodec::is_valid_serial(std::string_view serial)
    {
        return serial.size() == kSerialLength && std::all_of(serial.begin(), serial.end(), in_alphabet);
    }

    uint32_t LicenseKeyCodec::checksum(std::string_view payload)
    {
        uint32_t h = 0;
        uint32_t r = 0x5A3C;
        for (unsigned char c : payload)
        {
            h = (h * 31u + c) & 0x7FFFFFFFu;
            r = ((r ^ c) * 17u) & 0xFFFFu;
        }
        uint32_t fold = (r ^ (r >> 5) ^ (r >> 10) ^ (r >> 15)) & 0x1Fu;
        return ((h & 0xFFFFFu) << 5) | fold;
    }

    std::string LicenseKeyCodec::checksum_chars(std::string_view payload)
    {
        uint32_t value = checksum(payload);
        std::string out(kChecksumLength, '0');
        for (size_t i = 0; i < kChecksumLength; ++i)
        {
            out[kChecksumLength - 1 - i] = kAlphabet[value & 0x1Fu];
            value >>= 5;
        }
        return out;
    }

} // namespace ward
