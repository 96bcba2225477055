#pragma once

#include "types.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace ward
{

    /**
     * Decoded license key string: TIER-SSSSS-SSSSS-CCCCC
     *
     * TIER is a four-letter prefix from the closed tier table, S is the ten
     * character serial and C a five character checksum, all in Crockford
     * base32 (0-9, A-Z without I, L, O, U).
     */
    struct LicenseKey
    {
        Tier tier;
        std::string serial;

        /** Canonical uppercase form including the checksum segment */
        std::string to_string() const;
    };

    /** Why a key string failed to decode */
    enum class KeyDecodeError
    {
        Malformed,       // wrong shape, bad character or unknown tier prefix
        ChecksumMismatch // well formed, checksum does not match
    };

    /**
     * Key string encoding. The checksum is for catching typos, not a security
     * control; authenticity comes from the signature.
     */
    class LicenseKeyCodec
    {
    public:
        static constexpr std::string_view kAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
        static constexpr size_t kSerialLength = 10;
        static constexpr size_t kChecksumLength = 5;

        /** Key string for a tier and a serial of kSerialLength alphabet characters */
        static std::string encode(Tier tier, const std::string &serial);

        /**
         * Parse a key string. Case-insensitive; surrounding whitespace is
         * ignored. Performs no cryptographic work.
         */
        static std::expected<LicenseKey, KeyDecodeError> decode(std::string_view text);

        /** 50 random bits as ten alphabet characters */
        static std::string generate_serial();

        static bool is_valid_serial(std::string_view serial);

        /**
         * 25-bit checksum over prefix + serial.
         *   h = (h * 31 + c) mod 2^31, starting at 0
         *   r = ((r xor c) * 17) mod 2^16, starting at 0x5A3C
         *   checksum = ((h mod 2^20) << 5) | fold5(r)
         * The low bits of h change under any single substitution and any
         * adjacent transposition of distinct characters.
         */
        static uint32_t checksum(std::string_view payload);

        /** checksum() rendered as kChecksumLength alphabet characters */
        static std::string checksum_chars(std::string_view payload);
    };

} // namespace ward
