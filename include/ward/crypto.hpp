#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace ward::crypto
{

    // Type aliases for clarity
    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;
    using HmacKey = std::array<uint8_t, 32>;
    using AESKey = std::array<uint8_t, 32>;
    using AESNonce = std::array<uint8_t, 12>;

    /**
     * AES-256-GCM encryption/decryption, used for private keys at rest
     */
    class AES256GCM
    {
    public:
        /**
         * Encrypt plaintext with given key, returns nonce + ciphertext + tag
         * Output format: [12-byte nonce][ciphertext][16-byte tag]
         */
        static Result<Bytes> encrypt(
            const AESKey &key,
            const Bytes &plaintext,
            const Bytes &associated_data = {});

        /**
         * Decrypt ciphertext with given key
         * Input format: [12-byte nonce][ciphertext][16-byte tag]
         */
        static Result<Bytes> decrypt(
            const AESKey &key,
            const Bytes &ciphertext_with_nonce,
            const Bytes &associated_data = {});

        /**
         * Generate random AES-256 key
         */
        static AESKey generate_key();
    };

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        static SHA256Hash hash(const std::string &data);

        /**
         * Convert hash to lowercase hex string
         */
        static std::string to_hex(const SHA256Hash &hash);

        /**
         * Parse hash from hex string
         */
        static Result<SHA256Hash> from_hex(const std::string &hex);

        /** hash + to_hex in one step */
        static std::string hex_digest(const std::string &data);
    };

    /**
     * HMAC-SHA256 with a 32-byte key. Used for the audit chain and the local
     * validation cache.
     */
    class HmacSha256
    {
    public:
        static SHA256Hash mac(const HmacKey &key, const std::string &message);

        static std::string mac_hex(const HmacKey &key, const std::string &message);

        /**
         * Constant-time check of a hex-encoded tag
         */
        static bool verify_hex(const HmacKey &key, const std::string &message, const std::string &tag_hex);

        /**
         * Derive a purpose-bound key: HMAC(SHA256(secret), label)
         */
        static HmacKey derive_key(const std::string &secret, const std::string &label);
    };

    /**
     * Base64 encoding/decoding
     */
    class Base64
    {
    public:
        /**
         * Encode bytes to base64 string (standard alphabet)
         */
        static std::string encode(const Bytes &data);

        /**
         * Decode base64 string to bytes
         */
        static Result<Bytes> decode(const std::string &encoded);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        static void fill_bytes(Bytes &buffer);

        static Bytes generate_bytes(size_t n);
    };

    /**
     * Length-independent comparison of two strings; compares in constant time
     * when the lengths agree.
     */
    bool constant_time_equals(const std::string &a, const std::string &b);

    /** True if s is exactly 64 lowercase or uppercase hex characters */
    bool is_sha256_hex(const std::string &s);

} // namespace ward::crypto
