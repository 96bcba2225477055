#include "ward/crypto.hpp"
#include <sodium.h>
#include <algorithm>
#include <cstring>
#include <format>

namespace ward::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // AES256GCM Implementation
    // ============================================================================

    Result<Bytes> AES256GCM::encrypt(
        const AESKey &key,
        const Bytes &plaintext,
        const Bytes &associated_data)
    {
        if (crypto_aead_aes256gcm_is_available() == 0)
        {
            return std::unexpected(WardError::crypto("AES-256-GCM is not supported on this CPU"));
        }

        AESNonce nonce;
        randombytes_buf(nonce.data(), nonce.size());

        // Allocate output: nonce + ciphertext + tag
        Bytes output(nonce.size() + plaintext.size() + crypto_aead_aes256gcm_ABYTES);
        std::copy(nonce.begin(), nonce.end(), output.begin());

        unsigned long long ciphertext_len;
        if (crypto_aead_aes256gcm_encrypt(
                output.data() + nonce.size(),
                &ciphertext_len,
                plaintext.data(),
                plaintext.size(),
                associated_data.data(),
                associated_data.size(),
                nullptr, // nsec (not used)
                nonce.data(),
                key.data()) != 0)
        {
            return std::unexpected(WardError::crypto("AES-256-GCM encryption failed"));
        }

        output.resize(nonce.size() + ciphertext_len);
        return output;
    }

    Result<Bytes> AES256GCM::decrypt(
        const AESKey &key,
        const Bytes &ciphertext_with_nonce,
        const Bytes &associated_data)
    {
        if (crypto_aead_aes256gcm_is_available() == 0)
        {
            return std::unexpected(WardError::crypto("AES-256-GCM is not supported on this CPU"));
        }

        if (ciphertext_with_nonce.size() < 12 + crypto_aead_aes256gcm_ABYTES)
        {
            return std::unexpected(WardError::crypto("Ciphertext too short"));
        }

        AESNonce nonce;
        std::copy(ciphertext_with_nonce.begin(), ciphertext_with_nonce.begin() + 12, nonce.begin());

        Bytes plaintext(ciphertext_with_nonce.size() - 12 - crypto_aead_aes256gcm_ABYTES);
        unsigned long long plaintext_len;

        if (crypto_aead_aes256gcm_decrypt(
                plaintext.data(),
                &plaintext_len,
                nullptr,
                ciphertext_with_nonce.data() + 12,
                ciphertext_with_nonce.size() - 12,
                associated_data.data(),
                associated_data.size(),
                nonce.data(),
                key.data()) != 0)
        {
            return std::unexpected(WardError::crypto("AES-256-GCM decryption failed (authentication failed)"));
        }

        plaintext.resize(plaintext_len);
        return plaintext;
    }

    AESKey AES256GCM::generate_key()
    {
        AESKey key;
        crypto_aead_aes256gcm_keygen(key.data());
        return key;
    }

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(const std::string &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        std::string hex(hash.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), hash.data(), hash.size());
        hex.resize(hash.size() * 2);
        return hex;
    }

    Result<SHA256Hash> SHA256::from_hex(const std::string &hex)
    {
        if (hex.size() != 64)
        {
            return std::unexpected(WardError::crypto("Invalid SHA-256 hex length"));
        }

        SHA256Hash hash;
        size_t bin_len = 0;
        if (sodium_hex2bin(hash.data(), hash.size(), hex.data(), hex.size(),
                           nullptr, &bin_len, nullptr) != 0 ||
            bin_len != hash.size())
        {
            return std::unexpected(WardError::crypto("Invalid hex character"));
        }
        return hash;
    }

    std::string SHA256::hex_digest(const std::string &data)
    {
        return to_hex(hash(data));
    }

    // ============================================================================
    // HmacSha256 Implementation
    // ============================================================================

    SHA256Hash HmacSha256::mac(const HmacKey &key, const std::string &message)
    {
        static_assert(crypto_auth_hmacsha256_KEYBYTES == 32);
        SHA256Hash out;
        crypto_auth_hmacsha256(out.data(),
                               reinterpret_cast<const uint8_t *>(message.data()),
                               message.size(),
                               key.data());
        return out;
    }

    std::string HmacSha256::mac_hex(const HmacKey &key, const std::string &message)
    {
        return SHA256::to_hex(mac(key, message));
    }

    bool HmacSha256::verify_hex(const HmacKey &key, const std::string &message, const std::string &tag_hex)
    {
        auto tag = SHA256::from_hex(tag_hex);
        if (!tag)
            return false;
        return crypto_auth_hmacsha256_verify(tag->data(),
                                             reinterpret_cast<const uint8_t *>(message.data()),
                                             message.size(),
                                             key.data()) == 0;
    }

    HmacKey HmacSha256::derive_key(const std::string &secret, const std::string &label)
    {
        auto root = SHA256::hash(secret);
        HmacKey root_key;
        std::copy(root.begin(), root.end(), root_key.begin());
        auto derived = mac(root_key, label);
        HmacKey key;
        std::copy(derived.begin(), derived.end(), key.begin());
        sodium_memzero(root_key.data(), root_key.size());
        return key;
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Remove null terminator
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded(encoded.size()); // Worst case size
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                " \t\r\n", // tolerate wrapped input
                &decoded_len,
                nullptr,
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(WardError::crypto("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // SecureRandom Implementation
    // ============================================================================

    void SecureRandom::fill_bytes(Bytes &buffer)
    {
        randombytes_buf(buffer.data(), buffer.size());
    }

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    bool constant_time_equals(const std::string &a, const std::string &b)
    {
        if (a.size() != b.size())
            return false;
        if (a.empty())
            return true;
        return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    bool is_sha256_hex(const std::string &s)
    {
        return s.size() == 64 && std::all_of(s.begin(), s.end(), [](char c) {
                   return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
               });
    }

} // namespace ward::crypto
