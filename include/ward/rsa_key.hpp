#pragma once

#include "crypto.hpp"
#include <openssl/types.h>
#include <memory>
#include <string>
#include <utility>

namespace ward::crypto
{

    /**
     * Public key distribution formats. All three carry the same mathematical
     * key; clients pick whichever their runtime can parse.
     */
    enum class PublicKeyEncoding
    {
        Pem, // SubjectPublicKeyInfo, PEM armored
        Der, // SubjectPublicKeyInfo DER, base64 on a single line
        Xml  // <RSAKeyValue><Modulus/><Exponent/></RSAKeyValue>
    };

    std::string encoding_to_string(PublicKeyEncoding encoding);
    Result<PublicKeyEncoding> encoding_from_string(const std::string &name);

    /** Minimum modulus size accepted for signing and for imported keys. */
    inline constexpr int kMinRsaBits = 2048;

    /**
     * RSA public key. Copies share the underlying EVP_PKEY, which OpenSSL
     * treats as read-only once constructed.
     */
    class RsaPublicKey
    {
    public:
        static Result<RsaPublicKey> from_pem(const std::string &pem);
        static Result<RsaPublicKey> from_der(const Bytes &der);

        /**
         * Build from big-endian modulus and exponent. Leading zero bytes
         * (sign padding) are ignored.
         */
        static Result<RsaPublicKey> from_components(const Bytes &modulus, const Bytes &exponent);

        /**
         * Parse the tag-based legacy form. Whitespace inside and around the
         * base64 payloads is tolerated.
         */
        static Result<RsaPublicKey> from_xml(const std::string &xml);

        /** Import text produced by export_as for the same encoding */
        static Result<RsaPublicKey> import(const std::string &text, PublicKeyEncoding encoding);

        Result<std::string> to_pem() const;
        Result<Bytes> to_der() const;

        /**
         * Modulus/exponent XML. A component whose first byte has the high bit
         * set gets a 0x00 prefix so two's-complement parsers read it as
         * positive.
         */
        Result<std::string> to_xml() const;

        Result<std::string> export_as(PublicKeyEncoding encoding) const;

        /**
         * RSASSA-PKCS1-v1_5 / SHA-256 verification. Any failure, including a
         * malformed signature, yields false.
         */
        bool verify(const Bytes &message, const Bytes &signature) const;

        /** Minimal big-endian (modulus, exponent) */
        Result<std::pair<Bytes, Bytes>> components() const;

        /** True if both keys have identical modulus and exponent */
        bool same_key(const RsaPublicKey &other) const;

        int bits() const;

        /** SHA-256 hex of the DER encoding, for display and logs */
        std::string key_id() const;

    private:
        explicit RsaPublicKey(std::shared_ptr<EVP_PKEY> pkey) : pkey_(std::move(pkey)) {}

        std::shared_ptr<EVP_PKEY> pkey_;
    };

    /**
     * RSA private key held by the issuing authority only.
     */
    class RsaPrivateKey
    {
    public:
        /**
         * Generate a fresh key with e = 65537. Fails with KeyGenerationFailed
         * when the OpenSSL DRBG is not seeded; there is no fallback source.
         */
        static Result<RsaPrivateKey> generate(int bits = kMinRsaBits);

        /** Load from unencrypted PKCS#8 or traditional PEM */
        static Result<RsaPrivateKey> from_pem(const std::string &pem);

        /** Unencrypted PKCS#8 PEM. Callers encrypt before it touches disk. */
        Result<std::string> to_pem() const;

        /** RSASSA-PKCS1-v1_5 signature over SHA-256(message) */
        Result<Bytes> sign(const Bytes &message) const;

        Result<RsaPublicKey> public_key() const;

        int bits() const;

    private:
        explicit RsaPrivateKey(std::shared_ptr<EVP_PKEY> pkey) : pkey_(std::move(pkey)) {}

        std::shared_ptr<EVP_PKEY> pkey_;
    };

} // namespace ward::crypto
