#include "ward/rsa_key.hpp"
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <format>

namespace ward::crypto
{
    namespace
    {
        using BIO_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;
        using BIGNUM_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
        using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
        using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
        using OSSL_PARAM_BLD_ptr = std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
        using OSSL_PARAM_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

        std::shared_ptr<EVP_PKEY> wrap(EVP_PKEY *raw)
        {
            return std::shared_ptr<EVP_PKEY>(raw, &EVP_PKEY_free);
        }

        /** Drain the OpenSSL error queue into one message */
        std::string openssl_error(const std::string &what)
        {
            unsigned long code = ERR_get_error();
            if (code == 0)
                return what;
            char buf[256];
            ERR_error_string_n(code, buf, sizeof(buf));
            ERR_clear_error();
            return std::format("{}: {}", what, buf);
        }

        std::string bio_to_string(BIO *bio)
        {
            char *data = nullptr;
            long len = BIO_get_mem_data(bio, &data);
            if (len <= 0 || data == nullptr)
                return {};
            return std::string(data, static_cast<size_t>(len));
        }

        Result<void> require_rsa(EVP_PKEY *pkey)
        {
            if (EVP_PKEY_get_base_id(pkey) != EVP_PKEY_RSA)
            {
                return std::unexpected(WardError::crypto("Key is not an RSA key"));
            }
            if (EVP_PKEY_get_bits(pkey) < kMinRsaBits)
            {
                return std::unexpected(WardError::crypto(std::format(
                    "RSA key too small: {} bits (minimum {})", EVP_PKEY_get_bits(pkey), kMinRsaBits)));
            }
            return {};
        }

        Result<Bytes> get_bn_bytes(EVP_PKEY *pkey, const char *param)
        {
            BIGNUM *raw = nullptr;
            if (EVP_PKEY_get_bn_param(pkey, param, &raw) != 1)
            {
                return std::unexpected(WardError::crypto(openssl_error(std::format("Failed to read RSA parameter {}", param))));
            }
            BIGNUM_ptr bn(raw, &BN_free);
            Bytes out(static_cast<size_t>(BN_num_bytes(bn.get())));
            BN_bn2bin(bn.get(), out.data());
            return out;
        }

        Bytes strip_leading_zeros(const Bytes &in)
        {
            auto it = in.begin();
            while (it != in.end() && *it == 0)
                ++it;
            return Bytes(it, in.end());
        }

        Bytes with_sign_byte(const Bytes &in)
        {
            if (!in.empty() && (in.front() & 0x80) != 0)
            {
                Bytes padded;
                padded.reserve(in.size() + 1);
                padded.push_back(0x00);
                padded.insert(padded.end(), in.begin(), in.end());
                return padded;
            }
            return in;
        }

        std::string trim(const std::string &s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return {};
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        Result<std::string> tag_content(const std::string &xml, const std::string &tag)
        {
            const std::string open = "<" + tag + ">";
            const std::string close = "</" + tag + ">";
            auto start = xml.find(open);
            if (start == std::string::npos)
            {
                return std::unexpected(WardError::parsing(std::format("Missing <{}> element", tag)));
            }
            start += open.size();
            auto end = xml.find(close, start);
            if (end == std::string::npos)
            {
                return std::unexpected(WardError::parsing(std::format("Unterminated <{}> element", tag)));
            }
            return trim(xml.substr(start, end - start));
        }
    } // namespace

    std::string encoding_to_string(PublicKeyEncoding encoding)
    {
        switch (encoding)
        {
        case PublicKeyEncoding::Pem:
            return "pem";
        case PublicKeyEncoding::Der:
            return "der";
        case PublicKeyEncoding::Xml:
            return "xml";
        }
        return "unknown";
    }

    Result<PublicKeyEncoding> encoding_from_string(const std::string &name)
    {
        if (name == "pem")
            return PublicKeyEncoding::Pem;
        if (name == "der")
            return PublicKeyEncoding::Der;
        if (name == "xml")
            return PublicKeyEncoding::Xml;
        return std::unexpected(WardError::invalid_input(std::format("Unknown public key encoding: {}", name)));
    }

    // ============================================================================
    // RsaPublicKey Implementation
    // ============================================================================

    Result<RsaPublicKey> RsaPublicKey::from_pem(const std::string &pem)
    {
        BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
        if (!bio)
        {
            return std::unexpected(WardError::crypto("BIO_new_mem_buf failed"));
        }
        EVP_PKEY *raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
        if (raw == nullptr)
        {
            return std::unexpected(WardError::parsing(openssl_error("Invalid public key PEM")));
        }
        auto pkey = wrap(raw);
        if (auto ok = require_rsa(pkey.get()); !ok)
            return std::unexpected(ok.error());
        return RsaPublicKey(std::move(pkey));
    }

    Result<RsaPublicKey> RsaPublicKey::from_der(const Bytes &der)
    {
        const unsigned char *p = der.data();
        EVP_PKEY *raw = d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()));
        if (raw == nullptr)
        {
            return std::unexpected(WardError::parsing(openssl_error("Invalid public key DER")));
        }
        auto pkey = wrap(raw);
        if (p != der.data() + der.size())
        {
            return std::unexpected(WardError::parsing("Trailing bytes after public key DER"));
        }
        if (auto ok = require_rsa(pkey.get()); !ok)
            return std::unexpected(ok.error());
        return RsaPublicKey(std::move(pkey));
    }

    Result<RsaPublicKey> RsaPublicKey::from_components(const Bytes &modulus, const Bytes &exponent)
    {
        Bytes n_bytes = strip_leading_zeros(modulus);
        Bytes e_bytes = strip_leading_zeros(exponent);
        if (n_bytes.empty() || e_bytes.empty())
        {
            return std::unexpected(WardError::parsing("RSA modulus and exponent must be non-zero"));
        }

        BIGNUM_ptr n(BN_bin2bn(n_bytes.data(), static_cast<int>(n_bytes.size()), nullptr), &BN_free);
        BIGNUM_ptr e(BN_bin2bn(e_bytes.data(), static_cast<int>(e_bytes.size()), nullptr), &BN_free);
        if (!n || !e)
        {
            return std::unexpected(WardError::crypto("BN_bin2bn failed"));
        }

        OSSL_PARAM_BLD_ptr bld(OSSL_PARAM_BLD_new(), &OSSL_PARAM_BLD_free);
        if (!bld ||
            OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) != 1 ||
            OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e.get()) != 1)
        {
            return std::unexpected(WardError::crypto(openssl_error("Failed to build RSA parameters")));
        }
        OSSL_PARAM_ptr params(OSSL_PARAM_BLD_to_param(bld.get()), &OSSL_PARAM_free);
        if (!params)
        {
            return std::unexpected(WardError::crypto(openssl_error("OSSL_PARAM_BLD_to_param failed")));
        }

        EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr), &EVP_PKEY_CTX_free);
        if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1)
        {
            return std::unexpected(WardError::crypto(openssl_error("EVP_PKEY_fromdata_init failed")));
        }
        EVP_PKEY *raw = nullptr;
        if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params.get()) != 1)
        {
            return std::unexpected(WardError::crypto(openssl_error("EVP_PKEY_fromdata failed")));
        }
        auto pkey = wrap(raw);
        if (auto ok = require_rsa(pkey.get()); !ok)
            return std::unexpected(ok.error());
        return RsaPublicKey(std::move(pkey));
    }

    Result<RsaPublicKey> RsaPublicKey::from_xml(const std::string &xml)
    {
        if (xml.find("<RSAKeyValue>") == std::string::npos)
        {
            return std::unexpected(WardError::parsing("Missing <RSAKeyValue> element"));
        }
        auto modulus_b64 = tag_content(xml, "Modulus");
        if (!modulus_b64)
            return std::unexpected(modulus_b64.error());
        auto exponent_b64 = tag_content(xml, "Exponent");
        if (!exponent_b64)
            return std::unexpected(exponent_b64.error());

        auto modulus = Base64::decode(*modulus_b64);
        if (!modulus)
            return std::unexpected(modulus.error());
        auto exponent = Base64::decode(*exponent_b64);
        if (!exponent)
            return std::unexpected(exponent.error());

        return from_components(*modulus, *exponent);
    }

    Result<RsaPublicKey> RsaPublicKey::import(const std::string &text, PublicKeyEncoding encoding)
    {
        switch (encoding)
        {
        case PublicKeyEncoding::Pem:
            return from_pem(text);
        case PublicKeyEncoding::Der:
        {
            auto der = Base64::decode(trim(text));
            if (!der)
                return std::unexpected(der.error());
            return from_der(*der);
        }
        case PublicKeyEncoding::Xml:
            return from_xml(text);
        }
        return std::unexpected(WardError::invalid_input("Unknown public key encoding"));
    }

    Result<std::string> RsaPublicKey::to_pem() const
    {
        BIO_ptr bio(BIO_new(BIO_s_mem()), &BIO_free);
        if (!bio || PEM_write_bio_PUBKEY(bio.get(), pkey_.get()) != 1)
        {
            return std::unexpected(WardError::crypto(openssl_error("PEM_write_bio_PUBKEY failed")));
        }
        return bio_to_string(bio.get());
    }

    Result<Bytes> RsaPublicKey::to_der() const
    {
        int len = i2d_PUBKEY(pkey_.get(), nullptr);
        if (len <= 0)
        {
            return std::unexpected(WardError::crypto(openssl_error("i2d_PUBKEY failed")));
        }
        Bytes der(static_cast<size_t>(len));
        unsigned char *p = der.data();
        if (i2d_PUBKEY(pkey_.get(), &p) != len)
        {
            return std::unexpected(WardError::crypto(openssl_error("i2d_PUBKEY failed")));
        }
        return der;
    }

    Result<std::string> RsaPublicKey::to_xml() const
    {
        auto parts = components();
        if (!parts)
            return std::unexpected(parts.error());
        return std::format("<RSAKeyValue><Modulus>{}</Modulus><Exponent>{}</Exponent></RSAKeyValue>",
                           Base64::encode(with_sign_byte(parts->first)),
                           Base64::encode(with_sign_byte(parts->second)));
    }

    Result<std::string> RsaPublicKey::export_as(PublicKeyEncoding encoding) const
    {
        switch (encoding)
        {
        case PublicKeyEncoding::Pem:
            return to_pem();
        case PublicKeyEncoding::Der:
        {
            auto der = to_der();
            if (!der)
                return std::unexpected(der.error());
            return Base64::encode(*der);
        }
        case PublicKeyEncoding::Xml:
            return to_xml();
        }
        return std::unexpected(WardError::invalid_input("Unknown public key encoding"));
    }

    bool RsaPublicKey::verify(const Bytes &message, const Bytes &signature) const
    {
        if (!pkey_ || signature.empty())
            return false;

        EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx)
            return false;

        EVP_PKEY_CTX *pctx = nullptr;
        if (EVP_DigestVerifyInit(ctx.get(), &pctx, EVP_sha256(), nullptr, pkey_.get()) != 1 ||
            EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) != 1 ||
            EVP_DigestVerifyUpdate(ctx.get(), message.data(), message.size()) != 1)
        {
            ERR_clear_error();
            return false;
        }

        int rc = EVP_DigestVerifyFinal(ctx.get(), signature.data(), signature.size());
        if (rc != 1)
        {
            ERR_clear_error();
            return false;
        }
        return true;
    }

    Result<std::pair<Bytes, Bytes>> RsaPublicKey::components() const
    {
        auto n = get_bn_bytes(pkey_.get(), OSSL_PKEY_PARAM_RSA_N);
        if (!n)
            return std::unexpected(n.error());
        auto e = get_bn_bytes(pkey_.get(), OSSL_PKEY_PARAM_RSA_E);
        if (!e)
            return std::unexpected(e.error());
        return std::make_pair(std::move(*n), std::move(*e));
    }

    bool RsaPublicKey::same_key(const RsaPublicKey &other) const
    {
        auto mine = components();
        auto theirs = other.components();
        return mine && theirs && *mine == *theirs;
    }

    int RsaPublicKey::bits() const
    {
        return EVP_PKEY_get_bits(pkey_.get());
    }

    std::string RsaPublicKey::key_id() const
    {
        auto der = to_der();
        if (!der)
            return {};
        return SHA256::to_hex(SHA256::hash(*der));
    }

    // ============================================================================
    // RsaPrivateKey Implementation
    // ============================================================================

    Result<RsaPrivateKey> RsaPrivateKey::generate(int bits)
    {
        if (bits < kMinRsaBits)
        {
            return std::unexpected(WardError::invalid_input(std::format(
                "RSA key size {} below minimum {}", bits, kMinRsaBits)));
        }

        // Refuse to generate from an unseeded DRBG.
        if (RAND_status() != 1)
        {
            return std::unexpected(WardError::key_generation("Entropy source not seeded"));
        }

        BIGNUM_ptr e(BN_new(), &BN_free);
        if (!e || BN_set_word(e.get(), RSA_F4) != 1)
        {
            return std::unexpected(WardError::key_generation(openssl_error("BN_set_word failed")));
        }

        EVP_PKEY_CTX_ptr genctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), &EVP_PKEY_CTX_free);
        if (!genctx)
        {
            return std::unexpected(WardError::key_generation(openssl_error("EVP_PKEY_CTX_new_id failed")));
        }
        if (EVP_PKEY_keygen_init(genctx.get()) != 1)
        {
            return std::unexpected(WardError::key_generation(openssl_error("EVP_PKEY_keygen_init failed")));
        }
        if (EVP_PKEY_CTX_set_rsa_keygen_bits(genctx.get(), bits) != 1 ||
            EVP_PKEY_CTX_set1_rsa_keygen_pubexp(genctx.get(), e.get()) != 1)
        {
            return std::unexpected(WardError::key_generation(openssl_error("EVP_PKEY_CTX_set_rsa_keygen_* failed")));
        }

        EVP_PKEY *raw = nullptr;
        if (EVP_PKEY_keygen(genctx.get(), &raw) != 1)
        {
            return std::unexpected(WardError::key_generation(openssl_error("EVP_PKEY_keygen failed")));
        }
        return RsaPrivateKey(wrap(raw));
    }

    Result<RsaPrivateKey> RsaPrivateKey::from_pem(const std::string &pem)
    {
        BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
        if (!bio)
        {
            return std::unexpected(WardError::crypto("BIO_new_mem_buf failed"));
        }
        EVP_PKEY *raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
        if (raw == nullptr)
        {
            return std::unexpected(WardError::parsing(openssl_error("Invalid private key PEM")));
        }
        auto pkey = wrap(raw);
        if (auto ok = require_rsa(pkey.get()); !ok)
            return std::unexpected(ok.error());
        return RsaPrivateKey(std::move(pkey));
    }

    Result<std::string> RsaPrivateKey::to_pem() const
    {
        BIO_ptr bio(BIO_new(BIO_s_mem()), &BIO_free);
        if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey_.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
        {
            return std::unexpected(WardError::crypto(openssl_error("PEM_write_bio_PrivateKey failed")));
        }
        return bio_to_string(bio.get());
    }

    Result<Bytes> RsaPrivateKey::sign(const Bytes &message) const
    {
        EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx)
        {
            return std::unexpected(WardError::crypto("EVP_MD_CTX_new failed"));
        }

        EVP_PKEY_CTX *pctx = nullptr;
        if (EVP_DigestSignInit(ctx.get(), &pctx, EVP_sha256(), nullptr, pkey_.get()) != 1 ||
            EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) != 1)
        {
            return std::unexpected(WardError::crypto(openssl_error("EVP_DigestSignInit failed")));
        }
        if (EVP_DigestSignUpdate(ctx.get(), message.data(), message.size()) != 1)
        {
            return std::unexpected(WardError::crypto(openssl_error("EVP_DigestSignUpdate failed")));
        }

        size_t len = 0;
        if (EVP_DigestSignFinal(ctx.get(), nullptr, &len) != 1)
        {
            return std::unexpected(WardError::crypto(openssl_error("EVP_DigestSignFinal failed")));
        }
        Bytes signature(len);
        if (EVP_DigestSignFinal(ctx.get(), signature.data(), &len) != 1)
        {
            return std::unexpected(WardError::crypto(openssl_error("EVP_DigestSignFinal failed")));
        }
        signature.resize(len);
        return signature;
    }

    Result<RsaPublicKey> RsaPrivateKey::public_key() const
    {
        int len = i2d_PUBKEY(pkey_.get(), nullptr);
        if (len <= 0)
        {
            return std::unexpected(WardError::crypto(openssl_error("i2d_PUBKEY failed")));
        }
        Bytes der(static_cast<size_t>(len));
        unsigned char *p = der.data();
        i2d_PUBKEY(pkey_.get(), &p);
        return RsaPublicKey::from_der(der);
    }

    int RsaPrivateKey::bits() const
    {
        return EVP_PKEY_get_bits(pkey_.get());
    }

} // namespace ward::crypto
