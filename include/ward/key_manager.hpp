#pragma once

#include "rsa_key.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace ward::crypto
{

    /**
     * One generation of the issuing key. Immutable once published.
     */
    struct SigningKey
    {
        uint32_t version;
        RsaPrivateKey private_key;
        RsaPublicKey public_key;
        UnixSeconds created_at;

        Result<Bytes> sign(const Bytes &message) const { return private_key.sign(message); }
    };

    /**
     * Public keys a verifier trusts: the current version plus a bounded number
     * of previous ones. Passed explicitly into the verifier.
     */
    class PublicKeyRing
    {
    public:
        PublicKeyRing() = default;

        /** Add or replace a version. The highest version becomes current. */
        void add(uint32_t version, const RsaPublicKey &key);

        /** Key for a version, or nullptr if it is not (or no longer) retained */
        const RsaPublicKey *find(uint32_t version) const;

        uint32_t current_version() const { return current_version_; }
        std::vector<uint32_t> versions() const;
        bool empty() const { return keys_.empty(); }
        size_t size() const { return keys_.size(); }

        /**
         * Drop everything older than the current version minus retain.
         * retain = 4 keeps current and the four before it.
         */
        void prune(size_t retain);

        /** {"current_version": N, "keys": [{"version": N, "pem": "..."}]} */
        Result<nlohmann::json> to_json() const;
        static Result<PublicKeyRing> from_json(const nlohmann::json &j);

        Result<void> save(const std::filesystem::path &path) const;
        static Result<PublicKeyRing> load(const std::filesystem::path &path);

    private:
        std::map<uint32_t, RsaPublicKey> keys_;
        uint32_t current_version_{0};
    };

    /**
     * Versioned issuing keys. Rotation generates the new key outside any lock
     * and then publishes it with a short exclusive section; readers take a
     * shared_ptr snapshot and are never invalidated.
     */
    class KeyStore
    {
    public:
        explicit KeyStore(int key_bits = kMinRsaBits);

        KeyStore(const KeyStore &) = delete;
        KeyStore &operator=(const KeyStore &) = delete;

        /** Insert an existing key; the highest version becomes current */
        void add_key(std::shared_ptr<const SigningKey> key);

        /** Current signing key snapshot */
        Result<std::shared_ptr<const SigningKey>> current_key() const;

        /** Specific version, for exports and historical checks */
        Result<std::shared_ptr<const SigningKey>> get_key(uint32_t version) const;

        /**
         * Generate, self-test and publish version current+1. Previously
         * issued licenses are unaffected.
         */
        Result<uint32_t> rotate();

        std::vector<uint32_t> key_versions() const;
        uint32_t current_version() const;

        /** Current key plus up to retain previous versions */
        Result<PublicKeyRing> public_key_ring(size_t retain = 4) const;

        /** Public half of a version in the requested encoding */
        Result<std::string> export_public(uint32_t version, PublicKeyEncoding encoding) const;

        /** Load every key_NNNN.json in dir (decrypting with encryption_key) */
        Result<void> load_from_directory(const std::filesystem::path &dir, const AESKey &encryption_key);

        /** Persist one version; existing files are replaced atomically */
        Result<void> save_key(const std::filesystem::path &dir, const AESKey &encryption_key, uint32_t version) const;

        Result<void> save_to_directory(const std::filesystem::path &dir, const AESKey &encryption_key) const;

    private:
        mutable std::shared_mutex mutex_;
        std::mutex rotate_mutex_;
        std::map<uint32_t, std::shared_ptr<const SigningKey>> keys_;
        uint32_t current_version_{0};
        int key_bits_;
    };

    /**
     * Key lifecycle helpers: generation, self-test, encrypted storage and the
     * environment-provided storage key.
     */
    class KeyManager
    {
    public:
        /**
         * Create a new RSA keypair for the given version. KeyGenerationFailed
         * is fatal: callers must abort issuance.
         */
        static Result<SigningKey> generate_keypair(uint32_t version, int bits = kMinRsaBits);

        /**
         * Sign a probe message with the private key and verify it with keys
         * re-imported from every public encoding; also checks that the PEM,
         * DER and XML imports are the same mathematical key and that a
         * modified message is rejected.
         */
        static Result<void> self_test(const SigningKey &key);

        /** Run self_test on every version in the store */
        static Result<void> verify_key_store(const KeyStore &store);

        /**
         * Storage key from WARD_KEY_ENCRYPTION_KEY (base64, 32 bytes).
         * There is no built-in default.
         */
        static Result<AESKey> get_encryption_key();

        static std::string key_filename(uint32_t version);

        static Result<void> save_encrypted(const SigningKey &key,
                                           const std::filesystem::path &path,
                                           const AESKey &encryption_key);

        static Result<SigningKey> load_encrypted(const std::filesystem::path &path,
                                                 const AESKey &encryption_key);
    };

} // namespace ward::crypto
