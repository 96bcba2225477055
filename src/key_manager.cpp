#include "ward/key_manager.hpp"
#include "ward/file_io.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <format>

namespace ward::crypto
{
    namespace
    {
        constexpr int kKeyFileFormat = 1;

        Bytes to_bytes(const std::string &s)
        {
            return Bytes(s.begin(), s.end());
        }

        /** Binds the ciphertext to its version so files cannot be swapped */
        Bytes key_aad(uint32_t version)
        {
            return to_bytes(std::format("ward-signing-key-v{}", version));
        }
    } // namespace

    // ============================================================================
    // PublicKeyRing Implementation
    // ============================================================================

    void PublicKeyRing::add(uint32_t version, const RsaPublicKey &key)
    {
        keys_.insert_or_assign(version, key);
        current_version_ = std::max(current_version_, version);
    }

    const RsaPublicKey *PublicKeyRing::find(uint32_t version) const
    {
        auto it = keys_.find(version);
        if (it == keys_.end())
            return nullptr;
        return &it->second;
    }

    std::vector<uint32_t> PublicKeyRing::versions() const
    {
        std::vector<uint32_t> out;
        out.reserve(keys_.size());
        for (const auto &[version, _] : keys_)
            out.push_back(version);
        return out;
    }

    void PublicKeyRing::prune(size_t retain)
    {
        if (current_version_ <= retain)
            return;
        uint32_t oldest = current_version_ - static_cast<uint32_t>(retain);
        std::erase_if(keys_, [oldest](const auto &entry) { return entry.first < oldest; });
    }

    Result<nlohmann::json> PublicKeyRing::to_json() const
    {
        nlohmann::json keys = nlohmann::json::array();
        for (const auto &[version, key] : keys_)
        {
            auto pem = key.to_pem();
            if (!pem)
                return std::unexpected(pem.error());
            keys.push_back({{"version", version}, {"pem", *pem}});
        }
        return nlohmann::json{{"current_version", current_version_}, {"keys", keys}};
    }

    Result<PublicKeyRing> PublicKeyRing::from_json(const nlohmann::json &j)
    {
        try
        {
            PublicKeyRing ring;
            for (const auto &entry : j.at("keys"))
            {
                auto key = RsaPublicKey::from_pem(entry.at("pem").get<std::string>());
                if (!key)
                    return std::unexpected(key.error());
                ring.add(entry.at("version").get<uint32_t>(), *key);
            }
            auto declared = j.at("current_version").get<uint32_t>();
            if (declared != ring.current_version_)
            {
                return std::unexpected(WardError::validation(std::format(
                    "Key ring declares current version {} but holds up to {}", declared, ring.current_version_)));
            }
            return ring;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardError::parsing(std::format("Invalid key ring JSON: {}", e.what())));
        }
    }

    Result<void> PublicKeyRing::save(const std::filesystem::path &path) const
    {
        auto j = to_json();
        if (!j)
            return std::unexpected(j.error());
        return atomic_write_file(path, j->dump(2), false);
    }

    Result<PublicKeyRing> PublicKeyRing::load(const std::filesystem::path &path)
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
            return std::unexpected(WardError::parsing(std::format("Invalid key ring file {}: {}", path.string(), e.what())));
        }
    }

    // ============================================================================
    // KeyStore Implementation
    // ============================================================================

    KeyStore::KeyStore(int key_bits) : key_bits_(key_bits) {}

    void KeyStore::add_key(std::shared_ptr<const SigningKey> key)
    {
        std::unique_lock lock(mutex_);
        uint32_t version = key->version;
        keys_[version] = std::move(key);
        current_version_ = std::max(current_version_, version);
    }

    Result<std::shared_ptr<const SigningKey>> KeyStore::current_key() const
    {
        std::shared_lock lock(mutex_);
        if (keys_.empty())
        {
            return std::unexpected(WardError::not_found("KeyStore is empty"));
        }
        return keys_.at(current_version_);
    }

    Result<std::shared_ptr<const SigningKey>> KeyStore::get_key(uint32_t version) const
    {
        std::shared_lock lock(mutex_);
        auto it = keys_.find(version);
        if (it == keys_.end())
        {
            return std::unexpected(WardError::not_found(std::format("Key version {} not found", version)));
        }
        return it->second;
    }

    Result<uint32_t> KeyStore::rotate()
    {
        // One rotation at a time; issuers only contend on the publish step.
        std::lock_guard rotation(rotate_mutex_);

        uint32_t new_version = current_version() + 1;
        auto key = KeyManager::generate_keypair(new_version, key_bits_);
        if (!key)
            return std::unexpected(key.error());

        if (auto tested = KeyManager::self_test(*key); !tested)
        {
            return std::unexpected(WardError::key_generation(std::format(
                "Self-test failed for key version {}: {}", new_version, tested.error().what())));
        }

        add_key(std::make_shared<const SigningKey>(std::move(*key)));
        spdlog::info("Published signing key version {}", new_version);
        return new_version;
    }

    std::vector<uint32_t> KeyStore::key_versions() const
    {
        std::shared_lock lock(mutex_);
        std::vector<uint32_t> versions;
        versions.reserve(keys_.size());
        for (const auto &[version, _] : keys_)
            versions.push_back(version);
        return versions;
    }

    uint32_t KeyStore::current_version() const
    {
        std::shared_lock lock(mutex_);
        return current_version_;
    }

    Result<PublicKeyRing> KeyStore::public_key_ring(size_t retain) const
    {
        std::shared_lock lock(mutex_);
        if (keys_.empty())
        {
            return std::unexpected(WardError::not_found("KeyStore is empty"));
        }
        PublicKeyRing ring;
        for (const auto &[version, key] : keys_)
        {
            ring.add(version, key->public_key);
        }
        ring.prune(retain);
        return ring;
    }

    Result<std::string> KeyStore::export_public(uint32_t version, PublicKeyEncoding encoding) const
    {
        auto key = get_key(version);
        if (!key)
            return std::unexpected(key.error());
        return (*key)->public_key.export_as(encoding);
    }

    Result<void> KeyStore::load_from_directory(const std::filesystem::path &dir, const AESKey &encryption_key)
    {
        if (!std::filesystem::exists(dir))
        {
            return std::unexpected(WardError::not_found(std::format("Key directory not found: {}", dir.string())));
        }

        size_t loaded = 0;
        for (const auto &entry : std::filesystem::directory_iterator(dir))
        {
            if (!entry.is_regular_file())
                continue;

            std::string filename = entry.path().filename().string();
            if (filename.starts_with("key_") && filename.ends_with(".json"))
            {
                auto key = KeyManager::load_encrypted(entry.path(), encryption_key);
                if (!key)
                {
                    return std::unexpected(key.error());
                }
                add_key(std::make_shared<const SigningKey>(std::move(*key)));
                ++loaded;
            }
        }

        if (loaded == 0)
        {
            return std::unexpected(WardError::not_found(std::format("No signing keys found in {}", dir.string())));
        }
        return {};
    }

    Result<void> KeyStore::save_key(const std::filesystem::path &dir, const AESKey &encryption_key, uint32_t version) const
    {
        auto key = get_key(version);
        if (!key)
            return std::unexpected(key.error());
        return KeyManager::save_encrypted(**key, dir / KeyManager::key_filename(version), encryption_key);
    }

    Result<void> KeyStore::save_to_directory(const std::filesystem::path &dir, const AESKey &encryption_key) const
    {
        for (uint32_t version : key_versions())
        {
            auto result = save_key(dir, encryption_key, version);
            if (!result)
                return result;
        }
        return {};
    }

    // ============================================================================
    // KeyManager Implementation
    // ============================================================================

    Result<SigningKey> KeyManager::generate_keypair(uint32_t version, int bits)
    {
        auto private_key = RsaPrivateKey::generate(bits);
        if (!private_key)
        {
            spdlog::error("Key generation failed for version {}: {}", version, private_key.error().what());
            return std::unexpected(private_key.error());
        }
        auto public_key = private_key->public_key();
        if (!public_key)
            return std::unexpected(WardError::key_generation(public_key.error().what()));

        return SigningKey{version, std::move(*private_key), std::move(*public_key), unix_now()};
    }

    Result<void> KeyManager::self_test(const SigningKey &key)
    {
        Bytes probe = to_bytes(std::format("ward key self-test v{}", key.version));
        auto signature = key.sign(probe);
        if (!signature)
            return std::unexpected(signature.error());

        std::vector<RsaPublicKey> imported;
        for (auto encoding : {PublicKeyEncoding::Pem, PublicKeyEncoding::Der, PublicKeyEncoding::Xml})
        {
            auto exported = key.public_key.export_as(encoding);
            if (!exported)
                return std::unexpected(exported.error());

            auto reimported = RsaPublicKey::import(*exported, encoding);
            if (!reimported)
            {
                return std::unexpected(WardError::crypto(std::format(
                    "{} export does not re-import: {}", encoding_to_string(encoding), reimported.error().what())));
            }
            if (!reimported->verify(probe, *signature))
            {
                return std::unexpected(WardError::crypto(std::format(
                    "Signature does not verify with {} export", encoding_to_string(encoding))));
            }
            imported.push_back(std::move(*reimported));
        }

        for (const auto &other : imported)
        {
            if (!other.same_key(imported.front()) || !other.same_key(key.public_key))
            {
                return std::unexpected(WardError::crypto("Public key encodings disagree on modulus or exponent"));
            }
        }

        Bytes tampered = probe;
        tampered.back() ^= 0x01;
        if (key.public_key.verify(tampered, *signature))
        {
            return std::unexpected(WardError::crypto("Modified message verified"));
        }
        return {};
    }

    Result<void> KeyManager::verify_key_store(const KeyStore &store)
    {
        auto versions = store.key_versions();
        if (versions.empty())
        {
            return std::unexpected(WardError::validation("KeyStore is empty"));
        }

        for (uint32_t version : versions)
        {
            auto key = store.get_key(version);
            if (!key)
                return std::unexpected(key.error());

            if (auto ok = self_test(**key); !ok)
            {
                return std::unexpected(WardError::crypto(std::format(
                    "Key version {} failed self-test: {}", version, ok.error().what())));
            }
        }
        return {};
    }

    Result<AESKey> KeyManager::get_encryption_key()
    {
        const char *env_key = std::getenv("WARD_KEY_ENCRYPTION_KEY");
        if (env_key == nullptr || *env_key == '\0')
        {
            return std::unexpected(WardError::config("WARD_KEY_ENCRYPTION_KEY is not set"));
        }

        auto decoded = Base64::decode(env_key);
        if (!decoded)
        {
            return std::unexpected(decoded.error());
        }

        if (decoded->size() != 32)
        {
            return std::unexpected(WardError::config("WARD_KEY_ENCRYPTION_KEY must be 32 bytes when base64-decoded"));
        }

        AESKey key;
        std::copy_n(decoded->begin(), 32, key.begin());
        return key;
    }

    std::string KeyManager::key_filename(uint32_t version)
    {
        return std::format("key_{:04d}.json", version);
    }

    Result<void> KeyManager::save_encrypted(const SigningKey &key,
                                            const std::filesystem::path &path,
                                            const AESKey &encryption_key)
    {
        auto private_pem = key.private_key.to_pem();
        if (!private_pem)
            return std::unexpected(private_pem.error());

        auto encrypted = AES256GCM::encrypt(encryption_key, to_bytes(*private_pem), key_aad(key.version));
        if (!encrypted)
            return std::unexpected(encrypted.error());

        auto public_pem = key.public_key.to_pem();
        if (!public_pem)
            return std::unexpected(public_pem.error());

        nlohmann::json j;
        j["format"] = kKeyFileFormat;
        j["key_version"] = key.version;
        j["algorithm"] = std::format("RSA-{}/PKCS1v15-SHA256", key.private_key.bits());
        j["encrypted_private_key_b64"] = Base64::encode(*encrypted);
        j["public_key_pem"] = *public_pem;
        j["created_at"] = key.created_at;
        j["created_at_iso"] = to_iso8601(key.created_at);

        return atomic_write_file(path, j.dump(2), true);
    }

    Result<SigningKey> KeyManager::load_encrypted(const std::filesystem::path &path,
                                                  const AESKey &encryption_key)
    {
        auto content = read_file(path);
        if (!content)
            return std::unexpected(content.error());

        nlohmann::json j;
        try
        {
            j = nlohmann::json::parse(*content);
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardError::parsing(std::format("Invalid JSON in key file {}: {}", path.string(), e.what())));
        }

        if (!j.contains("encrypted_private_key_b64") || !j.contains("key_version") || !j.contains("public_key_pem"))
        {
            return std::unexpected(WardError::validation(std::format("Missing required fields in key file {}", path.string())));
        }

        uint32_t version = 0;
        UnixSeconds created_at = 0;
        std::string encrypted_b64;
        std::string public_pem;
        try
        {
            version = j.at("key_version").get<uint32_t>();
            created_at = j.value("created_at", UnixSeconds{0});
            encrypted_b64 = j.at("encrypted_private_key_b64").get<std::string>();
            public_pem = j.at("public_key_pem").get<std::string>();
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardError::parsing(std::format("Invalid field in key file {}: {}", path.string(), e.what())));
        }

        auto encrypted = Base64::decode(encrypted_b64);
        if (!encrypted)
            return std::unexpected(encrypted.error());

        auto decrypted = AES256GCM::decrypt(encryption_key, *encrypted, key_aad(version));
        if (!decrypted)
            return std::unexpected(decrypted.error());

        auto private_key = RsaPrivateKey::from_pem(std::string(decrypted->begin(), decrypted->end()));
        std::fill(decrypted->begin(), decrypted->end(), uint8_t{0});
        if (!private_key)
            return std::unexpected(private_key.error());

        auto public_key = private_key->public_key();
        if (!public_key)
            return std::unexpected(public_key.error());

        auto stored_public = RsaPublicKey::from_pem(public_pem);
        if (!stored_public || !stored_public->same_key(*public_key))
        {
            return std::unexpected(WardError::validation(std::format(
                "Public key in {} does not match its private key", path.string())));
        }

        return SigningKey{version, std::move(*private_key), std::move(*public_key), created_at};
    }

} // namespace ward::crypto
