#include "ward/validation_cache.hpp"
#include "ward/file_io.hpp"
#include "ward/json_canonicalization.hpp"
#include <spdlog/spdlog.h>

namespace ward
{
    namespace
    {
        constexpr int kCacheFormat = 1;
        constexpr const char *kKeyLabel = "ward.validation-cache.v1";
    } // namespace

    nlohmann::json CacheState::to_json() const
    {
        return nlohmann::json{{"format", kCacheFormat},
                              {"record", record ? record->to_json() : nlohmann::json(nullptr)},
                              {"last_online", last_online ? nlohmann::json(*last_online) : nlohmann::json(nullptr)},
                              {"revoked", revoked},
                              {"last_seen", last_seen}};
    }

    Result<CacheState> CacheState::from_json(const nlohmann::json &j)
    {
        try
        {
            if (j.at("format").get<int>() != kCacheFormat)
            {
                return std::unexpected(WardError::parsing("Unsupported validation cache format"));
            }

            CacheState state;
            if (!j.at("record").is_null())
            {
                auto record = LicenseRecord::from_json(j.at("record"));
                if (!record)
                    return std::unexpected(record.error());
                state.record = *record;
            }
            if (!j.at("last_online").is_null())
                state.last_online = j.at("last_online").get<UnixSeconds>();
            state.revoked = j.at("revoked").get<bool>();
            state.last_seen = j.at("last_seen").get<UnixSeconds>();
            return state;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardError::parsing(std::format("Invalid validation cache: {}", e.what())));
        }
    }

    ValidationCache::ValidationCache(std::filesystem::path path, const std::string &fingerprint)
        : path_(std::move(path)), key_(crypto::HmacSha256::derive_key(fingerprint, kKeyLabel))
    {
    }

    Result<std::optional<CacheState>> ValidationCache::load() const
    {
        auto lock = FileLock::acquire(path_);
        if (!lock)
            return std::unexpected(lock.error());
        return read_unlocked();
    }

    Result<CacheState> ValidationCache::update(const std::function<void(CacheState &)> &mutate)
    {
        auto lock = FileLock::acquire(path_);
        if (!lock)
            return std::unexpected(lock.error());

        auto current = read_unlocked();
        if (!current)
            return std::unexpected(current.error());

        CacheState state = current->value_or(CacheState{});
        mutate(state);

        if (auto written = write_unlocked(state); !written)
            return std::unexpected(written.error());
        return state;
    }

    Result<std::optional<CacheState>> ValidationCache::read_unlocked() const
    {
        auto content = read_file(path_);
        if (!content)
        {
            if (content.error().code == ErrorCode::NotFound)
                return std::optional<CacheState>{};
            return std::unexpected(content.error());
        }

        nlohmann::json j;
        try
        {
            j = nlohmann::json::parse(*content);
        }
        catch (const nlohmann::json::exception &)
        {
            spdlog::warn("Validation cache {} is not valid JSON; discarding", path_.string());
            return std::optional<CacheState>{};
        }

        if (!j.is_object() || !j.contains("hmac") || !j.at("hmac").is_string())
        {
            spdlog::warn("Validation cache {} has no HMAC; discarding", path_.string());
            return std::optional<CacheState>{};
        }

        std::string tag = j.at("hmac").get<std::string>();
        j.erase("hmac");
        auto canonical = json::RFC8785Canonicalizer::canonicalize(j);
        if (!canonical || !crypto::HmacSha256::verify_hex(key_, *canonical, tag))
        {
            spdlog::warn("Validation cache {} failed authentication; discarding", path_.string());
            return std::optional<CacheState>{};
        }

        auto state = CacheState::from_json(j);
        if (!state)
        {
            spdlog::warn("Validation cache {} is unreadable ({}); discarding", path_.string(), state.error().what());
            return std::optional<CacheState>{};
        }
        return std::optional<CacheState>(std::move(*state));
    }

    Result<void> ValidationCache::write_unlocked(const CacheState &state) const
    {
        auto j = state.to_json();
        auto canonical = json::RFC8785Canonicalizer::canonicalize(j);
        if (!canonical)
            return std::unexpected(canonical.error());
        j["hmac"] = crypto::HmacSha256::mac_hex(key_, *canonical);
        return atomic_write_file(path_, j.dump(2), true);
    }

} // namespace ward
