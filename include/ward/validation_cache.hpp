#pragma once

#include "crypto.hpp"
#include "license_record.hpp"
#include "types.hpp"
#include <filesystem>
#include <functional>
#include <optional>

namespace ward
{

    /**
     * Client-side state carried between verifications.
     */
    struct CacheState
    {
        std::optional<LicenseRecord> record;   // last record verified or confirmed online
        std::optional<UnixSeconds> last_online; // server time of the last successful reconcile
        bool revoked{false};                    // last known revocation status for record
        UnixSeconds last_seen{0};               // highest local clock observed

        nlohmann::json to_json() const;
        static Result<CacheState> from_json(const nlohmann::json &j);
    };

    /**
     * HMAC-protected cache file. The HMAC key is derived from the local
     * hardware fingerprint, so a file copied from another machine, or edited
     * by hand, fails authentication. Such a file is discarded and treated as
     * absent.
     *
     * Every update is a locked read-modify-write with an atomic replace.
     */
    class ValidationCache
    {
    public:
        ValidationCache(std::filesystem::path path, const std::string &fingerprint);

        /**
         * Current state, or nullopt when the file is missing or fails its
         * HMAC. I/O failures are errors.
         */
        Result<std::optional<CacheState>> load() const;

        /**
         * Lock, read (absent = default state), apply mutate, write. Returns
         * the state written.
         */
        Result<CacheState> update(const std::function<void(CacheState &)> &mutate);

        const std::filesystem::path &path() const { return path_; }

    private:
        Result<std::optional<CacheState>> read_unlocked() const;
        Result<void> write_unlocked(const CacheState &state) const;

        std::filesystem::path path_;
        crypto::HmacKey key_;
    };

} // namespace ward
