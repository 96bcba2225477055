#pragma once

#include "audit.hpp"
#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ward
{

    /**
     * Issuer-side set of revoked serials, persisted as a JSON object
     * {serial: revoked_at}. This is what the revocation server answers from.
     *
     * Lookups pick up revocations written by other processes: the file is
     * re-read whenever its modification time or size changes.
     */
    class RevocationList
    {
        struct FileStamp
        {
            std::filesystem::file_time_type mtime;
            std::uintmax_t size{0};

            bool operator==(const FileStamp &) const = default;
        };

    public:
        /**
         * @param path JSON file; empty keeps the list in memory only
         * @param audit Optional; receives a "revoked" event per revocation
         */
        explicit RevocationList(std::filesystem::path path = {}, std::shared_ptr<AuditLog> audit = nullptr);

        /** Read the file; a missing file is an empty list */
        Result<void> load();

        /**
         * Revoke a serial. Revoking an already revoked serial is a no-op and
         * keeps the original timestamp.
         */
        Result<void> revoke(const std::string &serial, const std::string &reason = {},
                            UnixSeconds now = unix_now());

        bool is_revoked(const std::string &serial) const;
        std::optional<UnixSeconds> revoked_at(const std::string &serial) const;
        size_t size() const;

    private:
        static std::optional<FileStamp> stamp_of(const std::filesystem::path &path);
        // Caller holds mutex_.
        void refresh_locked() const;

        std::filesystem::path path_;
        std::shared_ptr<AuditLog> audit_;
        mutable std::map<std::string, UnixSeconds> revoked_;
        mutable std::optional<FileStamp> loaded_stamp_;
        mutable std::mutex mutex_;
    };

} // namespace ward
