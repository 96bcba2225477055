#pragma once

#include "license_record.hpp"
#include "types.hpp"
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>

namespace ward
{

    /**
     * Record of every serial ever issued, used to keep serials unique.
     * Persisted as JSON lines (one issued record per line); an empty path
     * keeps the ledger in memory only.
     */
    class IssuanceLedger
    {
    public:
        explicit IssuanceLedger(std::filesystem::path path = {});

        /** Read the ledger file, if any. Safe to call once at startup. */
        Result<void> load();

        bool contains(const std::string &serial) const;

        /**
         * Reserve a serial. Returns false if it already exists. The check and
         * the insert happen under one lock.
         */
        bool try_reserve(const std::string &serial);

        /** Drop a reservation that never made it to a signed record */
        void release(const std::string &serial);

        /** Persist a signed record for a reserved serial */
        Result<void> commit(const LicenseRecord &record);

        size_t size() const;

    private:
        std::filesystem::path path_;
        std::unordered_set<std::string> serials_;
        mutable std::mutex mutex_;
    };

} // namespace ward
