#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace ward
{

    /**
     * Raw identifiers collected from the machine. Never persisted; only the
     * hash leaves this module.
     */
    struct HardwareFacts
    {
        std::string platform_uuid;     // product UUID or machine-id
        std::vector<std::string> macs; // lowercase, sorted, de-duplicated
        std::string cpu_model;
    };

    /**
     * Machine fingerprint:
     *   SHA-256("uuid=<uuid>;macs=<mac>,<mac>;cpu=<sha256(cpu model)>")
     * as lowercase hex. MACs are sorted so interface enumeration order never
     * changes the result.
     */
    class HardwareFingerprinter
    {
    public:
        /**
         * @param root Filesystem root to read from; "/" in production, a fake
         *        tree in tests
         */
        explicit HardwareFingerprinter(std::filesystem::path root = "/");

        /** Collect facts; missing sources yield empty fields */
        HardwareFacts collect() const;

        /** Fingerprint of collect(). Fails if no identifier is available. */
        Result<std::string> fingerprint() const;

        /** Fingerprint of given facts */
        static std::string fingerprint_of(const HardwareFacts &facts);

    private:
        std::string read_platform_uuid() const;
        std::vector<std::string> read_macs() const;
        std::string read_cpu_model() const;

        std::filesystem::path root_;
    };

} // namespace ward
