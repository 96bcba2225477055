#pragma once

#include "crypto.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace ward
{

    struct KeysConfig
    {
        std::string dir{"./keys"};
        int bits{2048};
        std::size_t retain{4}; // previous versions kept in the public ring
    };

    struct IssuanceConfig
    {
        std::string ledger_path{"./data/issued.jsonl"};
    };

    struct AuditConfig
    {
        std::string log_path{"./logs/audit.jsonl"};
        std::optional<crypto::HmacKey> key; // [audit] key or WARD_AUDIT_KEY
    };

    struct CacheConfig
    {
        std::string path{"./data/validation_cache.json"};
        int64_t grace_days{30};
        int64_t clock_skew_seconds{300};
    };

    struct RevocationConfig
    {
        std::string endpoint; // empty = offline deployment
        int64_t timeout_ms{1500};
        std::string list_path{"./data/revoked.json"};
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8080};
        std::size_t threads{4};
        double rps{1.0};
        double burst{60.0};
    };

    struct LogConfig
    {
        std::string level{"info"};
    };

    struct WardConfig
    {
        KeysConfig keys{};
        IssuanceConfig issuance{};
        AuditConfig audit{};
        CacheConfig cache{};
        RevocationConfig revocation{};
        ServerConfig server{};
        LogConfig log{};
    };

    /**
     * ConfigLoader loads TOML configs (toml++) with WARD_* environment
     * overrides. Secrets (audit key) can come from either; the key storage
     * key is environment-only.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<WardConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<WardConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides, for runs without a config file. */
        static Result<WardConfig> defaults();

        /** Serialize config to JSON for inspection (non-secret). */
        static nlohmann::json to_json(const WardConfig &cfg);

        /** Set the spdlog level from cfg.log.level */
        static Result<void> apply_logging(const WardConfig &cfg);

    private:
        static Result<void> apply_env_overrides(WardConfig &cfg);
    };

} // namespace ward
