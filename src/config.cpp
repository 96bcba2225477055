#include "ward/config.hpp"
#include "ward/audit.hpp"
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ward
{
    namespace
    {
        Result<int64_t> parse_int(const char *name, const std::string &value)
        {
            int64_t out = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
            if (ec != std::errc() || ptr != value.data() + value.size())
            {
                return std::unexpected(WardError::config(std::format("{} must be an integer, got '{}'", name, value)));
            }
            return out;
        }

        Result<void> validate(const WardConfig &cfg)
        {
            if (cfg.keys.bits < 2048)
                return std::unexpected(WardError::config("keys.bits must be at least 2048"));
            if (cfg.cache.grace_days < 0)
                return std::unexpected(WardError::config("cache.grace_days must not be negative"));
            if (cfg.cache.clock_skew_seconds < 0)
                return std::unexpected(WardError::config("cache.clock_skew_seconds must not be negative"));
            if (cfg.revocation.timeout_ms <= 0)
                return std::unexpected(WardError::config("revocation.timeout_ms must be positive"));
            if (cfg.server.threads == 0)
                return std::unexpected(WardError::config("server.threads must be positive"));
            if (cfg.server.rps <= 0 || cfg.server.burst < 1)
                return std::unexpected(WardError::config("server.rps must be positive and server.burst at least 1"));
            if (spdlog::level::from_str(cfg.log.level) == spdlog::level::off && cfg.log.level != "off")
                return std::unexpected(WardError::config(std::format("Unknown log level '{}'", cfg.log.level)));
            return {};
        }

        Result<WardConfig> parse_toml(const toml::table &tbl, WardConfig cfg)
        {
            if (auto keys = tbl["keys"].as_table())
            {
                if (auto dir = (*keys)["dir"].value<std::string>())
                    cfg.keys.dir = *dir;
                if (auto bits = (*keys)["bits"].value<int64_t>())
                    cfg.keys.bits = static_cast<int>(*bits);
                if (auto retain = (*keys)["retain"].value<int64_t>())
                {
                    if (*retain < 0)
                        return std::unexpected(WardError::config("keys.retain must not be negative"));
                    cfg.keys.retain = static_cast<std::size_t>(*retain);
                }
            }

            if (auto issuance = tbl["issuance"].as_table())
            {
                if (auto path = (*issuance)["ledger_path"].value<std::string>())
                    cfg.issuance.ledger_path = *path;
            }

            if (auto audit = tbl["audit"].as_table())
            {
                if (auto path = (*audit)["log_path"].value<std::string>())
                    cfg.audit.log_path = *path;
                if (auto key = (*audit)["key"].value<std::string>())
                {
                    auto decoded = AuditLog::key_from_base64(*key);
                    if (!decoded)
                        return std::unexpected(WardError::config(std::format("audit.key: {}", decoded.error().what())));
                    cfg.audit.key = *decoded;
                }
            }

            if (auto cache = tbl["cache"].as_table())
            {
                if (auto path = (*cache)["path"].value<std::string>())
                    cfg.cache.path = *path;
                if (auto grace = (*cache)["grace_days"].value<int64_t>())
                    cfg.cache.grace_days = *grace;
                if (auto skew = (*cache)["clock_skew_seconds"].value<int64_t>())
                    cfg.cache.clock_skew_seconds = *skew;
            }

            if (auto revocation = tbl["revocation"].as_table())
            {
                if (auto endpoint = (*revocation)["endpoint"].value<std::string>())
                    cfg.revocation.endpoint = *endpoint;
                if (auto timeout = (*revocation)["timeout_ms"].value<int64_t>())
                    cfg.revocation.timeout_ms = *timeout;
                if (auto path = (*revocation)["list_path"].value<std::string>())
                    cfg.revocation.list_path = *path;
            }

            if (auto server = tbl["server"].as_table())
            {
                if (auto address = (*server)["address"].value<std::string>())
                    cfg.server.address = *address;
                if (auto port = (*server)["port"].value<int64_t>())
                {
                    if (*port < 0 || *port > 65535)
                        return std::unexpected(WardError::config(std::format("server.port out of range: {}", *port)));
                    cfg.server.port = static_cast<std::uint16_t>(*port);
                }
                if (auto threads = (*server)["threads"].value<int64_t>())
                    cfg.server.threads = static_cast<std::size_t>(std::max<int64_t>(*threads, 0));
                if (auto rps = (*server)["rps"].value<double>())
                    cfg.server.rps = *rps;
                if (auto burst = (*server)["burst"].value<double>())
                    cfg.server.burst = *burst;
            }

            if (auto log = tbl["log"].as_table())
            {
                if (auto level = (*log)["level"].value<std::string>())
                    cfg.log.level = *level;
            }

            return cfg;
        }

    } // namespace

    Result<WardConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(WardError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<WardConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        WardConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return parsed;
            cfg = *parsed;
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(WardError::config(std::format("Failed to parse TOML: {}", e.description())));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = validate(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<WardConfig> ConfigLoader::defaults()
    {
        return from_string("");
    }

    Result<void> ConfigLoader::apply_env_overrides(WardConfig &cfg)
    {
        if (const char *dir = std::getenv("WARD_KEYS_DIR"))
            cfg.keys.dir = dir;
        if (const char *ledger = std::getenv("WARD_LEDGER_PATH"))
            cfg.issuance.ledger_path = ledger;
        if (const char *audit_path = std::getenv("WARD_AUDIT_LOG"))
            cfg.audit.log_path = audit_path;
        if (const char *audit_key = std::getenv("WARD_AUDIT_KEY"))
        {
            auto decoded = AuditLog::key_from_base64(audit_key);
            if (!decoded)
                return std::unexpected(WardError::config(std::format("WARD_AUDIT_KEY: {}", decoded.error().what())));
            cfg.audit.key = *decoded;
        }
        if (const char *cache = std::getenv("WARD_CACHE_PATH"))
            cfg.cache.path = cache;
        if (const char *grace = std::getenv("WARD_GRACE_DAYS"))
        {
            auto v = parse_int("WARD_GRACE_DAYS", grace);
            if (!v)
                return std::unexpected(v.error());
            cfg.cache.grace_days = *v;
        }
        if (const char *endpoint = std::getenv("WARD_REVOCATION_ENDPOINT"))
            cfg.revocation.endpoint = endpoint;
        if (const char *list = std::getenv("WARD_REVOCATION_LIST"))
            cfg.revocation.list_path = list;
        if (const char *port = std::getenv("WARD_SERVER_PORT"))
        {
            auto v = parse_int("WARD_SERVER_PORT", port);
            if (!v)
                return std::unexpected(v.error());
            if (*v < 0 || *v > 65535)
                return std::unexpected(WardError::config(std::format("WARD_SERVER_PORT out of range: {}", *v)));
            cfg.server.port = static_cast<std::uint16_t>(*v);
        }
        if (const char *level = std::getenv("WARD_LOG_LEVEL"))
            cfg.log.level = level;
        return {};
    }

    Result<void> ConfigLoader::apply_logging(const WardConfig &cfg)
    {
        auto level = spdlog::level::from_str(cfg.log.level);
        if (level == spdlog::level::off && cfg.log.level != "off")
            return std::unexpected(WardError::config(std::format("Unknown log level '{}'", cfg.log.level)));
        spdlog::set_level(level);
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const WardConfig &cfg)
    {
        nlohmann::json j;
        j["keys"] = {{"dir", cfg.keys.dir}, {"bits", cfg.keys.bits}, {"retain", cfg.keys.retain}};
        j["issuance"] = {{"ledger_path", cfg.issuance.ledger_path}};
        j["audit"] = {{"log_path", cfg.audit.log_path}, {"has_key", cfg.audit.key.has_value()}};
        j["cache"] = {{"path", cfg.cache.path},
                      {"grace_days", cfg.cache.grace_days},
                      {"clock_skew_seconds", cfg.cache.clock_skew_seconds}};
        j["revocation"] = {{"endpoint", cfg.revocation.endpoint},
                           {"timeout_ms", cfg.revocation.timeout_ms},
                           {"list_path", cfg.revocation.list_path}};
        j["server"] = {{"address", cfg.server.address},
                       {"port", cfg.server.port},
                       {"threads", cfg.server.threads},
                       {"rps", cfg.server.rps},
                       {"burst", cfg.server.burst}};
        j["log"] = {{"level", cfg.log.level}};
        j["has_key_encryption_key"] = std::getenv("WARD_KEY_ENCRYPTION_KEY") != nullptr;
        return j;
    }

} // namespace ward
