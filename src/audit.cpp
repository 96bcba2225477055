#include "ward/audit.hpp"
#include "ward/file_io.hpp"
#include "ward/json_canonicalization.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace ward
{

    std::string event_type_to_string(AuditEventType type)
    {
        switch (type)
        {
        case AuditEventType::Issued:
            return "issued";
        case AuditEventType::Verified:
            return "verified";
        case AuditEventType::Rejected:
            return "rejected";
        case AuditEventType::Revoked:
            return "revoked";
        }
        return "unknown";
    }

    std::optional<AuditEventType> event_type_from_string(const std::string &s)
    {
        if (s == "issued")
            return AuditEventType::Issued;
        if (s == "verified")
            return AuditEventType::Verified;
        if (s == "rejected")
            return AuditEventType::Rejected;
        if (s == "revoked")
            return AuditEventType::Revoked;
        return std::nullopt;
    }

    nlohmann::json AuditEntry::body_json() const
    {
        return nlohmann::json{{"seq", seq},
                              {"timestamp", timestamp},
                              {"event", event_type_to_string(event_type)},
                              {"subject", subject},
                              {"result", result},
                              {"details", details},
                              {"prev_hash", prev_hash}};
    }

    nlohmann::json AuditEntry::to_json() const
    {
        auto j = body_json();
        j["entry_hmac"] = entry_hmac;
        return j;
    }

    Result<AuditEntry> AuditEntry::from_json(const nlohmann::json &j)
    {
        try
        {
            AuditEntry entry;
            entry.seq = j.at("seq").get<uint64_t>();
            entry.timestamp = j.at("timestamp").get<UnixSeconds>();
            auto type = event_type_from_string(j.at("event").get<std::string>());
            if (!type)
            {
                return std::unexpected(WardError::parsing(std::format("Unknown audit event type: {}", j.at("event").dump())));
            }
            entry.event_type = *type;
            entry.subject = j.at("subject").get<std::string>();
            entry.result = j.at("result").get<std::string>();
            entry.details = j.at("details");
            entry.prev_hash = j.at("prev_hash").get<std::string>();
            entry.entry_hmac = j.at("entry_hmac").get<std::string>();
            return entry;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardError::parsing(std::format("Invalid audit entry: {}", e.what())));
        }
    }

    AuditLog::AuditLog(std::filesystem::path path, const crypto::HmacKey &key)
        : path_(std::move(path)), key_(key)
    {
    }

    std::string AuditLog::compute_hmac(const crypto::HmacKey &key,
                                       const std::string &prev_hash,
                                       const std::string &canonical_body)
    {
        return crypto::HmacSha256::mac_hex(key, prev_hash + canonical_body);
    }

    Result<crypto::HmacKey> AuditLog::key_from_base64(const std::string &b64)
    {
        auto decoded = crypto::Base64::decode(b64);
        if (!decoded)
            return std::unexpected(WardError::config("Audit key is not valid base64"));
        if (decoded->size() != 32)
            return std::unexpected(WardError::config("Audit key must be 32 bytes when base64-decoded"));
        crypto::HmacKey key;
        std::copy_n(decoded->begin(), 32, key.begin());
        return key;
    }

    Result<std::vector<std::string>> AuditLog::read_lines() const
    {
        std::vector<std::string> lines;
        auto content = read_file(path_);
        if (!content)
        {
            if (content.error().code == ErrorCode::NotFound)
                return lines;
            return std::unexpected(content.error());
        }

        std::istringstream in(*content);
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty())
                lines.push_back(std::move(line));
        }
        return lines;
    }

    Result<std::string> AuditLog::append(const AuditEvent &event)
    {
        std::lock_guard guard(mutex_);
        auto lock = FileLock::acquire(path_);
        if (!lock)
            return std::unexpected(lock.error());

        auto lines = read_lines();
        if (!lines)
            return std::unexpected(lines.error());

        AuditEntry entry;
        entry.prev_hash = std::string(kGenesisHash);
        if (!lines->empty())
        {
            nlohmann::json last;
            try
            {
                last = nlohmann::json::parse(lines->back());
            }
            catch (const nlohmann::json::exception &e)
            {
                return std::unexpected(WardError::storage(std::format("Audit log tail is unreadable: {}", e.what())));
            }
            auto tail = AuditEntry::from_json(last);
            if (!tail)
                return std::unexpected(WardError::storage(std::format("Audit log tail is unreadable: {}", tail.error().what())));
            entry.seq = tail->seq + 1;
            entry.prev_hash = tail->entry_hmac;
        }

        entry.timestamp = event.timestamp.value_or(unix_now());
        entry.event_type = event.type;
        entry.subject = event.subject;
        entry.result = event.result;
        entry.details = event.details.is_object() ? event.details : nlohmann::json{{"value", event.details}};

        auto canonical = json::RFC8785Canonicalizer::canonicalize(entry.body_json());
        if (!canonical)
            return std::unexpected(canonical.error());
        entry.entry_hmac = compute_hmac(key_, entry.prev_hash, *canonical);

        std::string line;
        try
        {
            line = entry.to_json().dump();
        }
        catch (const nlohmann::json::exception &e)
        {
            // dump() rejects strings that are not valid UTF-8.
            return std::unexpected(WardError::invalid_input(std::format("Audit event is not serializable: {}", e.what())));
        }
        if (auto written = append_line(path_, line); !written)
        {
            spdlog::error("Audit append failed: {}", written.error().what());
            return std::unexpected(WardError::storage(std::format("Audit append failed: {}", written.error().what())));
        }

        spdlog::info("audit {}", line);
        return entry.entry_hmac;
    }

    Result<ChainReport> AuditLog::verify_chain() const
    {
        std::lock_guard guard(mutex_);
        auto lock = FileLock::acquire(path_);
        if (!lock)
            return std::unexpected(lock.error());

        auto lines = read_lines();
        if (!lines)
            return std::unexpected(lines.error());

        ChainReport report;
        report.entries = lines->size();
        std::string expected_prev(kGenesisHash);

        auto fail = [&report](size_t index, std::string reason) {
            report.valid = false;
            report.first_invalid = index;
            report.reason = std::move(reason);
            return report;
        };

        for (size_t i = 0; i < lines->size(); ++i)
        {
            nlohmann::json j;
            try
            {
                j = nlohmann::json::parse((*lines)[i]);
            }
            catch (const nlohmann::json::exception &)
            {
                return fail(i, "entry is not valid JSON");
            }

            auto entry = AuditEntry::from_json(j);
            if (!entry)
                return fail(i, entry.error().what());

            if (entry->seq != i)
                return fail(i, std::format("sequence {} at position {}", entry->seq, i));

            if (!crypto::constant_time_equals(entry->prev_hash, expected_prev))
                return fail(i, "prev_hash does not link to the previous entry");

            auto canonical = json::RFC8785Canonicalizer::canonicalize(entry->body_json());
            if (!canonical)
                return fail(i, canonical.error().what());

            auto recomputed = compute_hmac(key_, entry->prev_hash, *canonical);
            if (!crypto::constant_time_equals(recomputed, entry->entry_hmac))
                return fail(i, "entry_hmac mismatch");

            expected_prev = entry->entry_hmac;
        }

        return report;
    }

    Result<std::vector<AuditEntry>> AuditLog::entries() const
    {
        std::lock_guard guard(mutex_);
        auto lines = read_lines();
        if (!lines)
            return std::unexpected(lines.error());

        std::vector<AuditEntry> out;
        out.reserve(lines->size());
        for (const auto &line : *lines)
        {
            try
            {
                auto entry = AuditEntry::from_json(nlohmann::json::parse(line));
                if (!entry)
                    return std::unexpected(entry.error());
                out.push_back(std::move(*entry));
            }
            catch (const nlohmann::json::exception &e)
            {
                return std::unexpected(WardError::parsing(std::format("Invalid audit line: {}", e.what())));
            }
        }
        return out;
    }

} // namespace ward
