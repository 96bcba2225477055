#include "ward/revocation_list.hpp"
#include "ward/file_io.hpp"
#include "ward/license_key.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ward
{
    namespace
    {
        Result<std::map<std::string, UnixSeconds>> read_list(const std::filesystem::path &path)
        {
            std::map<std::string, UnixSeconds> out;
            auto content = read_file(path);
            if (!content)
            {
                if (content.error().code == ErrorCode::NotFound)
                    return out;
                return std::unexpected(content.error());
            }

            try
            {
                auto j = nlohmann::json::parse(*content);
                for (const auto &[serial, ts] : j.items())
                    out[serial] = ts.get<UnixSeconds>();
            }
            catch (const nlohmann::json::exception &e)
            {
                return std::unexpected(WardError::storage(std::format(
                    "Corrupt revocation list {}: {}", path.string(), e.what())));
            }
            return out;
        }

    } // namespace

    std::optional<RevocationList::FileStamp> RevocationList::stamp_of(const std::filesystem::path &path)
    {
        std::error_code ec;
        FileStamp stamp;
        stamp.mtime = std::filesystem::last_write_time(path, ec);
        if (ec)
            return std::nullopt;
        stamp.size = std::filesystem::file_size(path, ec);
        if (ec)
            return std::nullopt;
        return stamp;
    }

    RevocationList::RevocationList(std::filesystem::path path, std::shared_ptr<AuditLog> audit)
        : path_(std::move(path)), audit_(std::move(audit))
    {
    }

    Result<void> RevocationList::load()
    {
        if (path_.empty())
            return {};

        std::lock_guard lock(mutex_);
        auto stamp = stamp_of(path_);
        auto list = read_list(path_);
        if (!list)
            return std::unexpected(list.error());

        revoked_ = std::move(*list);
        loaded_stamp_ = stamp;
        spdlog::debug("Loaded {} revoked serials from {}", revoked_.size(), path_.string());
        return {};
    }

    Result<void> RevocationList::revoke(const std::string &serial, const std::string &reason, UnixSeconds now)
    {
        if (!LicenseKeyCodec::is_valid_serial(serial))
        {
            return std::unexpected(WardError::invalid_input(std::format("'{}' is not a license serial", serial)));
        }
        try
        {
            nlohmann::json(reason).dump();
        }
        catch (const nlohmann::json::exception &)
        {
            return std::unexpected(WardError::invalid_input("Revocation reason is not valid UTF-8"));
        }

        std::lock_guard lock(mutex_);

        if (!path_.empty())
        {
            // Merge with what other processes wrote since load().
            auto file_lock = FileLock::acquire(path_);
            if (!file_lock)
                return std::unexpected(file_lock.error());

            auto on_disk = read_list(path_);
            if (!on_disk)
                return std::unexpected(on_disk.error());
            for (const auto &[s, ts] : *on_disk)
                revoked_.emplace(s, ts);

            if (revoked_.contains(serial))
                return {};

            nlohmann::json j = nlohmann::json::object();
            for (const auto &[s, ts] : revoked_)
                j[s] = ts;
            j[serial] = now;
            if (auto written = atomic_write_file(path_, j.dump(2), false); !written)
                return std::unexpected(written.error());
            loaded_stamp_ = stamp_of(path_);
        }
        else if (revoked_.contains(serial))
        {
            return {};
        }

        revoked_[serial] = now;

        if (audit_)
        {
            AuditEvent event;
            event.type = AuditEventType::Revoked;
            event.subject = serial;
            event.result = "ok";
            if (!reason.empty())
                event.details = {{"reason", reason}};
            event.timestamp = now;
            if (auto appended = audit_->append(event); !appended)
                return std::unexpected(appended.error());
        }

        spdlog::info("Revoked license serial {}", serial);
        return {};
    }

    void RevocationList::refresh_locked() const
    {
        if (path_.empty())
            return;

        auto stamp = stamp_of(path_);
        if (stamp == loaded_stamp_)
            return;

        auto list = read_list(path_);
        if (!list)
        {
            // Keep answering from the last good copy.
            spdlog::error("Failed to reload revocation list: {}", list.error().what());
            return;
        }
        revoked_ = std::move(*list);
        loaded_stamp_ = stamp;
        spdlog::debug("Reloaded {} revoked serials from {}", revoked_.size(), path_.string());
    }

    bool RevocationList::is_revoked(const std::string &serial) const
    {
        std::lock_guard lock(mutex_);
        refresh_locked();
        return revoked_.contains(serial);
    }

    std::optional<UnixSeconds> RevocationList::revoked_at(const std::string &serial) const
    {
        std::lock_guard lock(mutex_);
        refresh_locked();
        auto it = revoked_.find(serial);
        if (it == revoked_.end())
            return std::nullopt;
        return it->second;
    }

    size_t RevocationList::size() const
    {
        std::lock_guard lock(mutex_);
        refresh_locked();
        return revoked_.size();
    }

} // namespace ward
