#include "ward/issuance_ledger.hpp"
#include "ward/file_io.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace ward
{

    IssuanceLedger::IssuanceLedger(std::filesystem::path path) : path_(std::move(path)) {}

    Result<void> IssuanceLedger::load()
    {
        if (path_.empty())
            return {};

        auto content = read_file(path_);
        if (!content)
        {
            if (content.error().code == ErrorCode::NotFound)
                return {};
            return std::unexpected(content.error());
        }

        std::lock_guard lock(mutex_);
        std::istringstream in(*content);
        std::string line;
        size_t line_no = 0;
        while (std::getline(in, line))
        {
            ++line_no;
            if (line.empty())
                continue;
            try
            {
                auto j = nlohmann::json::parse(line);
                serials_.insert(j.at("serial").get<std::string>());
            }
            catch (const nlohmann::json::exception &e)
            {
                return std::unexpected(WardError::storage(std::format(
                    "Corrupt issuance ledger {} line {}: {}", path_.string(), line_no, e.what())));
            }
        }
        spdlog::debug("Loaded {} issued serials from {}", serials_.size(), path_.string());
        return {};
    }

    bool IssuanceLedger::contains(const std::string &serial) const
    {
        std::lock_guard lock(mutex_);
        return serials_.contains(serial);
    }

    bool IssuanceLedger::try_reserve(const std::string &serial)
    {
        std::lock_guard lock(mutex_);
        return serials_.insert(serial).second;
    }

    void IssuanceLedger::release(const std::string &serial)
    {
        std::lock_guard lock(mutex_);
        serials_.erase(serial);
    }

    Result<void> IssuanceLedger::commit(const LicenseRecord &record)
    {
        if (path_.empty())
            return {};

        std::lock_guard lock(mutex_);
        auto file_lock = FileLock::acquire(path_);
        if (!file_lock)
            return std::unexpected(file_lock.error());

        auto j = record.to_json();
        j["recorded_at"] = unix_now();
        return append_line(path_, j.dump());
    }

    size_t IssuanceLedger::size() const
    {
        std::lock_guard lock(mutex_);
        return serials_.size();
    }

} // namespace ward
