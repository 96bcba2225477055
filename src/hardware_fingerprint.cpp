#include "ward/hardware_fingerprint.hpp"
#include "ward/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace ward
{
    namespace
    {
        std::string trim(const std::string &s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return {};
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string read_first_line(const std::filesystem::path &path)
        {
            std::ifstream ifs(path);
            if (!ifs.is_open())
                return {};
            std::string line;
            std::getline(ifs, line);
            return trim(line);
        }

        /** Relative form of an absolute system path, so it can be joined to a root */
        std::filesystem::path rel(const char *absolute)
        {
            return std::filesystem::path(absolute).relative_path();
        }
    } // namespace

    HardwareFingerprinter::HardwareFingerprinter(std::filesystem::path root) : root_(std::move(root)) {}

    HardwareFacts HardwareFingerprinter::collect() const
    {
        HardwareFacts facts;
        facts.platform_uuid = read_platform_uuid();
        facts.macs = read_macs();
        facts.cpu_model = read_cpu_model();
        return facts;
    }

    Result<std::string> HardwareFingerprinter::fingerprint() const
    {
        auto facts = collect();
        if (facts.platform_uuid.empty() && facts.macs.empty() && facts.cpu_model.empty())
        {
            return std::unexpected(WardError::not_found(std::format(
                "No hardware identifiers readable under {}", root_.string())));
        }
        return fingerprint_of(facts);
    }

    std::string HardwareFingerprinter::fingerprint_of(const HardwareFacts &facts)
    {
        std::vector<std::string> macs = facts.macs;
        std::sort(macs.begin(), macs.end());
        macs.erase(std::unique(macs.begin(), macs.end()), macs.end());

        std::string joined;
        for (size_t i = 0; i < macs.size(); ++i)
        {
            if (i > 0)
                joined += ',';
            joined += macs[i];
        }

        std::string cpu_hash = facts.cpu_model.empty() ? std::string() : crypto::SHA256::hex_digest(facts.cpu_model);
        std::string material = std::format("uuid={};macs={};cpu={}", lower(facts.platform_uuid), joined, cpu_hash);
        return crypto::SHA256::hex_digest(material);
    }

    std::string HardwareFingerprinter::read_platform_uuid() const
    {
        // product_uuid is root-only on most distributions; machine-id is the fallback.
        for (const char *source : {"/sys/class/dmi/id/product_uuid", "/etc/machine-id"})
        {
            auto value = read_first_line(root_ / rel(source));
            if (!value.empty())
                return lower(value);
        }
        return {};
    }

    std::vector<std::string> HardwareFingerprinter::read_macs() const
    {
        std::vector<std::string> macs;
        auto net_dir = root_ / rel("/sys/class/net");
        std::error_code ec;
        if (!std::filesystem::is_directory(net_dir, ec))
            return macs;

        for (const auto &entry : std::filesystem::directory_iterator(net_dir, ec))
        {
            auto name = entry.path().filename().string();
            if (name == "lo")
                continue;

            // Virtual interfaces (bridges, veth, tun) have no backing device.
            if (!std::filesystem::exists(entry.path() / "device", ec))
                continue;

            auto mac = lower(read_first_line(entry.path() / "address"));
            if (mac.empty() || mac == "00:00:00:00:00:00")
                continue;
            macs.push_back(mac);
        }

        std::sort(macs.begin(), macs.end());
        macs.erase(std::unique(macs.begin(), macs.end()), macs.end());
        return macs;
    }

    std::string HardwareFingerprinter::read_cpu_model() const
    {
        std::ifstream cpuinfo(root_ / rel("/proc/cpuinfo"));
        if (!cpuinfo.is_open())
            return {};

        std::string line;
        while (std::getline(cpuinfo, line))
        {
            if (line.rfind("model name", 0) == 0)
            {
                auto pos = line.find(':');
                if (pos != std::string::npos)
                    return trim(line.substr(pos + 1));
            }
        }
        spdlog::debug("No 'model name' in cpuinfo under {}", root_.string());
        return {};
    }

} // namespace ward
