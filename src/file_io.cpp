#include "ward/file_io.hpp"
#include "ward/crypto.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/file.h>
#include <unistd.h>

namespace ward
{
    namespace
    {
        std::string errno_message()
        {
            return std::strerror(errno);
        }

        Result<void> ensure_parent(const std::filesystem::path &path)
        {
            auto parent = path.parent_path();
            if (parent.empty())
                return {};
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                return std::unexpected(WardError::io(std::format(
                    "Failed to create directory {}: {}", parent.string(), ec.message())));
            }
            return {};
        }

        Result<void> write_all(int fd, const std::string &content, const std::filesystem::path &path)
        {
            size_t written = 0;
            while (written < content.size())
            {
                ssize_t n = ::write(fd, content.data() + written, content.size() - written);
                if (n < 0)
                {
                    if (errno == EINTR)
                        continue;
                    return std::unexpected(WardError::io(std::format(
                        "Write to {} failed: {}", path.string(), errno_message())));
                }
                written += static_cast<size_t>(n);
            }
            return {};
        }
    } // namespace

    // ============================================================================
    // FileLock Implementation
    // ============================================================================

    Result<FileLock> FileLock::acquire(const std::filesystem::path &target)
    {
        if (auto ok = ensure_parent(target); !ok)
            return std::unexpected(ok.error());

        std::filesystem::path lock_path = target;
        lock_path += ".lock";

        int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd < 0)
        {
            return std::unexpected(WardError::io(std::format(
                "Failed to open lock file {}: {}", lock_path.string(), errno_message())));
        }

        while (::flock(fd, LOCK_EX) != 0)
        {
            if (errno == EINTR)
                continue;
            auto msg = errno_message();
            ::close(fd);
            return std::unexpected(WardError::io(std::format(
                "Failed to lock {}: {}", lock_path.string(), msg)));
        }
        return FileLock(fd, std::move(lock_path));
    }

    FileLock::FileLock(FileLock &&other) noexcept
        : fd_(other.fd_), lock_path_(std::move(other.lock_path_))
    {
        other.fd_ = -1;
    }

    FileLock &FileLock::operator=(FileLock &&other) noexcept
    {
        if (this != &other)
        {
            release();
            fd_ = other.fd_;
            lock_path_ = std::move(other.lock_path_);
            other.fd_ = -1;
        }
        return *this;
    }

    FileLock::~FileLock()
    {
        release();
    }

    void FileLock::release() noexcept
    {
        if (fd_ >= 0)
        {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
            fd_ = -1;
        }
    }

    // ============================================================================
    // File helpers
    // ============================================================================

    Result<void> atomic_write_file(const std::filesystem::path &path,
                                   const std::string &content,
                                   bool owner_only)
    {
        if (auto ok = ensure_parent(path); !ok)
            return ok;

        auto suffix = crypto::SHA256::to_hex(crypto::SHA256::hash(crypto::SecureRandom::generate_bytes(16))).substr(0, 12);
        std::filesystem::path tmp = path;
        tmp += ".tmp." + suffix;

        int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, owner_only ? 0600 : 0644);
        if (fd < 0)
        {
            return std::unexpected(WardError::io(std::format(
                "Failed to create {}: {}", tmp.string(), errno_message())));
        }

        auto written = write_all(fd, content, tmp);
        if (written && ::fsync(fd) != 0)
        {
            written = std::unexpected(WardError::io(std::format(
                "fsync of {} failed: {}", tmp.string(), errno_message())));
        }
        ::close(fd);

        if (!written)
        {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return written;
        }

        // Atomic replace
        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return std::unexpected(WardError::io(std::format(
                "Failed to replace {}: {}", path.string(), ec.message())));
        }
        return {};
    }

    Result<void> append_line(const std::filesystem::path &path, const std::string &line)
    {
        if (auto ok = ensure_parent(path); !ok)
            return ok;

        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
        if (fd < 0)
        {
            return std::unexpected(WardError::io(std::format(
                "Failed to open {} for append: {}", path.string(), errno_message())));
        }

        auto written = write_all(fd, line + "\n", path);
        if (written && ::fsync(fd) != 0)
        {
            written = std::unexpected(WardError::io(std::format(
                "fsync of {} failed: {}", path.string(), errno_message())));
        }
        ::close(fd);
        return written;
    }

    Result<std::string> read_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            if (!std::filesystem::exists(path))
            {
                return std::unexpected(WardError::not_found(std::format("File not found: {}", path.string())));
            }
            return std::unexpected(WardError::io(std::format("Unable to open file: {}", path.string())));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

} // namespace ward
