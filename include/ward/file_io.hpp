#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>

namespace ward
{

    /**
     * Exclusive advisory lock (flock) on a sibling "<path>.lock" file. Serializes
     * read-modify-write cycles between threads and between processes. Released
     * on destruction.
     */
    class FileLock
    {
    public:
        /** Block until the lock for target is held */
        static Result<FileLock> acquire(const std::filesystem::path &target);

        FileLock(FileLock &&other) noexcept;
        FileLock &operator=(FileLock &&other) noexcept;
        FileLock(const FileLock &) = delete;
        FileLock &operator=(const FileLock &) = delete;
        ~FileLock();

        const std::filesystem::path &lock_path() const { return lock_path_; }

    private:
        FileLock(int fd, std::filesystem::path lock_path) : fd_(fd), lock_path_(std::move(lock_path)) {}

        void release() noexcept;

        int fd_{-1};
        std::filesystem::path lock_path_;
    };

    /**
     * Replace path with content atomically: write a temp file in the same
     * directory, fsync, then rename over the target. Creates parent
     * directories. When owner_only is set the file ends up mode 0600.
     */
    Result<void> atomic_write_file(const std::filesystem::path &path,
                                   const std::string &content,
                                   bool owner_only = true);

    /** Append one line (a trailing newline is added) and fsync */
    Result<void> append_line(const std::filesystem::path &path, const std::string &line);

    /** Read a whole file. NotFound if it does not exist. */
    Result<std::string> read_file(const std::filesystem::path &path);

} // namespace ward
