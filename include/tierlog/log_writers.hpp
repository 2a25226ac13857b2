/**
 * @file log_writers.hpp
 * @brief Log output writer implementations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdio>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <unistd.h> // For write() and STDERR_FILENO
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/uio.h> // For writev
#include <errno.h>

#include "log_types.hpp"
#include "log_error.hpp"

namespace tierlog
{

/**
 * @brief How a file sink opens its file
 */
struct file_options
{
    bool async       = false;             ///< Deliver from the task pool instead of the caller's thread
    bool truncate    = false;             ///< Truncate the file on open instead of appending
    unsigned perm    = DEFAULT_FILE_PERM; ///< Permission bits when the file is created
};

namespace detail
{

/**
 * @brief Write @p line followed by a newline with as few syscalls as possible
 *
 * Uses writev so a line and its terminator normally go out in one call;
 * short writes and EINTR are retried.
 */
inline log_error write_line_fd(int fd, std::string_view line)
{
    if (fd < 0) return log_error(std::make_error_code(std::errc::bad_file_descriptor), "write to closed log file");

    static const char newline = '\n';
    struct iovec iov[2];
    iov[0].iov_base = const_cast<char *>(line.data());
    iov[0].iov_len  = line.size();
    iov[1].iov_base = const_cast<char *>(&newline);
    iov[1].iov_len  = 1;

    int first = 0;
    while (first < 2)
    {
        ssize_t written = ::writev(fd, iov + first, 2 - first);
        if (written < 0)
        {
            if (errno == EINTR) { continue; }
            return log_error::from_errno(errno, "write to log file failed");
        }

        auto left = static_cast<size_t>(written);
        while (first < 2 && left >= iov[first].iov_len)
        {
            left -= iov[first].iov_len;
            ++first;
        }
        if (first < 2)
        {
            iov[first].iov_base = static_cast<char *>(iov[first].iov_base) + left;
            iov[first].iov_len -= left;
        }
    }
    return {};
}

} // namespace detail

/**
 * @brief Writer that owns a file opened according to file_options
 *
 * The file is opened in the constructor; failure throws std::system_error
 * carrying errno so callers building sinks see the construction error.
 */
class file_writer
{
  public:
    file_writer(const std::string &filename, const file_options &options) : filename_(filename)
    {
        int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (options.truncate ? O_TRUNC : O_APPEND);
        fd_       = ::open(filename.c_str(), flags, static_cast<mode_t>(options.perm));
        if (fd_ < 0) { throw std::system_error(errno, std::generic_category(), "Failed to open log file: " + filename); }
    }

    file_writer(const file_writer &)            = delete;
    file_writer &operator=(const file_writer &) = delete;

    file_writer(file_writer &&other) noexcept : filename_(std::move(other.filename_)), fd_(std::exchange(other.fd_, -1)) {}

    file_writer &operator=(file_writer &&other) noexcept
    {
        if (this != &other)
        {
            if (fd_ >= 0) ::close(fd_);
            filename_ = std::move(other.filename_);
            fd_       = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    ~file_writer()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    log_error write_line(std::string_view line) const { return detail::write_line_fd(fd_, line); }

    log_error close()
    {
        if (fd_ < 0) return {};
        int fd = std::exchange(fd_, -1);
        if (::close(fd) != 0) { return log_error::from_errno(errno, "close " + filename_); }
        return {};
    }

    const std::string &filename() const noexcept { return filename_; }
    int fd() const noexcept { return fd_; }

  private:
    std::string filename_; ///< File name for logging
    int fd_{-1};           ///< Owned file descriptor
};

/**
 * @brief Writer on a descriptor owned by someone else (stdout, stderr, a pipe)
 */
class fd_writer
{
  public:
    explicit fd_writer(int fd) : fd_(fd) {}

    log_error write_line(std::string_view line) const { return detail::write_line_fd(fd_, line); }

    // The descriptor is not ours to close
    log_error close() { return {}; }

    int fd() const noexcept { return fd_; }

  private:
    int fd_;
};

class discard_writer
{
  public:
    log_error write_line(std::string_view) const { return {}; }
    log_error close() { return {}; }
};

} // namespace tierlog
