/**
 * @file log_writers.hpp
 * @brief Byte sinks that handlers write rendered lines to
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdio>
#include <string>
#include <cstring>
#include <stdexcept>
#include <memory>
#include <ostream>
#include <unistd.h> // For write() and STDOUT_FILENO
#include <fcntl.h>
#include <errno.h>
#include <system_error>

namespace devlog
{

/**
 * @brief Destination for fully assembled lines
 *
 * write() returns the number of bytes written or -1 with errno set.
 * Callers serialize access; implementations need no locking of their own.
 */
class writer
{
  public:
    virtual ~writer() = default;

    virtual ssize_t write(const char *data, size_t len) = 0;

    /// Whether the destination is an interactive terminal
    virtual bool is_terminal() const { return false; }
};

/**
 * @brief Writes to a file descriptor, optionally owning it
 */
class fd_writer : public writer
{
  public:
    explicit fd_writer(const std::string &filename) : filename_(filename), close_fd_(true)
    {
        fd_ = open(filename.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd_ < 0) { throw std::runtime_error("Failed to open log file: " + filename); }
    }

    explicit fd_writer(int fd, bool close_fd = false) : fd_(fd), close_fd_(close_fd) {}

    fd_writer(const fd_writer &)            = delete;
    fd_writer &operator=(const fd_writer &) = delete;

    ~fd_writer() override
    {
        if (close_fd_ && fd_ >= 0)
        {
            close(fd_);
            fd_ = -1;
        }
    }

    ssize_t write(const char *data, size_t len) override
    {
        if (fd_ < 0)
        {
            errno = EBADF;
            return -1;
        }

        size_t total_written = 0;
        while (total_written < len)
        {
            ssize_t written = ::write(fd_, data + total_written, len - total_written);
            if (written < 0)
            {
                if (errno == EINTR) { continue; }
                return -1;
            }
            total_written += static_cast<size_t>(written);
        }
        return static_cast<ssize_t>(total_written);
    }

    bool is_terminal() const override { return fd_ >= 0 && isatty(fd_) != 0; }

    int fd() const noexcept { return fd_; }
    const std::string &filename() const noexcept { return filename_; }

  private:
    std::string filename_; ///< File name, empty for adopted descriptors
    int fd_{-1};           ///< Descriptor written to
    bool close_fd_{false}; ///< Whether to close fd on destruction
};

/**
 * @brief Writes to a std::ostream owned by the caller
 */
class ostream_writer : public writer
{
  public:
    explicit ostream_writer(std::ostream &os) : os_(os) {}

    ssize_t write(const char *data, size_t len) override
    {
        os_.write(data, static_cast<std::streamsize>(len));
        if (!os_)
        {
            errno = EIO;
            return -1;
        }
        return static_cast<ssize_t>(len);
    }

  private:
    std::ostream &os_;
};

/**
 * @brief Accepts and drops everything
 */
class discard_writer : public writer
{
  public:
    ssize_t write(const char *, size_t len) override { return static_cast<ssize_t>(len); }
};

/// Error for a failed writer::write(); a writer that left errno at 0 still reports EIO
inline std::error_code last_write_error()
{
    int code = errno;
    return std::error_code(code != 0 ? code : EIO, std::system_category());
}

inline std::shared_ptr<writer> make_stdout_writer() { return std::make_shared<fd_writer>(STDOUT_FILENO); }

inline std::shared_ptr<writer> make_stderr_writer() { return std::make_shared<fd_writer>(STDERR_FILENO); }

} // namespace devlog
