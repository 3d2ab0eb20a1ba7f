/**
 * @file journal_writers.hpp
 * @brief Datagram transports used by the delivery worker
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cerrno>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "journal_types.hpp"
#include "journal_error.hpp"

namespace sjournal
{

/**
 * @brief Sends one encoded record per call
 *
 * Only the delivery worker thread calls write() once the writer has been
 * handed to a dispatcher.
 */
class datagram_writer
{
  public:
    virtual ~datagram_writer() = default;

    /**
     * @brief Send a complete record
     * @return true if the record was handed to the transport
     */
    virtual bool write(const char *data, size_t len) = 0;
};

/**
 * @brief Connected AF_UNIX datagram socket, the journal's native transport
 *
 * Records too large for a single datagram are written to a sealed memfd
 * whose descriptor is passed to the daemon with SCM_RIGHTS, which is how the
 * journal accepts oversized entries.
 */
class unix_datagram_writer final : public datagram_writer
{
  public:
    explicit unix_datagram_writer(std::string path = DEFAULT_SOCKET_PATH) : path_(std::move(path))
    {
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        if (path_.empty() || path_.size() >= sizeof(addr.sun_path)) { throw connection_error(ENAMETOOLONG, path_); }
        std::memcpy(addr.sun_path, path_.c_str(), path_.size() + 1);

        fd_ = ::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) { throw connection_error(errno, path_); }

        if (::connect(fd_, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) < 0)
        {
            int err = errno;
            ::close(fd_);
            fd_ = -1;
            throw connection_error(err, path_);
        }

        // Larger records fit in a datagram before falling back to memfd; ignore failure
        int sndbuf = SOCKET_SEND_BUFFER_SIZE;
        (void)::setsockopt(fd_, SOL_SOCKET, SO_SNDBUF, &sndbuf, sizeof(sndbuf));
    }

    unix_datagram_writer(const unix_datagram_writer &)            = delete;
    unix_datagram_writer &operator=(const unix_datagram_writer &) = delete;

    ~unix_datagram_writer() override
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool write(const char *data, size_t len) override
    {
        if (fd_ < 0) return false;

        for (;;)
        {
            ssize_t sent = ::send(fd_, data, len, MSG_NOSIGNAL);
            if (sent >= 0) return static_cast<size_t>(sent) == len;

            if (errno == EINTR) continue;
            if (errno == EMSGSIZE || errno == ENOBUFS) return write_via_memfd(data, len);
            return false;
        }
    }

    int fd() const noexcept { return fd_; }
    const std::string &path() const noexcept { return path_; }

  private:
    bool write_via_memfd(const char *data, size_t len)
    {
        int mfd = ::memfd_create("sjournal-record", MFD_CLOEXEC | MFD_ALLOW_SEALING);
        if (mfd < 0) return false;

        size_t total_written = 0;
        while (total_written < len)
        {
            ssize_t written = ::write(mfd, data + total_written, len - total_written);
            if (written < 0)
            {
                if (errno == EINTR) continue;
                ::close(mfd);
                return false;
            }
            total_written += static_cast<size_t>(written);
        }

        // The daemon refuses unsealed descriptors
        if (::fcntl(mfd, F_ADD_SEALS, F_SEAL_SHRINK | F_SEAL_GROW | F_SEAL_WRITE | F_SEAL_SEAL) < 0)
        {
            ::close(mfd);
            return false;
        }

        union
        {
            cmsghdr align;
            char buf[CMSG_SPACE(sizeof(int))];
        } control{};

        msghdr msg{};
        msg.msg_control    = control.buf;
        msg.msg_controllen = sizeof(control.buf);

        cmsghdr *cmsg   = CMSG_FIRSTHDR(&msg);
        cmsg->cmsg_level = SOL_SOCKET;
        cmsg->cmsg_type  = SCM_RIGHTS;
        cmsg->cmsg_len   = CMSG_LEN(sizeof(int));
        std::memcpy(CMSG_DATA(cmsg), &mfd, sizeof(int));

        ssize_t sent;
        do {
            sent = ::sendmsg(fd_, &msg, MSG_NOSIGNAL);
        } while (sent < 0 && errno == EINTR);

        ::close(mfd);
        return sent >= 0;
    }

    std::string path_;
    int fd_{-1};
};

/**
 * @brief Accepts and forgets every record
 */
class discard_writer final : public datagram_writer
{
  public:
    bool write(const char *, size_t) override { return true; }
};

/**
 * @brief Hands every record to a user function
 *
 * The function runs on the delivery worker thread and reports success through
 * its return value.
 */
class callback_writer final : public datagram_writer
{
  public:
    using callback_type = std::function<bool(std::string_view)>;

    explicit callback_writer(callback_type callback) : callback_(std::move(callback)) {}

    bool write(const char *data, size_t len) override
    {
        if (!callback_) return false;
        return callback_(std::string_view(data, len));
    }

  private:
    callback_type callback_;
};

} // namespace sjournal
