/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT
///

#ifndef EXAMPLE_PLATFORM_LINUX_NETLINK_SOCKET_HPP_INCLUDED
#define EXAMPLE_PLATFORM_LINUX_NETLINK_SOCKET_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libnlwire/config.hpp>
#include <libnlwire/errors.hpp>
#include <libnlwire/time_provider.hpp>
#include <libnlwire/transport/socket.hpp>
#include <libnlwire/types.hpp>
#include <libnlwire/wire/defines.hpp>

#include <linux/netlink.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <utility>

namespace example
{
namespace platform
{
namespace Linux
{

/// Blocking `AF_NETLINK` socket, with the receive deadline implemented by `poll`.
///
class NetlinkSocket final : public libnlwire::transport::ISocket
{
public:
    using MakeResult = libnlwire::Expected<std::unique_ptr<NetlinkSocket>, libnlwire::IoError>;

    /// Opens a netlink socket of the given protocol, and binds it to a kernel assigned port id.
    ///
    CETL_NODISCARD static MakeResult make(cetl::pmr::memory_resource&     memory,
                                          const libnlwire::ITimeProvider& time_provider,
                                          const int                       protocol = NETLINK_GENERIC)
    {
        const int fd = ::socket(AF_NETLINK, SOCK_RAW | SOCK_CLOEXEC, protocol);
        if (fd < 0)
        {
            return libnlwire::IoError{errno};
        }

        ::sockaddr_nl local{};
        local.nl_family = AF_NETLINK;
        if (::bind(fd, reinterpret_cast<::sockaddr*>(&local), sizeof(local)) < 0)  // NOLINT
        {
            return closeWithError(fd);
        }
        ::socklen_t local_size = sizeof(local);
        if (::getsockname(fd, reinterpret_cast<::sockaddr*>(&local), &local_size) < 0)  // NOLINT
        {
            return closeWithError(fd);
        }

        // Extended acks are not supported by older kernels - errors are reported without the message then.
        const int enable = 1;
        if (::setsockopt(fd, SOL_NETLINK, NETLINK_EXT_ACK, &enable, sizeof(enable)) < 0)
        {
            CETL_DEBUG_ASSERT(errno == ENOPROTOOPT, "");
        }

        return std::make_unique<NetlinkSocket>(fd, local.nl_pid, memory, time_provider);
    }

    NetlinkSocket(const int                       fd,
                  const libnlwire::wire::PortId   port_id,
                  cetl::pmr::memory_resource&     memory,
                  const libnlwire::ITimeProvider& time_provider)
        : fd_{fd}
        , port_id_{port_id}
        , memory_{memory}
        , time_provider_{time_provider}
    {
        CETL_DEBUG_ASSERT(fd_ >= 0, "");
    }

    ~NetlinkSocket()
    {
        (void) ::close(fd_);
    }

    NetlinkSocket(const NetlinkSocket&)                = delete;
    NetlinkSocket(NetlinkSocket&&) noexcept            = delete;
    NetlinkSocket& operator=(const NetlinkSocket&)     = delete;
    NetlinkSocket& operator=(NetlinkSocket&&) noexcept = delete;

    /// Joins a multicast group (f.e. one resolved by `genl::Controller::resolveMulticastGroup`).
    ///
    CETL_NODISCARD cetl::optional<libnlwire::IoError> addMembership(const std::uint32_t group)
    {
        if (::setsockopt(fd_, SOL_NETLINK, NETLINK_ADD_MEMBERSHIP, &group, sizeof(group)) < 0)
        {
            return libnlwire::IoError{errno};
        }
        return cetl::nullopt;
    }

    // MARK: ISocket

    libnlwire::wire::PortId getLocalPortId() const noexcept override
    {
        return port_id_;
    }

    CETL_NODISCARD cetl::optional<libnlwire::IoError> send(const libnlwire::ConstBytesSpan bytes) override
    {
        ::sockaddr_nl kernel{};
        kernel.nl_family = AF_NETLINK;

        while (true)
        {
            const ::ssize_t result = ::sendto(fd_,
                                              bytes.data(),
                                              bytes.size(),
                                              0,
                                              reinterpret_cast<const ::sockaddr*>(&kernel),  // NOLINT
                                              sizeof(kernel));
            if (result >= 0)
            {
                return cetl::nullopt;
            }
            if (errno != EINTR)
            {
                return libnlwire::IoError{errno};
            }
        }
    }

    CETL_NODISCARD ReceiveResult::Type receive(const libnlwire::TimePoint deadline) override
    {
        while (true)
        {
            ::pollfd poll_fd{fd_, POLLIN, 0};
            const int poll_result = ::poll(&poll_fd, 1, timeoutUntil(deadline));
            if (poll_result < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return libnlwire::IoError{errno};
            }
            if (poll_result == 0)
            {
                return ReceiveResult::Success{};
            }

            libnlwire::Bytes buffer(libnlwire::config::Transport::ReceiveBufferSize(),
                                    cetl::byte{0},
                                    libnlwire::Bytes::allocator_type{&memory_});

            // With `MSG_TRUNC` the real size of the datagram is returned, even if it didn't fit the buffer.
            const ::ssize_t result = ::recv(fd_, buffer.data(), buffer.size(), MSG_TRUNC);
            if (result < 0)
            {
                if ((errno == EINTR) || (errno == EAGAIN))
                {
                    continue;
                }
                // Note that `ENOBUFS` means that the kernel has dropped messages b/c of the socket buffer overrun.
                return libnlwire::IoError{errno};
            }
            if (static_cast<std::size_t>(result) > buffer.size())
            {
                return libnlwire::IoError{EMSGSIZE};
            }

            buffer.resize(static_cast<std::size_t>(result));
            return ReceiveResult::Success{std::move(buffer)};
        }
    }

private:
    static libnlwire::IoError closeWithError(const int fd)
    {
        const int error = errno;
        (void) ::close(fd);
        return libnlwire::IoError{error};
    }

    /// Converts the deadline to a `poll` timeout (in milliseconds, rounded up).
    ///
    int timeoutUntil(const libnlwire::TimePoint deadline) const
    {
        const auto now = time_provider_.now();
        if (deadline <= now)
        {
            return 0;
        }
        const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now).count();
        const auto millis = (micros + 999) / 1000;
        return (millis > std::numeric_limits<int>::max()) ? std::numeric_limits<int>::max()
                                                          : static_cast<int>(millis);
    }

    // MARK: Data members:

    const int                       fd_;
    const libnlwire::wire::PortId   port_id_;
    cetl::pmr::memory_resource&     memory_;
    const libnlwire::ITimeProvider& time_provider_;

};  // NetlinkSocket

}  // namespace Linux
}  // namespace platform
}  // namespace example

#endif  // EXAMPLE_PLATFORM_LINUX_NETLINK_SOCKET_HPP_INCLUDED
