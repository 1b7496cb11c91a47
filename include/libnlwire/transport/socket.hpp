/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_TRANSPORT_SOCKET_HPP_INCLUDED
#define LIBNLWIRE_TRANSPORT_SOCKET_HPP_INCLUDED

#include "libnlwire/errors.hpp"
#include "libnlwire/types.hpp"
#include "libnlwire/wire/defines.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

namespace libnlwire
{
namespace transport
{

/// @brief Defines interface to a custom netlink socket implementation.
///
/// Implementation is supposed to be provided by an user of the library
/// (see `docs/examples/platform/linux` for an `AF_NETLINK` based one).
/// Netlink is a datagram protocol - message boundaries are preserved per read,
/// so the library never expects a message to be split between two reads.
///
class ISocket
{
public:
    ISocket(const ISocket&)                = delete;
    ISocket(ISocket&&) noexcept            = delete;
    ISocket& operator=(const ISocket&)     = delete;
    ISocket& operator=(ISocket&&) noexcept = delete;

    /// @brief Gets port id of the local endpoint of the socket (as assigned by the kernel on bind).
    ///
    virtual wire::PortId getLocalPortId() const noexcept = 0;

    /// @brief Sends a single datagram, which contains one or more complete (encoded) messages.
    ///
    /// @return `nullopt` on success, otherwise the platform error.
    ///
    CETL_NODISCARD virtual cetl::optional<IoError> send(const ConstBytesSpan bytes) = 0;

    /// @brief Receives the next datagram.
    ///
    /// The call may block, but not beyond the given `deadline`.
    ///
    /// @return Bytes of one or more complete messages if a datagram has been received,
    ///         or an empty optional if nothing has arrived before the deadline.
    ///         In case of failure, the platform error is returned.
    ///@{
    struct ReceiveResult
    {
        using Success = cetl::optional<Bytes>;
        using Failure = IoError;

        using Type = Expected<Success, Failure>;
    };
    CETL_NODISCARD virtual ReceiveResult::Type receive(const TimePoint deadline) = 0;
    ///@}

protected:
    ISocket()  = default;
    ~ISocket() = default;

};  // ISocket

}  // namespace transport
}  // namespace libnlwire

#endif  // LIBNLWIRE_TRANSPORT_SOCKET_HPP_INCLUDED
