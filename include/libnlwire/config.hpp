/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_CONFIG_HPP_INCLUDED
#define LIBNLWIRE_CONFIG_HPP_INCLUDED

#include "types.hpp"

#include <cstddef>
#include <cstdint>

namespace libnlwire
{

// All below NOSONAR cpp:S799 "Rename this identifier to be shorter or equal to 31 characters."
// are intentional and are used to keep the names consistent with the rest of the codebase.
// F.e. `Session_OnUnsolicitedCallback_FunctionMaxSize` is consistent with `Session::OnUnsolicitedCallback::Function`.

/// Defines various configuration parameters of libnlwire.
///
/// All methods are `static constexpr` - they are evaluated at compile time.
/// A custom configuration could be supplied by defining `LIBNLWIRE_CONFIG` macro
/// to a type name which has the same structure as this `Config` type.
///
/// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
///
struct Config
{
    /// Defines various configuration parameters for the wire (codec) layer.
    ///
    struct Wire
    {
        /// Defines max depth of nested attribute lists accepted by the attribute decoder.
        ///
        /// The netlink format itself does not bound the depth, but every level costs recursion,
        /// so a hostile (or corrupted) message could otherwise exhaust the stack.
        ///
        static constexpr std::size_t MaxNestingDepth()
        {
            return 32;
        }

        /// Defines default capacity of an encoded message buffer.
        ///
        /// Kept equal to `Transport::ReceiveBufferSize`, so that anything we encode could be received back as is.
        ///
        static constexpr std::size_t DefaultEncodeCapacity()
        {
            return 32768;
        }

    };  // Wire

    /// Defines various configuration parameters for the session layer.
    ///
    struct Session
    {
        /// Defines the response timeout used when a request is sent without an explicit deadline.
        ///
        static constexpr Duration DefaultResponseTimeout()
        {
            return std::chrono::seconds{5};
        }

        /// Defines max footprint of a callback function in use by the unsolicited messages notification.
        ///
        static constexpr std::size_t OnUnsolicitedCallback_FunctionMaxSize()  // NOSONAR cpp:S799
        {
            /// Size is chosen arbitrary, but it should be enough to store any lambda or function pointer.
            return sizeof(void*) * 4;
        }

        /// Defines max number of unsolicited messages kept by a session without a subscriber.
        ///
        /// Once the queue is full the oldest message is evicted (and the eviction is logged).
        ///
        static constexpr std::size_t UnsolicitedQueueCapacity()
        {
            return 64;
        }

    };  // Session

    /// Defines various configuration parameters for the transport layer.
    ///
    struct Transport
    {
        /// Defines size of the buffer used for a single socket read.
        ///
        /// Netlink preserves datagram boundaries, so the buffer has to be big enough for the biggest datagram
        /// the kernel might send (f.e. a dump batch), otherwise the datagram is truncated by the kernel.
        ///
        static constexpr std::size_t ReceiveBufferSize()
        {
            return 32768;
        }

    };  // Transport

};  // Config

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

#ifdef LIBNLWIRE_CONFIG
using config = LIBNLWIRE_CONFIG;
#else
using config = Config;
#endif

}  // namespace libnlwire

#endif  // LIBNLWIRE_CONFIG_HPP_INCLUDED
