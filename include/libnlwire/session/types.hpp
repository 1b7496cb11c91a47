/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_SESSION_TYPES_HPP_INCLUDED
#define LIBNLWIRE_SESSION_TYPES_HPP_INCLUDED

#include "libnlwire/types.hpp"
#include "libnlwire/wire/defines.hpp"
#include "libnlwire/wire/message.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <tuple>

namespace libnlwire
{
namespace session
{

/// @brief Defines the key which pairs a request with its response(s).
///
struct ExchangeKey final
{
    wire::SequenceNumber sequence;
    wire::PortId         port_id;

};  // ExchangeKey

inline bool operator==(const ExchangeKey& lhs, const ExchangeKey& rhs) noexcept
{
    return (lhs.sequence == rhs.sequence) && (lhs.port_id == rhs.port_id);
}
inline bool operator<(const ExchangeKey& lhs, const ExchangeKey& rhs) noexcept
{
    return std::tie(lhs.sequence, lhs.port_id) < std::tie(rhs.sequence, rhs.port_id);
}

/// @brief Defines successful result of an exchange which was completed by a single message.
///
struct Single final
{
    wire::Message message;
};

/// @brief Defines successful result of a multipart exchange (terminated by DONE).
///
/// The DONE message itself is not included.
///
struct Multi final
{
    wire::MessageList messages;
};

using ExchangeResult = cetl::variant<Single, Multi>;

/// @brief Defines an event of an inbound message which does not match any pending request.
///
/// Kernel originated notifications (f.e. multicast group messages) are delivered this way,
/// as well as late responses to cancelled (or expired) requests.
///
struct Unsolicited final
{
    wire::Message message;
};

}  // namespace session
}  // namespace libnlwire

#endif  // LIBNLWIRE_SESSION_TYPES_HPP_INCLUDED
