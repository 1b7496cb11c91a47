/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_WIRE_MESSAGE_HPP_INCLUDED
#define LIBNLWIRE_WIRE_MESSAGE_HPP_INCLUDED

#include "attribute.hpp"
#include "defines.hpp"
#include "header_codec.hpp"
#include "libnlwire/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <utility>

namespace libnlwire
{
namespace wire
{

/// @brief Defines a netlink message.
///
/// Outbound messages are constructed by the application, inbound ones by the message decoder
/// (and are not supposed to be modified afterwards).
///
struct Message final
{
    using Payload = cetl::variant<Bytes, AttributeList>;

    Header header;

    /// Present only for family messages (see `IMessageSchema::hasGenericHeader`).
    cetl::optional<GenericHeader> generic;

    Payload payload;

    const Bytes* bytes() const noexcept
    {
        return cetl::get_if<Bytes>(&payload);
    }

    const AttributeList* attributes() const noexcept
    {
        return cetl::get_if<AttributeList>(&payload);
    }

};  // Message

using MessageList = PmrVector<Message>;

/// @brief Compares two messages by their logical value.
///
/// The header `length` is not compared - it is derived from the rest of the message by the encoder.
///
inline bool operator==(const Message& lhs, const Message& rhs)
{
    return (lhs.header.type == rhs.header.type) && (lhs.header.flags == rhs.header.flags) &&
           (lhs.header.sequence == rhs.header.sequence) && (lhs.header.port_id == rhs.header.port_id) &&
           (lhs.generic == rhs.generic) && (lhs.payload == rhs.payload);
}
inline bool operator!=(const Message& lhs, const Message& rhs)
{
    return !(lhs == rhs);
}

/// @brief Makes a generic netlink message with an attribute list payload.
///
inline Message makeGenericMessage(const Header& header, const GenericHeader& generic, AttributeList attributes)
{
    return Message{header, generic, std::move(attributes)};
}

/// @brief Makes a message with an opaque payload (and without the generic sub-header).
///
inline Message makeRawMessage(cetl::pmr::memory_resource& memory, const Header& header, const ConstBytesSpan payload)
{
    return Message{header, cetl::nullopt, Bytes(payload.begin(), payload.end(), Bytes::allocator_type{&memory})};
}

}  // namespace wire
}  // namespace libnlwire

#endif  // LIBNLWIRE_WIRE_MESSAGE_HPP_INCLUDED
