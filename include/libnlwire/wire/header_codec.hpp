/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_WIRE_HEADER_CODEC_HPP_INCLUDED
#define LIBNLWIRE_WIRE_HEADER_CODEC_HPP_INCLUDED

#include "byte_cursor.hpp"
#include "defines.hpp"
#include "errors.hpp"
#include "libnlwire/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>

namespace libnlwire
{
namespace wire
{

/// @brief Defines the fixed (16 bytes) header of a netlink message.
///
struct Header final
{
    /// Total length of the message (including this header).
    ///
    /// It is a derived property - the encoder always computes it from the actual encoded size,
    /// so there is no need to fill it for outbound messages.
    ///
    std::uint32_t  length{0};
    MessageType    type{0};
    std::uint16_t  flags{0};
    SequenceNumber sequence{0};
    PortId         port_id{0};

    bool hasFlags(const std::uint16_t mask) const noexcept
    {
        return (flags & mask) == mask;
    }

    bool isControl() const noexcept
    {
        return ControlType::isControl(type);
    }

};  // Header

inline bool operator==(const Header& lhs, const Header& rhs) noexcept
{
    return (lhs.length == rhs.length) && (lhs.type == rhs.type) && (lhs.flags == rhs.flags) &&
           (lhs.sequence == rhs.sequence) && (lhs.port_id == rhs.port_id);
}
inline bool operator!=(const Header& lhs, const Header& rhs) noexcept
{
    return !(lhs == rhs);
}

/// @brief Defines the generic netlink sub-header, which follows the fixed header of a family message.
///
struct GenericHeader final
{
    std::uint8_t  command{0};
    std::uint8_t  version{0};
    std::uint16_t reserved{0};

};  // GenericHeader

inline bool operator==(const GenericHeader& lhs, const GenericHeader& rhs) noexcept
{
    return (lhs.command == rhs.command) && (lhs.version == rhs.version) && (lhs.reserved == rhs.reserved);
}
inline bool operator!=(const GenericHeader& lhs, const GenericHeader& rhs) noexcept
{
    return !(lhs == rhs);
}

/// @brief Decodes the fixed message header at the current position of the cursor.
///
/// @return Decoded header, or `TruncatedError` if fewer than 16 bytes are left,
///         or `MalformedError` if the declared length is less than the header itself.
///         The declared length is NOT validated against the rest of the buffer here -
///         it is the responsibility of the message decoder.
///
inline Expected<Header, DecodeFailure> decodeHeader(ReadCursor& cursor)
{
    const std::size_t offset = cursor.position();
    if (cursor.remaining() < WireSize::Header)
    {
        return TruncatedError{offset, WireSize::Header, cursor.remaining()};
    }

    // Enough bytes are verified above, so none of the below reads could fail.
    Header header{};
    header.length   = cetl::get<std::uint32_t>(cursor.readU32());
    header.type     = cetl::get<std::uint16_t>(cursor.readU16());
    header.flags    = cetl::get<std::uint16_t>(cursor.readU16());
    header.sequence = cetl::get<std::uint32_t>(cursor.readU32());
    header.port_id  = cetl::get<std::uint32_t>(cursor.readU32());

    if (header.length < WireSize::Header)
    {
        return MalformedError{offset, MalformedError::Reason::HeaderLengthTooSmall};
    }
    return header;
}

/// @brief Encodes the fixed message header.
///
/// The `length` field of the header is ignored - a zero placeholder is written instead,
/// which has to be patched (see `patchLength`) once the whole message body is serialized.
///
/// @return Offset of the header within the buffer (to be passed later to `patchLength`), or a failure.
///
inline Expected<std::size_t, EncodeFailure> encodeHeader(const Header& header, WriteCursor& cursor)
{
    if (cursor.remaining() < WireSize::Header)
    {
        return BufferFullError{cursor.capacity(), WireSize::Header};
    }

    const std::size_t offset = cetl::get<std::size_t>(cursor.reserve(sizeof(header.length)));

    // Enough room is verified above.
    (void) cursor.writeU16(header.type);
    (void) cursor.writeU16(header.flags);
    (void) cursor.writeU32(header.sequence);
    (void) cursor.writeU32(header.port_id);

    return offset;
}

/// @brief Back-patches the length field of a header which was encoded at the given offset.
///
/// The length is everything written since the `header_offset` (including the header itself).
///
inline cetl::optional<EncodeFailure> patchLength(WriteCursor& cursor, const std::size_t header_offset)
{
    CETL_DEBUG_ASSERT(header_offset + WireSize::Header <= cursor.position(), "Header must be encoded first.");

    const std::size_t length = cursor.position() - header_offset;
    if (length > std::numeric_limits<std::uint32_t>::max())
    {
        return ArgumentError{};
    }
    cursor.patchU32(header_offset, static_cast<std::uint32_t>(length));
    return cetl::nullopt;
}

inline Expected<GenericHeader, DecodeFailure> decodeGenericHeader(ReadCursor& cursor)
{
    if (cursor.remaining() < WireSize::GenericHeader)
    {
        return TruncatedError{cursor.position(), WireSize::GenericHeader, cursor.remaining()};
    }

    GenericHeader generic{};
    generic.command  = cetl::get<std::uint8_t>(cursor.readU8());
    generic.version  = cetl::get<std::uint8_t>(cursor.readU8());
    generic.reserved = cetl::get<std::uint16_t>(cursor.readU16());
    return generic;
}

inline cetl::optional<EncodeFailure> encodeGenericHeader(const GenericHeader& generic, WriteCursor& cursor)
{
    if (cursor.remaining() < WireSize::GenericHeader)
    {
        return BufferFullError{cursor.capacity(), WireSize::GenericHeader};
    }

    (void) cursor.writeU8(generic.command);
    (void) cursor.writeU8(generic.version);
    (void) cursor.writeU16(generic.reserved);
    return cetl::nullopt;
}

}  // namespace wire
}  // namespace libnlwire

#endif  // LIBNLWIRE_WIRE_HEADER_CODEC_HPP_INCLUDED
