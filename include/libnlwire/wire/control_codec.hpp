/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_WIRE_CONTROL_CODEC_HPP_INCLUDED
#define LIBNLWIRE_WIRE_CONTROL_CODEC_HPP_INCLUDED

#include "attribute.hpp"
#include "attribute_codec.hpp"
#include "byte_cursor.hpp"
#include "defines.hpp"
#include "errors.hpp"
#include "header_codec.hpp"
#include "message.hpp"
#include "libnlwire/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace libnlwire
{
namespace wire
{

/// @brief Defines decoded payload of an ERROR (or a status carrying DONE) control message.
///
/// On the wire the ERROR payload is `struct nlmsgerr` - a signed 32-bit error code (negative `errno`,
/// or zero for an acknowledgement) followed by the header (and, unless `Flags::Capped`, the payload)
/// of the offending request, optionally followed by extended acknowledgment attributes (`Flags::AckTlvs`).
///
struct ControlPayload final
{
    /// Zero for success (acknowledgement), otherwise negative `errno` value.
    std::int32_t code{0};

    /// Header of the request which provoked this message (absent for DONE messages).
    cetl::optional<Header> request;

    /// Human readable error message (`ExtAckAttribute::Msg`), if reported by the kernel.
    cetl::optional<PmrString> message;

    /// Offset of the invalid attribute within the request (`ExtAckAttribute::Offs`), if reported by the kernel.
    cetl::optional<std::uint32_t> offset;

};  // ControlPayload

/// Internal implementation details.
/// Not supposed to be used directly by the users of the library.
///
namespace detail
{

/// Extended acknowledgement attributes are diagnostic only - a malformed tail never fails
/// the whole control message, instead the successfully decoded prefix is used.
///
inline void decodeExtendedAck(ReadCursor& cursor, ControlPayload& payload, cetl::pmr::memory_resource& memory)
{
    auto result = decodeAttributes(cursor, cursor.size(), RawAttributeSchema::instance(), memory);

    AttributeList attributes{AttributeList::allocator_type{&memory}};
    if (auto* const failure = cetl::get_if<AttributesDecodeFailure>(&result))
    {
        attributes = std::move(failure->prefix);
    }
    else
    {
        attributes = cetl::get<AttributeList>(std::move(result));
    }

    if (const auto* const msg_attr = findAttribute(attributes, ExtAckAttribute::Msg))
    {
        if (const auto str = getString(*msg_attr))
        {
            payload.message.emplace(str->data(), str->size(), PmrString::allocator_type{&memory});
        }
    }
    if (const auto* const offs_attr = findAttribute(attributes, ExtAckAttribute::Offs))
    {
        payload.offset = getU32(*offs_attr);
    }
}

inline Expected<ReadCursor, DecodeFailure> controlPayloadCursor(const Message& message)
{
    const auto* const bytes = message.bytes();
    if ((bytes == nullptr) || (bytes->size() < WireSize::ErrorCode))
    {
        return MalformedError{WireSize::Header, MalformedError::Reason::PayloadTooSmall};
    }
    return ReadCursor{libnlwire::detail::asSpan(*bytes)};
}

}  // namespace detail

/// @brief Decodes payload of an ERROR control message (aka `nlmsgerr`).
///
/// Offsets of failures are counted from the beginning of the message.
/// The status is kept even if the echoed request header is bogus (f.e. its length is less than 16) -
/// the `request` is absent then, and extended ack attributes are decoded only if the request is capped.
///
inline Expected<ControlPayload, DecodeFailure> decodeErrorPayload(const Message&              message,
                                                                  cetl::pmr::memory_resource& memory)
{
    CETL_DEBUG_ASSERT(message.header.type == ControlType::Error, "");

    auto cursor_result = detail::controlPayloadCursor(message);
    if (auto* const failure = cetl::get_if<DecodeFailure>(&cursor_result))
    {
        return std::move(*failure);
    }
    auto& cursor = cetl::get<ReadCursor>(cursor_result);

    ControlPayload payload{};
    payload.code = static_cast<std::int32_t>(cetl::get<std::uint32_t>(cursor.readU32()));

    if (cursor.remaining() < WireSize::Header)
    {
        return MalformedError{WireSize::Header + WireSize::ErrorCode, MalformedError::Reason::PayloadTooSmall};
    }
    const auto        request_result = decodeHeader(cursor);
    const auto* const request        = cetl::get_if<Header>(&request_result);
    if (request != nullptr)
    {
        payload.request = *request;
    }

    if (message.header.hasFlags(Flags::AckTlvs))
    {
        if (message.header.hasFlags(Flags::Capped))
        {
            detail::decodeExtendedAck(cursor, payload, memory);
        }
        else if (request != nullptr)
        {
            // The whole original request is echoed - extended ack attributes follow its (aligned) end.
            const std::size_t request_payload = WireSize::align(request->length) - WireSize::Header;
            if (cursor.remaining() > request_payload)
            {
                (void) cursor.skip(request_payload);
                detail::decodeExtendedAck(cursor, payload, memory);
            }
        }
    }

    return payload;
}

/// @brief Decodes payload of a DONE control message.
///
/// A successful dump is terminated by DONE with a non-negative (usually zero) status;
/// a negative one is a failure of the dump, which might be accompanied by extended ack attributes.
/// An empty payload is a zero status.
///
inline Expected<ControlPayload, DecodeFailure> decodeDonePayload(const Message&              message,
                                                                 cetl::pmr::memory_resource& memory)
{
    CETL_DEBUG_ASSERT(message.header.type == ControlType::Done, "");

    ControlPayload payload{};

    const auto* const bytes = message.bytes();
    if ((bytes == nullptr) || bytes->empty())
    {
        return payload;
    }

    auto cursor_result = detail::controlPayloadCursor(message);
    if (auto* const failure = cetl::get_if<DecodeFailure>(&cursor_result))
    {
        return std::move(*failure);
    }
    auto& cursor = cetl::get<ReadCursor>(cursor_result);

    payload.code = static_cast<std::int32_t>(cetl::get<std::uint32_t>(cursor.readU32()));
    if (message.header.hasFlags(Flags::AckTlvs))
    {
        detail::decodeExtendedAck(cursor, payload, memory);
    }
    return payload;
}

// MARK: - Builders:

/// @brief Makes an ERROR control message (or an acknowledgement if `code` is zero) in reply to a request.
///
/// Only the header of the request is echoed (so the `Flags::Capped` flag is set). The echoed length is
/// the original one, or just the header size for a request which has not been encoded yet (zero length).
///
inline Message makeErrorMessage(cetl::pmr::memory_resource& memory,
                                const Header&               request,
                                const std::int32_t          code,
                                const cetl::string_view     error_message = {})
{
    Bytes       bytes{Bytes::allocator_type{&memory}};
    WriteCursor cursor{bytes, WireSize::MaxAttribute};

    std::uint16_t flags = Flags::Capped;

    // Below writes can't fail - the capacity is way bigger than the content.
    (void) cursor.writeU32(static_cast<std::uint32_t>(code));
    (void) encodeHeader(request, cursor);
    cursor.patchU32(WireSize::ErrorCode, std::max(request.length, static_cast<std::uint32_t>(WireSize::Header)));
    if (!error_message.empty())
    {
        flags = static_cast<std::uint16_t>(flags | Flags::AckTlvs);

        AttributeList ext_ack{AttributeList::allocator_type{&memory}};
        ext_ack.push_back(makeStringAttribute(memory, ExtAckAttribute::Msg, error_message));
        (void) encodeAttributes(ext_ack, cursor);
    }

    return Message{Header{0, ControlType::Error, flags, request.sequence, request.port_id},
                   cetl::nullopt,
                   std::move(bytes)};
}

/// @brief Makes an acknowledgement (an ERROR control message with zero code) of a request.
///
inline Message makeAckMessage(cetl::pmr::memory_resource& memory, const Header& request)
{
    return makeErrorMessage(memory, request, 0);
}

/// @brief Makes a DONE control message which terminates a multipart reply.
///
inline Message makeDoneMessage(cetl::pmr::memory_resource& memory,
                               const SequenceNumber        sequence,
                               const PortId                port_id,
                               const std::int32_t          status = 0)
{
    Bytes       bytes{Bytes::allocator_type{&memory}};
    WriteCursor cursor{bytes, WireSize::ErrorCode};
    (void) cursor.writeU32(static_cast<std::uint32_t>(status));

    return Message{Header{0, ControlType::Done, Flags::Multi, sequence, port_id}, cetl::nullopt, std::move(bytes)};
}

}  // namespace wire
}  // namespace libnlwire

#endif  // LIBNLWIRE_WIRE_CONTROL_CODEC_HPP_INCLUDED
