/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_WIRE_MESSAGE_CODEC_HPP_INCLUDED
#define LIBNLWIRE_WIRE_MESSAGE_CODEC_HPP_INCLUDED

#include "attribute_codec.hpp"
#include "byte_cursor.hpp"
#include "defines.hpp"
#include "errors.hpp"
#include "header_codec.hpp"
#include "message.hpp"
#include "libnlwire/config.hpp"
#include "libnlwire/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <utility>

namespace libnlwire
{
namespace wire
{

/// @brief Defines abstract interface of a message schema.
///
/// The schema tells the decoder how to interpret the body of a message which follows the fixed header.
///
class IMessageSchema
{
public:
    IMessageSchema(const IMessageSchema&)                = delete;
    IMessageSchema(IMessageSchema&&) noexcept            = delete;
    IMessageSchema& operator=(const IMessageSchema&)     = delete;
    IMessageSchema& operator=(IMessageSchema&&) noexcept = delete;

    /// @brief Decides whether the generic sub-header follows the fixed header of a message.
    ///
    virtual bool hasGenericHeader(const Header& header) const noexcept = 0;

    /// @brief Gets schema of the attributes which make the message payload.
    ///
    /// @param header The fixed header of the message.
    /// @param generic The generic sub-header of the message (if any).
    /// @return Schema of the payload attributes, or `nullptr` if the payload is opaque.
    ///
    virtual const IAttributeSchema* attributesOf(const Header&                         header,
                                                 const cetl::optional<GenericHeader>& generic) const noexcept = 0;

protected:
    IMessageSchema()  = default;
    ~IMessageSchema() = default;

};  // IMessageSchema

/// @brief Defines the default schema of a generic netlink socket.
///
/// Control messages (NOOP, ERROR, DONE, OVERRUN) have the fixed header only, and an opaque payload.
/// All other messages have the generic sub-header followed by attributes described by the root schema.
///
class GenericMessageSchema final : public IMessageSchema
{
public:
    explicit GenericMessageSchema(const IAttributeSchema& root = RawAttributeSchema::instance()) noexcept
        : root_{root}
    {
    }

    ~GenericMessageSchema() = default;

    GenericMessageSchema(const GenericMessageSchema&)                = delete;
    GenericMessageSchema(GenericMessageSchema&&) noexcept            = delete;
    GenericMessageSchema& operator=(const GenericMessageSchema&)     = delete;
    GenericMessageSchema& operator=(GenericMessageSchema&&) noexcept = delete;

    // MARK: IMessageSchema

    bool hasGenericHeader(const Header& header) const noexcept override
    {
        return !header.isControl();
    }

    const IAttributeSchema* attributesOf(const Header& header,
                                         const cetl::optional<GenericHeader>&) const noexcept override
    {
        return header.isControl() ? nullptr : &root_;
    }

private:
    // MARK: Data members:

    const IAttributeSchema& root_;

};  // GenericMessageSchema

/// @brief Defines a schema where every message is the fixed header followed by an opaque payload.
///
/// Suitable for classic (non-generic) families whose messages start with a family-specific fixed structure.
///
class RawMessageSchema final : public IMessageSchema
{
public:
    RawMessageSchema()  = default;
    ~RawMessageSchema() = default;

    RawMessageSchema(const RawMessageSchema&)                = delete;
    RawMessageSchema(RawMessageSchema&&) noexcept            = delete;
    RawMessageSchema& operator=(const RawMessageSchema&)     = delete;
    RawMessageSchema& operator=(RawMessageSchema&&) noexcept = delete;

    static const RawMessageSchema& instance() noexcept
    {
        static const RawMessageSchema raw_schema{};
        return raw_schema;
    }

    // MARK: IMessageSchema

    bool hasGenericHeader(const Header&) const noexcept override
    {
        return false;
    }

    const IAttributeSchema* attributesOf(const Header&, const cetl::optional<GenericHeader>&) const noexcept override
    {
        return nullptr;
    }

};  // RawMessageSchema

// MARK: - Encoding:

/// @brief Appends an encoded message to the cursor.
///
/// Zero padding is emitted after the message (not counted by its length) up to the next 4-byte boundary,
/// so several messages could be batched into the same buffer.
///
inline cetl::optional<EncodeFailure> encodeMessage(const Message& message, WriteCursor& cursor)
{
    auto header_result = encodeHeader(message.header, cursor);
    if (auto* const failure = cetl::get_if<EncodeFailure>(&header_result))
    {
        return std::move(*failure);
    }
    const std::size_t header_offset = cetl::get<std::size_t>(header_result);

    if (message.generic.has_value())
    {
        if (auto failure = encodeGenericHeader(*message.generic, cursor))
        {
            return failure;
        }
    }

    if (const auto* const bytes = message.bytes())
    {
        if (auto failure = cursor.writeBytes(libnlwire::detail::asSpan(*bytes)))
        {
            return *failure;
        }
    }
    else if (const auto* const attributes = message.attributes())
    {
        if (auto failure = encodeAttributes(*attributes, cursor))
        {
            return failure;
        }
    }

    if (auto failure = patchLength(cursor, header_offset))
    {
        return failure;
    }
    if (auto failure = cursor.alignTo(WireSize::Alignment, header_offset))
    {
        return *failure;
    }
    return cetl::nullopt;
}

/// @brief Encodes a message into a new buffer.
///
/// @param message The message to encode. Its header `length` is ignored (the actual one is computed).
/// @param memory Memory resource for the result buffer.
/// @param capacity Max size of the encoded message.
/// @return Encoded bytes, or a failure.
///
inline Expected<Bytes, EncodeFailure> encode(const Message&              message,
                                             cetl::pmr::memory_resource& memory,
                                             const std::size_t capacity = config::Wire::DefaultEncodeCapacity())
{
    Bytes       buffer{Bytes::allocator_type{&memory}};
    WriteCursor cursor{buffer, capacity};
    if (auto failure = encodeMessage(message, cursor))
    {
        return std::move(*failure);
    }
    return buffer;
}

// MARK: - Decoding:

/// @brief Defines failure of decoding of a single message.
///
struct MessageDecodeFailure final
{
    DecodeFailure cause;

    /// The fixed header of the rejected message.
    ///
    /// Present only if the header itself is valid (and so the message boundaries are known) -
    /// in such case messages which follow the rejected one are still decodable.
    ///
    cetl::optional<Header> header;
};

/// Internal implementation details.
/// Not supposed to be used directly by the users of the library.
///
namespace detail
{

/// Decodes the body of a message whose fixed header is already decoded and validated.
/// The body occupies range from the current cursor position up to the `end` position.
///
inline Expected<Message, DecodeFailure> decodeMessageBody(ReadCursor&                 cursor,
                                                          const std::size_t           end,
                                                          const Header&               header,
                                                          const IMessageSchema&       schema,
                                                          cetl::pmr::memory_resource& memory)
{
    Message message{header, cetl::nullopt, Bytes{Bytes::allocator_type{&memory}}};

    if (schema.hasGenericHeader(header))
    {
        if ((end - cursor.position()) < WireSize::GenericHeader)
        {
            return MalformedError{cursor.position(), MalformedError::Reason::PayloadTooSmall};
        }
        auto generic_result = decodeGenericHeader(cursor);
        if (auto* const failure = cetl::get_if<DecodeFailure>(&generic_result))
        {
            return std::move(*failure);
        }
        message.generic = cetl::get<GenericHeader>(generic_result);
    }

    if (const auto* const attributes_schema = schema.attributesOf(header, message.generic))
    {
        auto attributes_result = decodeAttributes(cursor, end, *attributes_schema, memory);
        if (auto* const failure = cetl::get_if<AttributesDecodeFailure>(&attributes_result))
        {
            return std::move(failure->cause);
        }
        message.payload = cetl::get<AttributeList>(std::move(attributes_result));
    }
    else
    {
        const auto payload = cetl::get<ConstBytesSpan>(cursor.readBytes(end - cursor.position()));
        message.payload    = Bytes(payload.begin(), payload.end(), Bytes::allocator_type{&memory});
    }

    return message;
}

}  // namespace detail

/// @brief Decodes a single message at the current position of the cursor.
///
/// On success, or on a failure which carries the header, the cursor is left at the (aligned) beginning
/// of the next message. Otherwise the cursor position is unspecified.
///
inline Expected<Message, MessageDecodeFailure> decodeMessage(ReadCursor&                 cursor,
                                                             const IMessageSchema&       schema,
                                                             cetl::pmr::memory_resource& memory)
{
    const std::size_t offset = cursor.position();

    auto header_result = decodeHeader(cursor);
    if (auto* const failure = cetl::get_if<DecodeFailure>(&header_result))
    {
        return MessageDecodeFailure{std::move(*failure), cetl::nullopt};
    }
    const auto header = cetl::get<Header>(header_result);

    const std::size_t available = cursor.size() - offset;
    if (header.length > available)
    {
        return MessageDecodeFailure{TruncatedError{offset, header.length, available}, cetl::nullopt};
    }
    const std::size_t end = offset + header.length;

    auto body_result = detail::decodeMessageBody(cursor, end, header, schema, memory);

    // Whatever the outcome of the body decoding is, the message boundaries are valid,
    // so we could move to the next message (if any).
    if (cursor.position() < end)
    {
        (void) cursor.skip(end - cursor.position());
    }
    cursor.alignTo(WireSize::Alignment, offset);

    if (auto* const failure = cetl::get_if<DecodeFailure>(&body_result))
    {
        return MessageDecodeFailure{std::move(*failure), header};
    }
    return cetl::get<Message>(std::move(body_result));
}

/// @brief Decodes each message of a buffer (f.e. a single datagram received from a socket) individually.
///
/// A message with a malformed body is reported to the visitor, and the decoding continues
/// with its siblings. Decoding stops at the first message whose boundaries are unknown
/// (its header is truncated or invalid). An empty buffer is visited as a truncated message.
///
/// @tparam Visitor Callable with `Expected<Message, MessageDecodeFailure>&&` argument.
/// @return Number of visited results.
///
template <typename Visitor>
std::size_t decodeEach(const ConstBytesSpan        bytes,
                       const IMessageSchema&       schema,
                       cetl::pmr::memory_resource& memory,
                       Visitor&&                   visitor)
{
    std::size_t count = 0;
    ReadCursor  cursor{bytes};
    do
    {
        auto       result         = decodeMessage(cursor, schema, memory);
        const auto is_recoverable = (cetl::get_if<MessageDecodeFailure>(&result) == nullptr) ||
                                    cetl::get<MessageDecodeFailure>(result).header.has_value();
        ++count;
        visitor(std::move(result));
        if (!is_recoverable)
        {
            break;
        }
    } while (cursor.remaining() > 0);
    return count;
}

/// @brief Decodes all messages of a buffer (a single receive may contain several messages back-to-back).
///
/// Unlike `decodeEach`, the decoding is strict - any failure fails the whole buffer.
/// A buffer always carries at least one message, so an empty one is reported as truncated.
///
inline Expected<MessageList, DecodeFailure> decode(const ConstBytesSpan        bytes,
                                                   const IMessageSchema&       schema,
                                                   cetl::pmr::memory_resource& memory)
{
    MessageList messages{MessageList::allocator_type{&memory}};
    ReadCursor  cursor{bytes};
    do
    {
        auto result = decodeMessage(cursor, schema, memory);
        if (auto* const failure = cetl::get_if<MessageDecodeFailure>(&result))
        {
            return std::move(failure->cause);
        }
        messages.push_back(cetl::get<Message>(std::move(result)));
    } while (cursor.remaining() > 0);
    return messages;
}

}  // namespace wire
}  // namespace libnlwire

#endif  // LIBNLWIRE_WIRE_MESSAGE_CODEC_HPP_INCLUDED
