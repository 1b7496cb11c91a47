/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_WIRE_ATTRIBUTE_CODEC_HPP_INCLUDED
#define LIBNLWIRE_WIRE_ATTRIBUTE_CODEC_HPP_INCLUDED

#include "attribute.hpp"
#include "byte_cursor.hpp"
#include "defines.hpp"
#include "errors.hpp"
#include "libnlwire/config.hpp"
#include "libnlwire/errors.hpp"
#include "libnlwire/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>

namespace libnlwire
{
namespace wire
{

/// @brief Defines abstract interface of an attribute schema.
///
/// Netlink attributes are not self-describing - whether a payload is a nested attribute list
/// is known only out-of-band (from the semantics of a particular family). So the attribute decoder
/// consults a schema per attribute type id, at each level of nesting.
///
class IAttributeSchema
{
public:
    IAttributeSchema(const IAttributeSchema&)                = delete;
    IAttributeSchema(IAttributeSchema&&) noexcept            = delete;
    IAttributeSchema& operator=(const IAttributeSchema&)     = delete;
    IAttributeSchema& operator=(IAttributeSchema&&) noexcept = delete;

    /// @brief Gets schema of the nested list carried by an attribute of the given type.
    ///
    /// @return Schema of the nested attributes, or `nullptr` if the payload is raw bytes.
    ///
    virtual const IAttributeSchema* nestedSchemaOf(const AttributeType type) const noexcept = 0;

protected:
    IAttributeSchema()  = default;
    ~IAttributeSchema() = default;

};  // IAttributeSchema

/// @brief Defines a schema where every attribute payload is raw bytes.
///
class RawAttributeSchema final : public IAttributeSchema
{
public:
    RawAttributeSchema()  = default;
    ~RawAttributeSchema() = default;

    RawAttributeSchema(const RawAttributeSchema&)                = delete;
    RawAttributeSchema(RawAttributeSchema&&) noexcept            = delete;
    RawAttributeSchema& operator=(const RawAttributeSchema&)     = delete;
    RawAttributeSchema& operator=(RawAttributeSchema&&) noexcept = delete;

    static const RawAttributeSchema& instance() noexcept
    {
        static const RawAttributeSchema raw_schema{};
        return raw_schema;
    }

    // MARK: IAttributeSchema

    const IAttributeSchema* nestedSchemaOf(const AttributeType) const noexcept override
    {
        return nullptr;
    }

};  // RawAttributeSchema

/// @brief Defines a table-driven schema.
///
/// Each entry maps an attribute type to the schema of its nested list.
/// Types without an entry are raw. The entries are not copied - they must outlive the schema.
///
class AttributeSchema final : public IAttributeSchema
{
public:
    struct Entry final
    {
        AttributeType           type;
        const IAttributeSchema* nested;
    };

    explicit AttributeSchema(const cetl::span<const Entry> entries) noexcept
        : entries_{entries}
    {
    }

    ~AttributeSchema() = default;

    AttributeSchema(const AttributeSchema&)                = delete;
    AttributeSchema(AttributeSchema&&) noexcept            = delete;
    AttributeSchema& operator=(const AttributeSchema&)     = delete;
    AttributeSchema& operator=(AttributeSchema&&) noexcept = delete;

    // MARK: IAttributeSchema

    const IAttributeSchema* nestedSchemaOf(const AttributeType type) const noexcept override
    {
        for (const auto& entry : entries_)
        {
            if (entry.type == type)
            {
                return entry.nested;
            }
        }
        return nullptr;
    }

private:
    // MARK: Data members:

    const cetl::span<const Entry> entries_;

};  // AttributeSchema

/// @brief Defines a schema of an "array of nests" - every attribute (whatever its type, which is usually
/// just an index) is a nested list described by the same element schema.
///
class ArrayAttributeSchema final : public IAttributeSchema
{
public:
    explicit ArrayAttributeSchema(const IAttributeSchema& element) noexcept
        : element_{element}
    {
    }

    ~ArrayAttributeSchema() = default;

    ArrayAttributeSchema(const ArrayAttributeSchema&)                = delete;
    ArrayAttributeSchema(ArrayAttributeSchema&&) noexcept            = delete;
    ArrayAttributeSchema& operator=(const ArrayAttributeSchema&)     = delete;
    ArrayAttributeSchema& operator=(ArrayAttributeSchema&&) noexcept = delete;

    // MARK: IAttributeSchema

    const IAttributeSchema* nestedSchemaOf(const AttributeType) const noexcept override
    {
        return &element_;
    }

private:
    // MARK: Data members:

    const IAttributeSchema& element_;

};  // ArrayAttributeSchema

// MARK: - Decoding:

/// @brief Defines failure of decoding of an attribute list.
///
/// Besides the cause, it carries the prefix of the list - all (top level) attributes which were
/// successfully decoded before the malformed one. The caller may use the prefix or discard it.
///
struct AttributesDecodeFailure final
{
    DecodeFailure cause;
    AttributeList prefix;
};

/// Internal implementation details.
/// Not supposed to be used directly by the users of the library.
///
namespace detail
{

inline Expected<AttributeList, AttributesDecodeFailure> decodeAttributesAt(ReadCursor&                 cursor,
                                                                           const std::size_t           end,
                                                                           const IAttributeSchema&     schema,
                                                                           cetl::pmr::memory_resource& memory,
                                                                           const std::size_t           depth)
{
    CETL_DEBUG_ASSERT(end <= cursor.size(), "The attribute list range must be within the buffer.");
    CETL_DEBUG_ASSERT(cursor.position() <= end, "");

    AttributeList attributes{AttributeList::allocator_type{&memory}};

    while (cursor.position() < end)
    {
        const std::size_t offset = cursor.position();
        if ((end - offset) < WireSize::AttributeHeader)
        {
            // Too few bytes to be an attribute - it is the trailing padding.
            (void) cursor.skip(end - offset);
            break;
        }

        // The whole attribute header is within the range (and so within the buffer) - see above.
        const auto length   = cetl::get<std::uint16_t>(cursor.readU16());
        const auto raw_type = cetl::get<std::uint16_t>(cursor.readU16());
        if (length < WireSize::AttributeHeader)
        {
            return AttributesDecodeFailure{MalformedError{offset, MalformedError::Reason::AttributeLengthTooSmall},
                                           std::move(attributes)};
        }
        if (length > (end - offset))
        {
            return AttributesDecodeFailure{MalformedError{offset, MalformedError::Reason::AttributeOverrunsEnd},
                                           std::move(attributes)};
        }
        const std::size_t payload_end = offset + length;

        Attribute attribute{};
        attribute.type           = static_cast<AttributeType>(raw_type & AttributeFlags::TypeMask);
        attribute.nested         = (raw_type & AttributeFlags::Nested) != 0;
        attribute.net_byte_order = (raw_type & AttributeFlags::NetByteOrder) != 0;

        if (const auto* const nested_schema = schema.nestedSchemaOf(attribute.type))
        {
            if (depth >= config::Wire::MaxNestingDepth())
            {
                return AttributesDecodeFailure{MalformedError{offset, MalformedError::Reason::NestingTooDeep},
                                               std::move(attributes)};
            }

            auto nested_result = decodeAttributesAt(cursor, payload_end, *nested_schema, memory, depth + 1);
            if (auto* const failure = cetl::get_if<AttributesDecodeFailure>(&nested_result))
            {
                return AttributesDecodeFailure{std::move(failure->cause), std::move(attributes)};
            }
            attribute.payload = cetl::get<AttributeList>(std::move(nested_result));
        }
        else
        {
            const auto payload = cetl::get<ConstBytesSpan>(cursor.readBytes(payload_end - cursor.position()));
            attribute.payload  = Bytes(payload.begin(), payload.end(), Bytes::allocator_type{&memory});
        }

        cursor.alignTo(WireSize::Alignment, offset, end);
        attributes.push_back(std::move(attribute));
    }

    return attributes;
}

inline cetl::optional<EncodeFailure> encodeAttribute(const Attribute& attribute, WriteCursor& cursor);

}  // namespace detail

/// @brief Decodes a list of attributes from the current cursor position up to the `end` position.
///
/// Nesting is decided by the `schema` per attribute type id (at each level). Padding is skipped
/// (without requiring it to be zero), and it is never exposed. Fewer than 4 bytes left before
/// the `end` are considered to be a trailing padding.
///
/// @param cursor The cursor to read from. The `end` position must be within its buffer.
/// @param end Position (exclusive) where the attribute list ends.
/// @param schema Schema of the list.
/// @param memory Memory resource for the decoded payloads.
/// @return List of decoded attributes, or a failure which carries the successfully decoded prefix.
///         On failure the cursor position is unspecified (but within the `end`).
///
inline Expected<AttributeList, AttributesDecodeFailure> decodeAttributes(ReadCursor&                 cursor,
                                                                         const std::size_t           end,
                                                                         const IAttributeSchema&     schema,
                                                                         cetl::pmr::memory_resource& memory)
{
    return detail::decodeAttributesAt(cursor, end, schema, memory, 0);
}

// MARK: - Encoding:

/// @brief Encodes a list of attributes (recursively for nested lists).
///
/// Each attribute is written as a zero length placeholder, the type (together with its flag bits
/// exactly as stored in the attribute), the payload; then the length is back-patched,
/// and zero padding is emitted up to the next 4-byte boundary.
///
/// @return `ArgumentError` if a type id does not fit into 14 bits, or an attribute
///         (including its nested content) is longer than 65535 bytes; `BufferFullError` if the cursor is full.
///
inline cetl::optional<EncodeFailure> encodeAttributes(const AttributeList& attributes, WriteCursor& cursor)
{
    for (const auto& attribute : attributes)
    {
        if (auto failure = detail::encodeAttribute(attribute, cursor))
        {
            return failure;
        }
    }
    return cetl::nullopt;
}

namespace detail
{

inline cetl::optional<EncodeFailure> encodeAttribute(const Attribute& attribute, WriteCursor& cursor)
{
    if (attribute.type > AttributeFlags::MaxType)
    {
        return ArgumentError{};
    }

    const std::size_t start         = cursor.position();
    auto              length_result = cursor.reserve(sizeof(std::uint16_t));
    if (const auto* const failure = cetl::get_if<BufferFullError>(&length_result))
    {
        return *failure;
    }

    std::uint16_t raw_type = attribute.type;
    if (attribute.nested)
    {
        raw_type = static_cast<std::uint16_t>(raw_type | AttributeFlags::Nested);
    }
    if (attribute.net_byte_order)
    {
        raw_type = static_cast<std::uint16_t>(raw_type | AttributeFlags::NetByteOrder);
    }
    if (auto failure = cursor.writeU16(raw_type))
    {
        return *failure;
    }

    if (const auto* const bytes = attribute.bytes())
    {
        if (auto failure = cursor.writeBytes(libnlwire::detail::asSpan(*bytes)))
        {
            return *failure;
        }
    }
    else if (const auto* const nested = attribute.attributes())
    {
        if (auto failure = encodeAttributes(*nested, cursor))
        {
            return failure;
        }
    }

    const std::size_t length = cursor.position() - start;
    if (length > WireSize::MaxAttribute)
    {
        return ArgumentError{};
    }
    cursor.patchU16(cetl::get<std::size_t>(length_result), static_cast<std::uint16_t>(length));

    if (auto failure = cursor.alignTo(WireSize::Alignment, start))
    {
        return *failure;
    }
    return cetl::nullopt;
}

}  // namespace detail

}  // namespace wire
}  // namespace libnlwire

#endif  // LIBNLWIRE_WIRE_ATTRIBUTE_CODEC_HPP_INCLUDED
