/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_WIRE_ATTRIBUTE_HPP_INCLUDED
#define LIBNLWIRE_WIRE_ATTRIBUTE_HPP_INCLUDED

#include "byte_cursor.hpp"
#include "defines.hpp"
#include "libnlwire/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace libnlwire
{
namespace wire
{

/// @brief Defines a single TLV attribute.
///
/// The payload is either raw bytes, or a list of nested attributes. Which of the two is in use
/// for a decoded attribute is decided by the attribute schema supplied to the decoder
/// (see `IAttributeSchema`) - NOT by the `nested` flag, which is just carried as is.
///
/// Wire padding is never part of the payload.
///
struct Attribute final
{
    using List    = PmrVector<Attribute>;
    using Payload = cetl::variant<Bytes, List>;

    /// Logical (14-bit) type id - without the flag bits.
    AttributeType type{0};

    /// Value of the `AttributeFlags::Nested` bit.
    bool nested{false};

    /// Value of the `AttributeFlags::NetByteOrder` bit.
    bool net_byte_order{false};

    Payload payload;

    const Bytes* bytes() const noexcept
    {
        return cetl::get_if<Bytes>(&payload);
    }

    const List* attributes() const noexcept
    {
        return cetl::get_if<List>(&payload);
    }

    /// @brief Gets the byte order in which the attribute's primitive value is stored.
    ///
    ByteOrder byteOrder() const noexcept
    {
        return net_byte_order ? ByteOrder::Network : ByteOrder::Host;
    }

};  // Attribute

using AttributeList = Attribute::List;

inline bool operator==(const Attribute& lhs, const Attribute& rhs)
{
    return (lhs.type == rhs.type) && (lhs.nested == rhs.nested) && (lhs.net_byte_order == rhs.net_byte_order) &&
           (lhs.payload == rhs.payload);
}
inline bool operator!=(const Attribute& lhs, const Attribute& rhs)
{
    return !(lhs == rhs);
}

// MARK: - Factories:

inline Attribute makeBytesAttribute(cetl::pmr::memory_resource& memory,
                                    const AttributeType         type,
                                    const ConstBytesSpan        bytes)
{
    return Attribute{type, false, false, Bytes(bytes.begin(), bytes.end(), Bytes::allocator_type{&memory})};
}

/// Internal implementation details.
/// Not supposed to be used directly by the users of the library.
///
namespace detail
{

template <typename T>
Attribute makeUnsignedAttribute(cetl::pmr::memory_resource& memory,
                                const AttributeType         type,
                                const T                     value,
                                const ByteOrder             order)
{
    std::array<cetl::byte, sizeof(T)> bytes{};
    storeUnsigned(value, bytes.data(), order);

    auto attribute           = makeBytesAttribute(memory, type, {bytes.data(), bytes.size()});
    attribute.net_byte_order = (order == ByteOrder::Network);
    return attribute;
}

template <typename T>
cetl::optional<T> getUnsigned(const Attribute& attribute) noexcept
{
    const auto* const bytes = attribute.bytes();
    if ((bytes == nullptr) || (bytes->size() != sizeof(T)))
    {
        return cetl::nullopt;
    }
    return loadUnsigned<T>(bytes->data(), attribute.byteOrder());
}

}  // namespace detail

inline Attribute makeU8Attribute(cetl::pmr::memory_resource& memory,
                                 const AttributeType         type,
                                 const std::uint8_t          value)
{
    return detail::makeUnsignedAttribute(memory, type, value, ByteOrder::Host);
}

/// @brief Makes a 16-bit unsigned attribute.
///
/// If the network byte order is requested then the `net_byte_order` flag is set as well.
///
inline Attribute makeU16Attribute(cetl::pmr::memory_resource& memory,
                                  const AttributeType         type,
                                  const std::uint16_t         value,
                                  const ByteOrder             order = ByteOrder::Host)
{
    return detail::makeUnsignedAttribute(memory, type, value, order);
}

inline Attribute makeU32Attribute(cetl::pmr::memory_resource& memory,
                                  const AttributeType         type,
                                  const std::uint32_t         value,
                                  const ByteOrder             order = ByteOrder::Host)
{
    return detail::makeUnsignedAttribute(memory, type, value, order);
}

inline Attribute makeU64Attribute(cetl::pmr::memory_resource& memory,
                                  const AttributeType         type,
                                  const std::uint64_t         value,
                                  const ByteOrder             order = ByteOrder::Host)
{
    return detail::makeUnsignedAttribute(memory, type, value, order);
}

/// @brief Makes a string attribute - the payload is the string followed by the NUL terminator.
///
inline Attribute makeStringAttribute(cetl::pmr::memory_resource& memory,
                                     const AttributeType         type,
                                     const cetl::string_view     str)
{
    Bytes bytes{Bytes::allocator_type{&memory}};
    bytes.reserve(str.size() + 1U);
    for (const char ch : str)
    {
        bytes.push_back(static_cast<cetl::byte>(ch));
    }
    bytes.push_back(cetl::byte{0});
    return Attribute{type, false, false, std::move(bytes)};
}

/// @brief Makes a nested attribute, with the `nested` flag set.
///
inline Attribute makeNestedAttribute(const AttributeType type, AttributeList attributes)
{
    return Attribute{type, true, false, std::move(attributes)};
}

// MARK: - Getters:

inline cetl::optional<std::uint8_t> getU8(const Attribute& attribute) noexcept
{
    return detail::getUnsigned<std::uint8_t>(attribute);
}

/// @brief Gets 16-bit unsigned value of an attribute.
///
/// The `net_byte_order` flag of the attribute decides the byte order.
///
/// @return The value, or `nullopt` if the payload is not exactly 2 raw bytes.
///
inline cetl::optional<std::uint16_t> getU16(const Attribute& attribute) noexcept
{
    return detail::getUnsigned<std::uint16_t>(attribute);
}

inline cetl::optional<std::uint32_t> getU32(const Attribute& attribute) noexcept
{
    return detail::getUnsigned<std::uint32_t>(attribute);
}

inline cetl::optional<std::uint64_t> getU64(const Attribute& attribute) noexcept
{
    return detail::getUnsigned<std::uint64_t>(attribute);
}

/// @brief Gets string value of an attribute.
///
/// The string ends at the first NUL byte (if any) of the payload.
/// The returned view refers to the attribute's own payload.
///
inline cetl::optional<cetl::string_view> getString(const Attribute& attribute) noexcept
{
    const auto* const bytes = attribute.bytes();
    if (bytes == nullptr)
    {
        return cetl::nullopt;
    }

    std::size_t length = 0;
    while ((length < bytes->size()) && ((*bytes)[length] != cetl::byte{0}))
    {
        ++length;
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return cetl::string_view{reinterpret_cast<const char*>(bytes->data()), length};
}

/// @brief Finds the first attribute of the given type in a list.
///
/// @return Pointer to the attribute (owned by the list), or `nullptr` if there is no such attribute.
///
inline const Attribute* findAttribute(const AttributeList& attributes, const AttributeType type) noexcept
{
    for (const auto& attribute : attributes)
    {
        if (attribute.type == type)
        {
            return &attribute;
        }
    }
    return nullptr;
}

}  // namespace wire
}  // namespace libnlwire

#endif  // LIBNLWIRE_WIRE_ATTRIBUTE_HPP_INCLUDED
