/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_WIRE_DEFINES_HPP_INCLUDED
#define LIBNLWIRE_WIRE_DEFINES_HPP_INCLUDED

#include <cstddef>
#include <cstdint>

namespace libnlwire
{
namespace wire
{

/// @brief `MessageType` is a 16-bit unsigned integer - either a reserved control value,
/// or a protocol/family specific value (f.e. a generic netlink family id).
///
using MessageType = std::uint16_t;

/// @brief `SequenceNumber` is a 32-bit unsigned integer which (together with `PortId`)
/// pairs a request with its response(s).
///
using SequenceNumber = std::uint32_t;

/// @brief `PortId` is a 32-bit unsigned integer - the address of a netlink socket endpoint.
///
/// Zero port id stands for the kernel.
///
using PortId = std::uint32_t;

/// @brief `AttributeType` is the logical (14-bit) type id of an attribute.
///
using AttributeType = std::uint16_t;

/// @brief Defines reserved control message types.
///
struct ControlType final
{
    static constexpr MessageType Noop    = 0x0;
    static constexpr MessageType Error   = 0x1;
    static constexpr MessageType Done    = 0x2;
    static constexpr MessageType Overrun = 0x3;

    /// Message types below this value are reserved for control messages.
    static constexpr MessageType MinType = 0x10;

    static constexpr bool isControl(const MessageType type) noexcept
    {
        return type <= Overrun;
    }

};  // ControlType

/// @brief Defines bits of the `flags` field of the message header.
///
struct Flags final
{
    static constexpr std::uint16_t None    = 0x000;
    static constexpr std::uint16_t Request = 0x001;  ///< It is a request message.
    static constexpr std::uint16_t Multi   = 0x002;  ///< Multipart message, terminated by `ControlType::Done`.
    static constexpr std::uint16_t Ack     = 0x004;  ///< Reply with an acknowledgment, on success.
    static constexpr std::uint16_t Echo    = 0x008;  ///< Echo this request.

    static constexpr std::uint16_t DumpInterrupted = 0x010;  ///< Dump was inconsistent due to sequence change.
    static constexpr std::uint16_t DumpFiltered    = 0x020;  ///< Dump was filtered as requested.

    // Modifiers to GET request.
    static constexpr std::uint16_t Root   = 0x100;  ///< Specify tree root.
    static constexpr std::uint16_t Match  = 0x200;  ///< Return all matching.
    static constexpr std::uint16_t Atomic = 0x400;  ///< Atomic GET.
    static constexpr std::uint16_t Dump   = Root | Match;

    // Modifiers of `ControlType::Error` message (aka acknowledgment).
    static constexpr std::uint16_t Capped  = 0x100;  ///< Request was capped (payload of the request is omitted).
    static constexpr std::uint16_t AckTlvs = 0x200;  ///< Extended ACK TLVs are present.

};  // Flags

/// @brief Defines bits of the `type` field of an attribute header.
///
struct AttributeFlags final
{
    static constexpr std::uint16_t Nested       = 0x8000;
    static constexpr std::uint16_t NetByteOrder = 0x4000;
    static constexpr std::uint16_t TypeMask     = static_cast<std::uint16_t>(~(Nested | NetByteOrder));
    static constexpr AttributeType MaxType      = TypeMask;

};  // AttributeFlags

/// @brief Defines fixed sizes and alignment of the wire format.
///
struct WireSize final
{
    static constexpr std::size_t Alignment       = 4;
    static constexpr std::size_t Header          = 16;
    static constexpr std::size_t GenericHeader   = 4;
    static constexpr std::size_t AttributeHeader = 4;
    static constexpr std::size_t MaxAttribute    = 0xFFFF;

    /// Size of the error code field which starts payload of `ControlType::Error` (and `Done`) message.
    static constexpr std::size_t ErrorCode = 4;

    static constexpr std::size_t align(const std::size_t size) noexcept
    {
        return (size + Alignment - 1U) & ~(Alignment - 1U);
    }

};  // WireSize

/// @brief Defines attribute types of the extended acknowledgment (see `Flags::AckTlvs`).
///
struct ExtAckAttribute final
{
    static constexpr AttributeType Unused = 0;
    static constexpr AttributeType Msg    = 1;  ///< NUL-terminated error message string.
    static constexpr AttributeType Offs   = 2;  ///< u32 offset of the invalid attribute in the original request.
    static constexpr AttributeType Cookie = 3;
    static constexpr AttributeType Policy = 4;

};  // ExtAckAttribute

}  // namespace wire
}  // namespace libnlwire

#endif  // LIBNLWIRE_WIRE_DEFINES_HPP_INCLUDED
