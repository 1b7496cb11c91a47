/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_WIRE_ERRORS_HPP_INCLUDED
#define LIBNLWIRE_WIRE_ERRORS_HPP_INCLUDED

#include "libnlwire/errors.hpp"
#include "libnlwire/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>

namespace libnlwire
{
namespace wire
{

/// @brief Defines an error of reading past the end of a buffer.
///
struct OutOfBoundsError final
{
    /// Position of the cursor at the moment of the failed read.
    std::size_t position;

    /// Number of bytes which were requested.
    std::size_t requested;

    /// Number of bytes which were still available.
    std::size_t remaining;
};

/// @brief Defines an error of writing past the capacity of a buffer.
///
struct BufferFullError final
{
    std::size_t capacity;
    std::size_t requested;
};

/// @brief Defines an error of a buffer which ends before a structure (header or message) it announces.
///
struct TruncatedError final
{
    /// Offset of the truncated structure within the decoded buffer.
    std::size_t offset;

    /// Number of bytes the structure needs.
    std::size_t expected;

    /// Number of bytes actually available.
    std::size_t available;
};

/// @brief Defines an error of a structurally invalid header or attribute.
///
struct MalformedError final
{
    enum class Reason : std::uint8_t
    {
        HeaderLengthTooSmall,
        AttributeLengthTooSmall,
        AttributeOverrunsEnd,
        NestingTooDeep,
        PayloadTooSmall,
    };

    /// Offset of the malformed structure within the decoded buffer.
    std::size_t offset;

    Reason reason;
};

/// @brief Defines any possible failure of decoding.
///
/// General taxonomy of results of codec functions is such that:
/// - A function returns (via `cetl::variant`) either an expected `Success` type, or a `Failure` type.
/// - If the success result type is `void`, then `cetl::optional<Failure>` in in use (instead of `cetl::variant`).
/// - The failure result type is a `cetl::variant` of all possible "primitive" error types.
///
using DecodeFailure = cetl::variant<OutOfBoundsError, TruncatedError, MalformedError>;

/// @brief Defines any possible failure of encoding.
///
using EncodeFailure = cetl::variant<BufferFullError, ArgumentError>;

}  // namespace wire
}  // namespace libnlwire

#endif  // LIBNLWIRE_WIRE_ERRORS_HPP_INCLUDED
