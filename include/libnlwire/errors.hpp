/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_ERRORS_HPP_INCLUDED
#define LIBNLWIRE_ERRORS_HPP_INCLUDED

#include <cstdint>

namespace libnlwire
{

/// @brief Defines a generic error that is issued when a memory allocation fails.
///
struct MemoryError final
{};

/// @brief Defines a generic error that is issued when an argument is invalid.
///
/// F.e. an attribute type id which does not fit into 14 bits, or a payload too big for a 16-bit length field.
///
struct ArgumentError final
{};

/// @brief Defines an I/O error reported by the transport collaborator.
///
/// The core never retries nor suppresses such errors - they are propagated to the caller unchanged.
///
struct IoError final
{
    /// Platform-specific error code (`errno` value on POSIX platforms).
    std::int32_t code;
};

}  // namespace libnlwire

#endif  // LIBNLWIRE_ERRORS_HPP_INCLUDED
