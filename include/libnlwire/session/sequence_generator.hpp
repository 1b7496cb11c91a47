/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_SESSION_SEQUENCE_GENERATOR_HPP_INCLUDED
#define LIBNLWIRE_SESSION_SEQUENCE_GENERATOR_HPP_INCLUDED

#include "libnlwire/wire/defines.hpp"

#include <cetl/cetl.hpp>

#include <utility>

namespace libnlwire
{
namespace session
{

/// Internal implementation details of the Session layer.
/// Not supposed to be used directly by the users of the library.
///
namespace detail
{

/// @brief Defines a sequence number generator.
///
/// The generator simply increments the sequence number (wrapping around at 2^32).
/// Zero is never generated - it is the sequence number of kernel originated notifications,
/// so a request with such number could be confused with them.
///
class SequenceNumberGenerator
{
public:
    /// @brief Returns the next sequence number.
    ///
    CETL_NODISCARD wire::SequenceNumber nextSequenceNumber() noexcept
    {
        if (next_sequence_ == 0)
        {
            next_sequence_ = 1;
        }
        return std::exchange(next_sequence_, next_sequence_ + 1);
    }

    /// @brief Sets next sequence number.
    ///
    /// In use for testing purposes.
    ///
    void setNextSequenceNumber(const wire::SequenceNumber sequence) noexcept
    {
        next_sequence_ = sequence;
    }

private:
    // MARK: Data members:

    wire::SequenceNumber next_sequence_{1};

};  // SequenceNumberGenerator

}  // namespace detail
}  // namespace session
}  // namespace libnlwire

#endif  // LIBNLWIRE_SESSION_SEQUENCE_GENERATOR_HPP_INCLUDED
