/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_TYPES_HPP_INCLUDED
#define LIBNLWIRE_TYPES_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ratio>
#include <string>
#include <utility>
#include <vector>

namespace libnlwire
{

/// @brief The internal time representation is in microseconds.
///
struct MonotonicClock final
{
    using rep        = std::int64_t;
    using period     = std::micro;
    using duration   = std::chrono::duration<rep, period>;
    using time_point = std::chrono::time_point<MonotonicClock>;

    static constexpr bool is_steady = true;

};  // MonotonicClock

using TimePoint = MonotonicClock::time_point;
using Duration  = MonotonicClock::duration;

template <typename Success, typename Failure>
using Expected = cetl::variant<Success, Failure>;

/// @brief Defines a growable array whose storage comes from a Polymorphic Memory Resource (PMR).
///
/// `std::vector` is used (instead of `cetl::VariableLengthArray`) b/c attribute trees are recursive,
/// and only the standard vector is guaranteed to accept an incomplete element type.
///
template <typename T>
using PmrVector = std::vector<T, cetl::pmr::polymorphic_allocator<T>>;

/// @brief Owned sequence of raw bytes (f.e. an encoded message or an attribute payload).
///
using Bytes = PmrVector<cetl::byte>;

/// @brief Owned string (f.e. a kernel error message) whose storage comes from a PMR.
///
using PmrString = std::basic_string<char, std::char_traits<char>, cetl::pmr::polymorphic_allocator<char>>;

/// @brief Non-owning view of immutable raw bytes.
///
using ConstBytesSpan = cetl::span<const cetl::byte>;

/// Internal implementation details.
/// Not supposed to be used directly by the users of the library.
///
namespace detail
{

/// @brief Makes a new variant type by appending set of additional types.
///
/// In use f.e. for extending an existing `Failure` type (which is `cetl::variant` of possible `Error`s)
/// with extra set of additional failure modes which are specific to the particular functionality.
///
/// @tparam T Type of the original variant.
/// @tparam Args Set of the additional types.
///
template <typename T, typename... Args>
struct AppendType;
//
template <typename... A, typename... B>
struct AppendType<cetl::variant<A...>, B...>
{
    using Result = cetl::variant<A..., B...>;

};  // AppendType

/// @brief Upcasts a variant type value to a new variant type with additional types.
///
/// @tparam UpVariant The destination variant type upcast to.
/// @tparam Variant The source variant type to be upcasted.
/// @param variant Value of the source variant type.
/// @return Value of the upcasted variant type.
///
template <typename UpVariant, typename Variant>
CETL_NODISCARD UpVariant upcastVariant(Variant&& variant)
{
    return cetl::visit([](auto&& value) -> UpVariant { return std::forward<decltype(value)>(value); },
                       std::forward<Variant>(variant));
}

/// @brief Makes a view over the given owned bytes.
///
inline ConstBytesSpan asSpan(const Bytes& bytes) noexcept
{
    return {bytes.data(), bytes.size()};
}

}  // namespace detail
}  // namespace libnlwire

#endif  // LIBNLWIRE_TYPES_HPP_INCLUDED
