/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_TIME_PROVIDER_HPP_INCLUDED
#define LIBNLWIRE_TIME_PROVIDER_HPP_INCLUDED

#include "types.hpp"

#include <chrono>

namespace libnlwire
{

/// @brief Defines abstract interface of a time provider.
///
/// The session layer uses it to evaluate response deadlines.
///
class ITimeProvider
{
public:
    ITimeProvider(const ITimeProvider&)                = delete;
    ITimeProvider(ITimeProvider&&) noexcept            = delete;
    ITimeProvider& operator=(const ITimeProvider&)     = delete;
    ITimeProvider& operator=(ITimeProvider&&) noexcept = delete;

    /// @brief Gets the current time point (aka now).
    ///
    virtual TimePoint now() const noexcept = 0;

protected:
    ITimeProvider()  = default;
    ~ITimeProvider() = default;

};  // ITimeProvider

/// @brief Defines a time provider which is based on the standard steady clock.
///
class SystemTimeProvider final : public ITimeProvider
{
public:
    SystemTimeProvider()  = default;
    ~SystemTimeProvider() = default;

    SystemTimeProvider(const SystemTimeProvider&)                = delete;
    SystemTimeProvider(SystemTimeProvider&&) noexcept            = delete;
    SystemTimeProvider& operator=(const SystemTimeProvider&)     = delete;
    SystemTimeProvider& operator=(SystemTimeProvider&&) noexcept = delete;

    // MARK: ITimeProvider

    TimePoint now() const noexcept override
    {
        const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
        return TimePoint{std::chrono::duration_cast<Duration>(since_epoch)};
    }

};  // SystemTimeProvider

}  // namespace libnlwire

#endif  // LIBNLWIRE_TIME_PROVIDER_HPP_INCLUDED
