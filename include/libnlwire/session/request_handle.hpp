/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_SESSION_REQUEST_HANDLE_HPP_INCLUDED
#define LIBNLWIRE_SESSION_REQUEST_HANDLE_HPP_INCLUDED

#include "types.hpp"

#include "libnlwire/types.hpp"

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

/// @brief Defines internal interface of the registry of pending requests.
///
class IRequestRegistry
{
public:
    IRequestRegistry(const IRequestRegistry&)                = delete;
    IRequestRegistry(IRequestRegistry&&) noexcept            = delete;
    IRequestRegistry& operator=(const IRequestRegistry&)     = delete;
    IRequestRegistry& operator=(IRequestRegistry&&) noexcept = delete;

    /// @brief Removes a pending request (whatever its state is).
    ///
    /// Late messages of the removed exchange become unsolicited ones.
    ///
    /// @return `true` if the request was still registered.
    ///
    virtual bool releaseRequest(const ExchangeKey& key) noexcept = 0;

protected:
    IRequestRegistry()  = default;
    ~IRequestRegistry() = default;

};  // IRequestRegistry

}  // namespace detail

/// @brief Defines a handle of a sent request - the only way to get its response.
///
/// The handle is move-only. Destruction (or explicit `cancel`) of a handle deregisters the pending request,
/// so a handle must not outlive its session.
///
/// No Sonar cpp:S4963 "The "Rule-of-Zero" should be followed"
/// b/c we do directly handle resources here.
///
class RequestHandle final  // NOSONAR cpp:S4963
{
public:
    RequestHandle(detail::IRequestRegistry& registry, const ExchangeKey key, const TimePoint deadline) noexcept
        : registry_{&registry}
        , key_{key}
        , deadline_{deadline}
        , is_cancelled_{false}
    {
    }

    RequestHandle(RequestHandle&& other) noexcept
        : registry_{std::exchange(other.registry_, nullptr)}
        , key_{other.key_}
        , deadline_{other.deadline_}
        , is_cancelled_{other.is_cancelled_}
    {
    }

    RequestHandle(const RequestHandle&)                = delete;
    RequestHandle& operator=(const RequestHandle&)     = delete;
    RequestHandle& operator=(RequestHandle&&) noexcept = delete;

    ~RequestHandle()
    {
        if ((registry_ != nullptr) && !is_cancelled_)
        {
            (void) registry_->releaseRequest(key_);
        }
    }

    const ExchangeKey& getKey() const noexcept
    {
        return key_;
    }

    TimePoint getDeadline() const noexcept
    {
        return deadline_;
    }

    /// @brief Gets the registry (session) which issued this handle.
    ///
    /// `nullptr` for a moved-from handle.
    ///
    const detail::IRequestRegistry* getRegistry() const noexcept
    {
        return registry_;
    }

    bool isCancelled() const noexcept
    {
        return is_cancelled_;
    }

    /// @brief Cancels the request - it is not awaited anymore.
    ///
    /// Any further awaiting of the handle fails with `CancelledError`.
    ///
    void cancel() noexcept
    {
        if ((registry_ != nullptr) && !is_cancelled_)
        {
            is_cancelled_ = true;
            (void) registry_->releaseRequest(key_);
        }
    }

private:
    // MARK: Data members:

    detail::IRequestRegistry* registry_;
    ExchangeKey               key_;
    TimePoint                 deadline_;
    bool                      is_cancelled_;

};  // RequestHandle

}  // namespace session
}  // namespace libnlwire

#endif  // LIBNLWIRE_SESSION_REQUEST_HANDLE_HPP_INCLUDED
