/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_SESSION_ERRORS_HPP_INCLUDED
#define LIBNLWIRE_SESSION_ERRORS_HPP_INCLUDED

#include "libnlwire/errors.hpp"
#include "libnlwire/types.hpp"
#include "libnlwire/wire/errors.hpp"
#include "libnlwire/wire/header_codec.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>

namespace libnlwire
{
namespace session
{

/// @brief Defines terminal error of an exchange which was reported by the kernel.
///
/// Either an ERROR control message with a non-zero code, or a DONE one with a negative status (failed dump).
///
struct KernelError final
{
    /// Negative `errno` value (f.e. `-ENOENT`).
    std::int32_t code;

    /// Header of the offending request, as echoed by the kernel (absent for a failed dump).
    cetl::optional<wire::Header> request;

    /// Extended acknowledgement error message (if any).
    cetl::optional<PmrString> message;

    /// Extended acknowledgement offset of the invalid attribute within the request (if any).
    cetl::optional<std::uint32_t> offset;

    /// Number of already collected (multipart) messages which were dropped b/c of the error.
    /// Diagnostic only - partial results are never delivered as a success.
    std::size_t discarded_count;
};

/// @brief Defines terminal error of an exchange which was interrupted by an OVERRUN control message.
///
/// The kernel has dropped some data (f.e. b/c of a full receive buffer), so the exchange can't be trusted.
///
struct OverrunError final
{
    std::size_t discarded_count;
};

/// @brief Defines terminal 'expired' error of an exchange.
///
/// See `deadline` parameter of the `Session::sendRequest` method.
///
struct ResponseExpiredError final
{
    /// Holds deadline of the expired (aka timed out) response waiting.
    TimePoint deadline;
};

/// @brief Defines terminal error of an exchange which was cancelled by the requester.
///
struct CancelledError final
{};

/// @brief Defines terminal failure of a single exchange as seen by the multipart reassembler.
///
using ExchangeFailure = libnlwire::detail::AppendType<  //
    wire::DecodeFailure,
    KernelError,
    OverrunError>::Result;

/// @brief Defines failure of sending a request.
///
using SendFailure = libnlwire::detail::AppendType<  //
    wire::EncodeFailure,
    IoError>::Result;

/// @brief Defines failure of awaiting a response.
///
/// In addition to the exchange failures, it includes transport failures, expiration,
/// cancellation, and misuse of the request handle (`ArgumentError`).
///
using AwaitFailure = libnlwire::detail::AppendType<  //
    ExchangeFailure,
    IoError,
    ResponseExpiredError,
    CancelledError,
    ArgumentError>::Result;

/// @brief Defines any possible failure of a complete request/response exchange.
///
using AnyFailure = libnlwire::detail::AppendType<  //
    AwaitFailure,
    wire::BufferFullError>::Result;

}  // namespace session
}  // namespace libnlwire

#endif  // LIBNLWIRE_SESSION_ERRORS_HPP_INCLUDED
