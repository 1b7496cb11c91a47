/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_SESSION_REASSEMBLER_HPP_INCLUDED
#define LIBNLWIRE_SESSION_REASSEMBLER_HPP_INCLUDED

#include "errors.hpp"
#include "types.hpp"

#include "libnlwire/types.hpp"
#include "libnlwire/wire/control_codec.hpp"
#include "libnlwire/wire/defines.hpp"
#include "libnlwire/wire/errors.hpp"
#include "libnlwire/wire/message.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>

namespace libnlwire
{
namespace session
{

/// @brief Defines the multipart reassembly state machine of a single exchange.
///
/// Consumes messages of one exchange (in their arrival order), and yields the terminal outcome:
/// - a single data message completes the exchange immediately;
/// - data messages with the `Flags::Multi` flag are collected until the DONE message;
/// - an ERROR message with non-zero code (or a DONE with negative status) fails the exchange,
///   and the collected messages are dropped (their number is reported as a diagnostic);
/// - an ERROR message with zero code is an acknowledgement, and it completes the exchange successfully;
/// - an OVERRUN message fails the exchange; NOOP messages are ignored.
///
/// The reassembler is pure - it has no notion of time nor of the transport.
///
class Reassembler final
{
public:
    enum class State : std::uint8_t
    {
        Idle,
        Collecting,
        Done,
        Errored,
    };

    using Outcome = Expected<ExchangeResult, ExchangeFailure>;

    /// @brief Constructs a new reassembler.
    ///
    /// @param memory Memory resource for the collected messages.
    /// @param expects_ack Whether the request was sent with the `Flags::Ack` flag. If so, a single
    ///                    (non multipart) data reply is held until the acknowledgement arrives.
    ///
    Reassembler(cetl::pmr::memory_resource& memory, const bool expects_ack)
        : memory_{memory}
        , expects_ack_{expects_ack}
        , state_{State::Idle}
        , collected_{wire::MessageList::allocator_type{&memory}}
    {
    }

    State state() const noexcept
    {
        return state_;
    }

    bool isTerminal() const noexcept
    {
        return (state_ == State::Done) || (state_ == State::Errored);
    }

    /// @brief Gets number of messages collected so far (including a data message held until the ack).
    ///
    std::size_t collectedCount() const noexcept
    {
        return collected_.size() + (held_ ? 1U : 0U);
    }

    /// @brief Accepts the next message of the exchange.
    ///
    /// @return The terminal outcome if the message has completed the exchange, otherwise `nullopt`.
    ///
    CETL_NODISCARD cetl::optional<Outcome> accept(wire::Message message)
    {
        CETL_DEBUG_ASSERT(!isTerminal(), "Terminated exchange can't accept more messages.");
        if (isTerminal())
        {
            return cetl::nullopt;
        }

        switch (message.header.type)
        {
        case wire::ControlType::Noop:
            return cetl::nullopt;

        case wire::ControlType::Overrun:
            return fail(OverrunError{collectedCount()});

        case wire::ControlType::Error:
            return acceptError(std::move(message));

        case wire::ControlType::Done:
            return acceptDone(std::move(message));

        default:
            return acceptData(std::move(message));
        }
    }

private:
    cetl::optional<Outcome> acceptData(wire::Message&& message)
    {
        if (held_)
        {
            // More than one data reply while waiting for the ack - all of them are collected.
            collected_.push_back(std::move(*held_));
            held_.reset();
        }

        const bool is_multi = message.header.hasFlags(wire::Flags::Multi);
        if (is_multi || !collected_.empty())
        {
            state_ = State::Collecting;
            collected_.push_back(std::move(message));
            if (is_multi || expects_ack_)
            {
                return cetl::nullopt;
            }
            // A part without the MULTI flag is the last one of a multipart reply.
            return succeed(Multi{std::move(collected_)});
        }

        if (expects_ack_)
        {
            state_ = State::Collecting;
            held_.emplace(std::move(message));
            return cetl::nullopt;
        }
        return succeed(Single{std::move(message)});
    }

    cetl::optional<Outcome> acceptError(wire::Message&& message)
    {
        auto payload_result = wire::decodeErrorPayload(message, memory_);
        if (auto* const failure = cetl::get_if<wire::DecodeFailure>(&payload_result))
        {
            return fail(libnlwire::detail::upcastVariant<ExchangeFailure>(std::move(*failure)));
        }
        auto& payload = cetl::get<wire::ControlPayload>(payload_result);

        if (payload.code != 0)
        {
            return fail(KernelError{payload.code,
                                    payload.request,
                                    std::move(payload.message),
                                    payload.offset,
                                    collectedCount()});
        }

        // Acknowledgement.
        if (held_)
        {
            wire::Message held = std::move(*held_);
            held_.reset();
            return succeed(Single{std::move(held)});
        }
        if (!collected_.empty())
        {
            return succeed(Multi{std::move(collected_)});
        }
        return succeed(Single{std::move(message)});
    }

    cetl::optional<Outcome> acceptDone(wire::Message&& message)
    {
        auto payload_result = wire::decodeDonePayload(message, memory_);
        if (auto* const failure = cetl::get_if<wire::DecodeFailure>(&payload_result))
        {
            return fail(libnlwire::detail::upcastVariant<ExchangeFailure>(std::move(*failure)));
        }
        auto& payload = cetl::get<wire::ControlPayload>(payload_result);

        if (payload.code < 0)
        {
            return fail(KernelError{payload.code,
                                    cetl::nullopt,
                                    std::move(payload.message),
                                    payload.offset,
                                    collectedCount()});
        }

        // The DONE message itself is never part of the result.
        if (held_)
        {
            collected_.push_back(std::move(*held_));
            held_.reset();
        }
        return succeed(Multi{std::move(collected_)});
    }

    cetl::optional<Outcome> succeed(ExchangeResult&& result)
    {
        state_ = State::Done;
        return Outcome{std::move(result)};
    }

    template <typename Failure>
    cetl::optional<Outcome> fail(Failure&& failure)
    {
        state_ = State::Errored;
        collected_.clear();
        held_.reset();
        return Outcome{ExchangeFailure{std::forward<Failure>(failure)}};
    }

    // MARK: Data members:

    cetl::pmr::memory_resource&   memory_;
    const bool                    expects_ack_;
    State                         state_;
    wire::MessageList             collected_;
    cetl::optional<wire::Message> held_;

};  // Reassembler

}  // namespace session
}  // namespace libnlwire

#endif  // LIBNLWIRE_SESSION_REASSEMBLER_HPP_INCLUDED
